#pragma once

#include <map>
#include <string>
#include <vector>

#include "sudoku/core/Storage.hpp"

namespace sudoku::test {

// Storage kept in a map; writes can be made to fail.
class MemoryStorage : public core::Storage {
public:
    bool Write(const std::string& name, const std::vector<std::uint8_t>& payload) override {
        if (fail_writes) {
            return false;
        }
        ++writes;
        blobs[name] = payload;
        return true;
    }

    bool Read(const std::string& name, std::vector<std::uint8_t>& out_payload) const override {
        auto it = blobs.find(name);
        if (it == blobs.end()) {
            return false;
        }
        out_payload = it->second;
        return true;
    }

    bool Remove(const std::string& name) override { return blobs.erase(name) > 0; }

    bool Exists(const std::string& name) const override { return blobs.count(name) != 0; }

    void putText(const std::string& name, const std::string& text) {
        blobs[name] = std::vector<std::uint8_t>(text.begin(), text.end());
    }

    std::map<std::string, std::vector<std::uint8_t>> blobs;
    bool fail_writes = false;
    int writes = 0;
};

}  // namespace sudoku::test
