#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sudoku::core {

// Named blobs in durable storage.
class Storage {
public:
    virtual ~Storage() = default;

    virtual bool Write(const std::string& name, const std::vector<std::uint8_t>& payload) = 0;
    virtual bool Read(const std::string& name, std::vector<std::uint8_t>& out_payload) const = 0;
    virtual bool Remove(const std::string& name) = 0;
    virtual bool Exists(const std::string& name) const = 0;
};

}  // namespace sudoku::core
