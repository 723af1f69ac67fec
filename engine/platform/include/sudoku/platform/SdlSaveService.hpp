#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "sudoku/core/Storage.hpp"

namespace sudoku::platform {

// Files under the per-user preference directory (or an explicit root).
class SdlSaveService : public core::Storage {
public:
    explicit SdlSaveService(std::filesystem::path root);

    bool Initialize();

    bool Write(const std::string& name, const std::vector<std::uint8_t>& payload) override;
    bool Read(const std::string& name, std::vector<std::uint8_t>& out_payload) const override;
    bool Remove(const std::string& name) override;
    bool Exists(const std::string& name) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path ResolvePath(const std::string& name) const;
    bool EnsureRootExists() const;

    std::filesystem::path root_;
};

}  // namespace sudoku::platform
