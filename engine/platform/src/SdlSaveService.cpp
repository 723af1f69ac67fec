#include "sudoku/platform/SdlSaveService.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace sudoku::platform {

namespace {

std::filesystem::path DefaultSaveRoot() {
    std::filesystem::path base;
    if (char* pref = SDL_GetPrefPath("Sudoku", "Sudoku")) {
        base = pref;
        SDL_free(pref);
    }
    if (base.empty()) {
        base = std::filesystem::current_path() / "saves";
    }
    return base;
}

std::filesystem::path NormalizeFilename(const std::string& name) {
    std::filesystem::path path{name};
    return path.filename();
}

}  // namespace

SdlSaveService::SdlSaveService(std::filesystem::path root)
    : root_(root.empty() ? DefaultSaveRoot() : std::move(root)) {}

bool SdlSaveService::Initialize() {
    if (!EnsureRootExists()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot create save directory %s",
                     root_.string().c_str());
        return false;
    }
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Save directory: %s", root_.string().c_str());
    return true;
}

bool SdlSaveService::EnsureRootExists() const {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        return true;
    }
    return std::filesystem::create_directories(root_, ec);
}

std::filesystem::path SdlSaveService::ResolvePath(const std::string& name) const {
    return root_ / NormalizeFilename(name);
}

bool SdlSaveService::Write(const std::string& name, const std::vector<std::uint8_t>& payload) {
    if (!EnsureRootExists()) {
        return false;
    }
    // Written to a sibling file, then renamed over the target.
    const std::filesystem::path path = ResolvePath(name);
    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
        out.write(reinterpret_cast<const char*>(payload.data()),
                  static_cast<std::streamsize>(payload.size()));
        if (!out.good()) {
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to replace %s: %s",
                    path.string().c_str(), ec.message().c_str());
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

bool SdlSaveService::Read(const std::string& name, std::vector<std::uint8_t>& out_payload) const {
    const std::filesystem::path path = ResolvePath(name);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    in.seekg(0, std::ios::end);
    std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size < 0) {
        return false;
    }
    out_payload.resize(static_cast<std::size_t>(size));
    if (size > 0) {
        in.read(reinterpret_cast<char*>(out_payload.data()), size);
    }
    return in.good();
}

bool SdlSaveService::Remove(const std::string& name) {
    std::error_code ec;
    return std::filesystem::remove(ResolvePath(name), ec);
}

bool SdlSaveService::Exists(const std::string& name) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(ResolvePath(name), ec);
}

}  // namespace sudoku::platform
