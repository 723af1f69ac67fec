#include "sudoku/app/AssetFS.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace sudoku::app {

namespace {

void PushIfExists(std::vector<std::filesystem::path>& roots, const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return;
    }
    if (std::find(roots.begin(), roots.end(), path) == roots.end()) {
        roots.push_back(path);
    }
}

// Walks up from `start` collecting every `assets` directory on the way.
void HarvestAssetDirs(std::vector<std::filesystem::path>& roots,
                      const std::filesystem::path& start,
                      int max_depth) {
    if (start.empty()) {
        return;
    }
    std::filesystem::path cursor = start;
    for (int depth = 0; depth < max_depth && !cursor.empty(); ++depth) {
        PushIfExists(roots, cursor / "assets");
        if (cursor == cursor.parent_path()) {
            break;
        }
        cursor = cursor.parent_path();
    }
}

}  // namespace

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

const std::vector<std::filesystem::path>& AssetRoots() {
    static std::vector<std::filesystem::path> roots;
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (const char* env = std::getenv("SUDOKU_ASSETS")) {
            PushIfExists(roots, std::filesystem::path(env));
        }

        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            HarvestAssetDirs(roots, cwd, 4);
        }

        if (char* raw_base = SDL_GetBasePath()) {
            std::filesystem::path base_path(raw_base);
            SDL_free(raw_base);
            HarvestAssetDirs(roots, base_path, 4);
        }

        if (roots.empty()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "No assets directory found; set SUDOKU_ASSETS to point at one");
        }
    });
    return roots;
}

std::filesystem::path AssetPath(const std::string& filename) {
    for (const auto& root : AssetRoots()) {
        std::filesystem::path candidate = root / filename;
        if (FileExists(candidate)) {
            return candidate;
        }
    }
    return std::filesystem::path(filename);
}

}  // namespace sudoku::app
