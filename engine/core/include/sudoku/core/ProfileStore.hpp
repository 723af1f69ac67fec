#pragma once

#include <optional>
#include <string>

#include "sudoku/core/GameConfig.hpp"
#include "sudoku/core/SavedGame.hpp"
#include "sudoku/core/Statistics.hpp"
#include "sudoku/core/Storage.hpp"

namespace sudoku::core {

inline constexpr const char* kStatisticsFile = "statistics.json";
inline constexpr const char* kSavedGameFile = "savegame.bin";
inline constexpr const char* kConfigFile = "config.json";

// Player data on top of a Storage. Missing or unreadable data loads as defaults;
// the reason is left in lastError() for the caller to log.
class ProfileStore {
public:
    explicit ProfileStore(Storage& storage) : storage_(storage) {}

    Statistics loadStatistics() const;
    bool saveStatistics(const Statistics& stats);

    std::optional<SavedGame> loadSavedGame() const;
    bool hasSavedGame() const;
    bool storeSavedGame(const SavedGame& game);
    bool clearSavedGame();

    GameConfig loadConfig() const;
    bool saveConfig(const GameConfig& config);

    const std::string& lastError() const noexcept { return last_error_; }

private:
    bool readText(const char* name, std::string& out) const;
    bool writeText(const char* name, const std::string& text);

    Storage& storage_;
    mutable std::string last_error_;
};

}  // namespace sudoku::core
