#include "sudoku/core/ProfileStore.hpp"

#include <exception>
#include <vector>

namespace sudoku::core {

bool ProfileStore::readText(const char* name, std::string& out) const {
    std::vector<std::uint8_t> bytes;
    if (!storage_.Read(name, bytes)) {
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

bool ProfileStore::writeText(const char* name, const std::string& text) {
    std::vector<std::uint8_t> bytes(text.begin(), text.end());
    if (!storage_.Write(name, bytes)) {
        last_error_ = std::string("cannot write ") + name;
        return false;
    }
    return true;
}

Statistics ProfileStore::loadStatistics() const {
    last_error_.clear();
    std::string text;
    if (!storage_.Exists(kStatisticsFile) || !readText(kStatisticsFile, text)) {
        return Statistics{};
    }
    try {
        return Statistics::Deserialize(text);
    } catch (const std::exception& ex) {
        last_error_ = std::string("corrupt statistics: ") + ex.what();
        return Statistics{};
    }
}

bool ProfileStore::saveStatistics(const Statistics& stats) {
    last_error_.clear();
    return writeText(kStatisticsFile, stats.Serialize());
}

std::optional<SavedGame> ProfileStore::loadSavedGame() const {
    last_error_.clear();
    std::vector<std::uint8_t> bytes;
    if (!storage_.Exists(kSavedGameFile) || !storage_.Read(kSavedGameFile, bytes)) {
        return std::nullopt;
    }
    try {
        return SavedGame::DeserializeBinary(bytes);
    } catch (const std::exception& ex) {
        last_error_ = std::string("corrupt saved game: ") + ex.what();
        return std::nullopt;
    }
}

bool ProfileStore::hasSavedGame() const {
    return storage_.Exists(kSavedGameFile);
}

bool ProfileStore::storeSavedGame(const SavedGame& game) {
    last_error_.clear();
    if (!storage_.Write(kSavedGameFile, game.SerializeBinary())) {
        last_error_ = std::string("cannot write ") + kSavedGameFile;
        return false;
    }
    return true;
}

bool ProfileStore::clearSavedGame() {
    last_error_.clear();
    if (!storage_.Exists(kSavedGameFile)) {
        return true;
    }
    if (!storage_.Remove(kSavedGameFile)) {
        last_error_ = std::string("cannot remove ") + kSavedGameFile;
        return false;
    }
    return true;
}

GameConfig ProfileStore::loadConfig() const {
    last_error_.clear();
    std::string text;
    if (!storage_.Exists(kConfigFile) || !readText(kConfigFile, text)) {
        return GameConfig{};
    }
    try {
        return GameConfig::Deserialize(text);
    } catch (const std::exception& ex) {
        last_error_ = std::string("corrupt config: ") + ex.what();
        return GameConfig{};
    }
}

bool ProfileStore::saveConfig(const GameConfig& config) {
    last_error_.clear();
    return writeText(kConfigFile, config.Serialize());
}

}  // namespace sudoku::core
