#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sudoku/core/Board.hpp"
#include "sudoku/core/Difficulty.hpp"
#include "sudoku/core/Json.hpp"
#include "sudoku/core/Moves.hpp"

namespace sudoku::core {

// A game left through the menu, enough to continue it later.
struct SavedGame {
    static constexpr int kVersion = 1;

    int version = kVersion;
    Difficulty difficulty = Difficulty::Easy;
    std::uint64_t elapsed_ms = 0;
    bool notes_mode = false;
    Position selected{-1, -1};
    Board board;
    std::vector<Move> history;

    Json ToJson() const;
    // Throws std::runtime_error or nlohmann::json::exception on malformed input.
    static SavedGame FromJson(const Json& json);

    std::string Serialize() const;
    static SavedGame Deserialize(const std::string& json_string);

    std::vector<std::uint8_t> SerializeBinary() const;
    static SavedGame DeserializeBinary(const std::vector<std::uint8_t>& bytes);
};

}  // namespace sudoku::core
