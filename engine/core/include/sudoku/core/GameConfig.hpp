#pragma once

#include <array>
#include <string>

#include "sudoku/core/Difficulty.hpp"
#include "sudoku/core/Json.hpp"

namespace sudoku::core {

constexpr int kMaxWindowSide = 16384;

struct GameConfig {
    std::string language = "eng_EN";
    std::array<int, 2> window_size{{800, 600}};
    bool sound_on = true;
    bool unique_solution = true;
    int max_attempts = 200;
    bool auto_clear_notes = true;
    ClueTable clues = kDefaultClues;

    int clueCount(Difficulty difficulty) const noexcept { return clues[DifficultyIndex(difficulty)]; }

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace sudoku::core
