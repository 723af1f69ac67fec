#include "sudoku/core/Difficulty.hpp"

namespace sudoku::core {

const char* ToString(Difficulty difficulty) noexcept {
    switch (difficulty) {
        case Difficulty::Easy:
            return "easy";
        case Difficulty::Medium:
            return "medium";
        case Difficulty::Hard:
            return "hard";
        case Difficulty::Expert:
            return "expert";
    }
    return "easy";
}

std::optional<Difficulty> ParseDifficulty(const std::string& name) {
    for (Difficulty difficulty : kDifficulties) {
        if (name == ToString(difficulty)) {
            return difficulty;
        }
    }
    return std::nullopt;
}

int DefaultClueCount(Difficulty difficulty) noexcept {
    return kDefaultClues[DifficultyIndex(difficulty)];
}

}  // namespace sudoku::core
