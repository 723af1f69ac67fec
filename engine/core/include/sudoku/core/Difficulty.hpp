#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace sudoku::core {

enum class Difficulty { Easy, Medium, Hard, Expert };

inline constexpr std::array<Difficulty, 4> kDifficulties{
    {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard, Difficulty::Expert}};

inline constexpr int kMinClues = 17;
inline constexpr int kMaxClues = 80;

constexpr std::size_t DifficultyIndex(Difficulty difficulty) noexcept {
    return static_cast<std::size_t>(difficulty);
}

// Clue counts per difficulty, indexed by DifficultyIndex().
using ClueTable = std::array<int, kDifficulties.size()>;

inline constexpr ClueTable kDefaultClues{{30, 28, 26, 24}};

const char* ToString(Difficulty difficulty) noexcept;
std::optional<Difficulty> ParseDifficulty(const std::string& name);

int DefaultClueCount(Difficulty difficulty) noexcept;

}  // namespace sudoku::core
