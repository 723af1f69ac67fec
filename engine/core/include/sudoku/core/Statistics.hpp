#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "sudoku/core/Difficulty.hpp"
#include "sudoku/core/Json.hpp"

namespace sudoku::core {

struct DifficultyStats {
    int games = 0;
    std::uint64_t best_ms = 0;
    std::uint64_t total_ms = 0;

    bool hasBest() const noexcept { return games > 0; }
    std::uint64_t averageMs() const noexcept;
};

class Statistics {
public:
    const DifficultyStats& get(Difficulty difficulty) const noexcept {
        return entries_[DifficultyIndex(difficulty)];
    }

    // Returns true when time_ms beats the previous best (the first game always does).
    bool record(Difficulty difficulty, std::uint64_t time_ms);
    void reset() noexcept;

    Json ToJson() const;
    static Statistics FromJson(const Json& json);

    std::string Serialize() const;
    static Statistics Deserialize(const std::string& json_string);

    bool operator==(const Statistics& other) const noexcept;

private:
    std::array<DifficultyStats, kDifficulties.size()> entries_{};
};

}  // namespace sudoku::core
