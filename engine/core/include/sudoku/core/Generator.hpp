#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>

#include "sudoku/core/Board.hpp"
#include "sudoku/core/Difficulty.hpp"

namespace sudoku::core {

class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GeneratorSettings {
    int clue_count = kDefaultClues[0];
    // Keep removing only while the puzzle stays uniquely solvable.
    bool unique_solution = true;
    int max_attempts = 200;
    // Search nodes one backtracking fill may visit before the attempt is abandoned.
    int fill_node_budget = 20000;
};

struct Puzzle {
    Board board;
    Board solution;
    int attempts = 0;
};

// Fills a complete valid grid. Returns nullopt when the node budget runs out.
std::optional<Board> FillSolvedGrid(std::mt19937& rng, int node_budget);

// Throws GenerationError once max_attempts attempts have failed.
Puzzle GeneratePuzzle(const GeneratorSettings& settings, std::mt19937& rng);
Puzzle GeneratePuzzle(Difficulty difficulty, std::uint32_t seed);

}  // namespace sudoku::core
