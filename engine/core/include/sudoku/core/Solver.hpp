#pragma once

#include <optional>

#include "sudoku/core/Board.hpp"

namespace sudoku::core {

// Counts solutions of the board's current values, stopping once `limit` is reached.
// Boards whose values already conflict have no solution.
int CountSolutions(const Board& board, int limit = 2);

bool HasUniqueSolution(const Board& board);

// Returns the first solution found; fixed flags and notes are carried over unchanged.
std::optional<Board> Solve(const Board& board);

}  // namespace sudoku::core
