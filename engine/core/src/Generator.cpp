#include "sudoku/core/Generator.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include <string>

#include "sudoku/core/Solver.hpp"

namespace sudoku::core {

namespace {

using Digits = std::array<int, kGridSize>;

Digits ShuffledDigits(std::mt19937& rng) {
    Digits digits{};
    std::iota(digits.begin(), digits.end(), 1);
    std::shuffle(digits.begin(), digits.end(), rng);
    return digits;
}

// The three boxes on the main diagonal share no row or column, so each can take
// any permutation of 1..9 independently.
void FillDiagonalBoxes(Board& board, std::mt19937& rng) {
    for (int box = 0; box < kGridSize; box += kBoxSize + 1) {
        const int start = (box / kBoxSize) * kBoxSize;
        const Digits digits = ShuffledDigits(rng);
        std::size_t next = 0;
        for (int row = start; row < start + kBoxSize; ++row) {
            for (int col = start; col < start + kBoxSize; ++col) {
                board.set(row, col, digits[next++]);
            }
        }
    }
}

class Filler {
public:
    Filler(Board& board, std::mt19937& rng, int node_budget)
        : board_(board), rng_(rng), budget_(node_budget) {}

    bool run() { return fill(0); }

private:
    bool fill(int index) {
        if (index == kCellCount) {
            return true;
        }
        const int row = index / kGridSize;
        const int col = index % kGridSize;
        if (board_.get(row, col) != kEmptyValue) {
            return fill(index + 1);
        }
        if (--budget_ < 0) {
            return false;
        }
        for (int digit : ShuffledDigits(rng_)) {
            if (!Validate(board_, row, col, digit)) {
                continue;
            }
            board_.set(row, col, digit);
            if (fill(index + 1)) {
                return true;
            }
            if (budget_ < 0) {
                break;
            }
        }
        board_.set(row, col, kEmptyValue);
        return false;
    }

    Board& board_;
    std::mt19937& rng_;
    int budget_;
};

std::array<int, kCellCount> ShuffledCells(std::mt19937& rng) {
    std::array<int, kCellCount> cells{};
    std::iota(cells.begin(), cells.end(), 0);
    std::shuffle(cells.begin(), cells.end(), rng);
    return cells;
}

bool RemoveCells(Board& board, const GeneratorSettings& settings, std::mt19937& rng) {
    int remaining = kCellCount;
    for (int index : ShuffledCells(rng)) {
        if (remaining <= settings.clue_count) {
            break;
        }
        const int row = index / kGridSize;
        const int col = index % kGridSize;
        const int value = board.get(row, col);
        board.set(row, col, kEmptyValue);
        if (settings.unique_solution && !HasUniqueSolution(board)) {
            board.set(row, col, value);
            continue;
        }
        --remaining;
    }
    return remaining == settings.clue_count;
}

}  // namespace

std::optional<Board> FillSolvedGrid(std::mt19937& rng, int node_budget) {
    Board board;
    FillDiagonalBoxes(board, rng);
    Filler filler(board, rng, node_budget);
    if (!filler.run()) {
        return std::nullopt;
    }
    return board;
}

Puzzle GeneratePuzzle(const GeneratorSettings& settings, std::mt19937& rng) {
    const int min_clues = settings.unique_solution ? kMinClues : 0;
    if (settings.clue_count < min_clues || settings.clue_count > kCellCount) {
        throw GenerationError("clue count " + std::to_string(settings.clue_count) +
                              " is out of range");
    }

    for (int attempt = 1; attempt <= settings.max_attempts; ++attempt) {
        std::mt19937 attempt_rng(rng());
        auto solved = FillSolvedGrid(attempt_rng, settings.fill_node_budget);
        if (!solved) {
            continue;
        }
        Board board = *solved;
        if (!RemoveCells(board, settings, attempt_rng)) {
            continue;
        }
        board.lockClues();
        Puzzle puzzle;
        puzzle.board = board;
        puzzle.solution = *solved;
        puzzle.solution.lockClues();
        puzzle.attempts = attempt;
        return puzzle;
    }
    throw GenerationError("no puzzle with " + std::to_string(settings.clue_count) +
                          " clues after " + std::to_string(settings.max_attempts) +
                          " attempts");
}

Puzzle GeneratePuzzle(Difficulty difficulty, std::uint32_t seed) {
    GeneratorSettings settings;
    settings.clue_count = DefaultClueCount(difficulty);
    std::mt19937 rng(seed);
    return GeneratePuzzle(settings, rng);
}

}  // namespace sudoku::core
