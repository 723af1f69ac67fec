#include <cassert>
#include <iostream>
#include <random>
#include <string>

#include "sudoku/core/Board.hpp"
#include "sudoku/core/Generator.hpp"
#include "sudoku/core/Solver.hpp"

using namespace sudoku::core;

namespace {

void TestFillSolvedGrid() {
    std::mt19937 rng(7);
    auto grid = FillSolvedGrid(rng, 20000);
    assert(grid.has_value());
    assert(IsComplete(*grid));
    assert(FindConflicts(*grid).empty());
}

void TestEasyPuzzle() {
    Puzzle puzzle = GeneratePuzzle(Difficulty::Easy, /*seed=*/1337);
    const Board& board = puzzle.board;
    assert(board.clueCount() == 30);
    assert(board.filledCount() == 30);
    assert(kCellCount - board.filledCount() == 51);
    assert(FindConflicts(board).empty());
    assert(HasUniqueSolution(board));
    assert(puzzle.attempts >= 1);

    // Every clue matches the solution it was cut from.
    assert(IsComplete(puzzle.solution));
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            if (board.isFixed(row, col)) {
                assert(board.get(row, col) == puzzle.solution.get(row, col));
            } else {
                assert(board.get(row, col) == kEmptyValue);
            }
        }
    }
    auto solved = Solve(board);
    assert(solved.has_value());
    assert(ToString(*solved) == ToString(puzzle.solution));
}

void TestEveryDifficultyHitsItsClueCount() {
    for (Difficulty difficulty : {Difficulty::Medium, Difficulty::Hard, Difficulty::Expert}) {
        Puzzle puzzle = GeneratePuzzle(difficulty, /*seed=*/42);
        assert(puzzle.board.clueCount() == DefaultClueCount(difficulty));
        assert(FindConflicts(puzzle.board).empty());
        assert(HasUniqueSolution(puzzle.board));
    }
}

void TestSameSeedSameBoard() {
    Puzzle a = GeneratePuzzle(Difficulty::Easy, /*seed=*/99);
    Puzzle b = GeneratePuzzle(Difficulty::Easy, /*seed=*/99);
    assert(a.board == b.board);
    Puzzle c = GeneratePuzzle(Difficulty::Easy, /*seed=*/100);
    assert(!(a.board == c.board));
}

void TestRelaxedUniqueness() {
    GeneratorSettings settings;
    settings.clue_count = 20;
    settings.unique_solution = false;
    std::mt19937 rng(5);
    Puzzle puzzle = GeneratePuzzle(settings, rng);
    assert(puzzle.board.clueCount() == 20);
    assert(FindConflicts(puzzle.board).empty());
    assert(CountSolutions(puzzle.board, 1) == 1);
}

void TestGenerationErrors() {
    std::mt19937 rng(3);
    GeneratorSettings settings;

    settings.clue_count = 10;
    bool threw = false;
    try {
        GeneratePuzzle(settings, rng);
    } catch (const GenerationError&) {
        threw = true;
    }
    assert(threw);

    settings.clue_count = kCellCount + 1;
    threw = false;
    try {
        GeneratePuzzle(settings, rng);
    } catch (const GenerationError&) {
        threw = true;
    }
    assert(threw);

    // A single greedy removal pass practically never gets down to 17 unique clues.
    settings.clue_count = kMinClues;
    settings.max_attempts = 1;
    threw = false;
    try {
        GeneratePuzzle(settings, rng);
    } catch (const GenerationError& ex) {
        threw = true;
        assert(std::string(ex.what()).find("17 clues") != std::string::npos);
    }
    assert(threw);
}

}  // namespace

int main() {
    TestFillSolvedGrid();
    TestEasyPuzzle();
    TestEveryDifficultyHitsItsClueCount();
    TestSameSeedSameBoard();
    TestRelaxedUniqueness();
    TestGenerationErrors();
    std::cout << "All generator tests passed.\n";
    return 0;
}
