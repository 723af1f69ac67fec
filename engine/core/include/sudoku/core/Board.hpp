#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "sudoku/core/Types.hpp"

namespace sudoku::core {

struct Cell {
    int value = kEmptyValue;
    bool fixed = false;
    NoteMask notes = 0;

    bool operator==(const Cell& other) const noexcept {
        return value == other.value && fixed == other.fixed && notes == other.notes;
    }

    bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }
};

class Board {
public:
    Board() = default;

    bool inBounds(int row, int col) const noexcept { return InGrid(row, col); }
    bool inBounds(const Position& pos) const noexcept { return InGrid(pos); }

    const Cell& cell(int row, int col) const noexcept { return cells_[index(row, col)]; }
    Cell& cell(int row, int col) noexcept { return cells_[index(row, col)]; }
    const Cell& cell(const Position& pos) const noexcept { return cell(pos.row, pos.col); }
    Cell& cell(const Position& pos) noexcept { return cell(pos.row, pos.col); }

    int get(int row, int col) const noexcept { return cell(row, col).value; }
    int get(const Position& pos) const noexcept { return get(pos.row, pos.col); }

    void set(int row, int col, int value) noexcept { cell(row, col).value = value; }
    void set(const Position& pos, int value) noexcept { set(pos.row, pos.col, value); }

    bool isFixed(int row, int col) const noexcept { return cell(row, col).fixed; }
    bool isFixed(const Position& pos) const noexcept { return isFixed(pos.row, pos.col); }

    NoteMask notes(int row, int col) const noexcept { return cell(row, col).notes; }
    bool hasNote(int row, int col, int digit) const noexcept;

    int filledCount() const noexcept;
    int clueCount() const noexcept;

    // Turns every non-empty cell into a clue and drops all notes.
    void lockClues() noexcept;
    void clear() noexcept;

    const std::array<Cell, kCellCount>& cells() const noexcept { return cells_; }

    bool operator==(const Board& other) const noexcept { return cells_ == other.cells_; }
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    static int index(int row, int col) noexcept { return row * kGridSize + col; }

    std::array<Cell, kCellCount> cells_{};
};

// True when `value` at (row, col) repeats no other value in its row, column or box.
bool Validate(const Board& board, int row, int col, int value);

bool HasConflictAt(const Board& board, int row, int col);
std::vector<Position> FindConflicts(const Board& board);

bool IsComplete(const Board& board);

std::vector<Position> Peers(const Position& pos);

// Digits present nine times without any conflict, as a note-style mask.
NoteMask CompletedDigits(const Board& board);

std::string ToString(const Board& board);
std::optional<Board> ParseBoard(const std::string& text, bool mark_fixed = true);

}  // namespace sudoku::core
