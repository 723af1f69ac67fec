#include "sudoku/core/Board.hpp"

#include <algorithm>
#include <array>

namespace sudoku::core {

namespace {

bool ValueRepeatsInUnits(const Board& board, int row, int col, int value) {
    for (int c = 0; c < kGridSize; ++c) {
        if (c != col && board.get(row, c) == value) {
            return true;
        }
    }
    for (int r = 0; r < kGridSize; ++r) {
        if (r != row && board.get(r, col) == value) {
            return true;
        }
    }
    const int start_row = row - row % kBoxSize;
    const int start_col = col - col % kBoxSize;
    for (int r = start_row; r < start_row + kBoxSize; ++r) {
        for (int c = start_col; c < start_col + kBoxSize; ++c) {
            if ((r != row || c != col) && board.get(r, c) == value) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

bool Board::hasNote(int row, int col, int digit) const noexcept {
    if (!IsDigit(digit)) {
        return false;
    }
    return (notes(row, col) & NoteBit(digit)) != 0;
}

int Board::filledCount() const noexcept {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(), [](const Cell& cell) {
        return cell.value != kEmptyValue;
    }));
}

int Board::clueCount() const noexcept {
    return static_cast<int>(
        std::count_if(cells_.begin(), cells_.end(), [](const Cell& cell) { return cell.fixed; }));
}

void Board::lockClues() noexcept {
    for (auto& cell : cells_) {
        cell.fixed = cell.value != kEmptyValue;
        cell.notes = 0;
    }
}

void Board::clear() noexcept {
    cells_.fill(Cell{});
}

bool Validate(const Board& board, int row, int col, int value) {
    if (!board.inBounds(row, col) || !IsDigit(value)) {
        return false;
    }
    return !ValueRepeatsInUnits(board, row, col, value);
}

bool HasConflictAt(const Board& board, int row, int col) {
    if (!board.inBounds(row, col)) {
        return false;
    }
    const int value = board.get(row, col);
    if (value == kEmptyValue) {
        return false;
    }
    return ValueRepeatsInUnits(board, row, col, value);
}

std::vector<Position> FindConflicts(const Board& board) {
    std::vector<Position> conflicts;
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            if (HasConflictAt(board, row, col)) {
                conflicts.push_back(Position{row, col});
            }
        }
    }
    return conflicts;
}

bool IsComplete(const Board& board) {
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            if (board.get(row, col) == kEmptyValue || HasConflictAt(board, row, col)) {
                return false;
            }
        }
    }
    return true;
}

std::vector<Position> Peers(const Position& pos) {
    std::vector<Position> peers;
    peers.reserve(20);
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            const Position other{row, col};
            if (other != pos && SharesUnit(pos, other)) {
                peers.push_back(other);
            }
        }
    }
    return peers;
}

NoteMask CompletedDigits(const Board& board) {
    std::array<int, kGridSize + 1> counts{};
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            const int value = board.get(row, col);
            if (value != kEmptyValue && !HasConflictAt(board, row, col)) {
                ++counts[static_cast<std::size_t>(value)];
            }
        }
    }
    NoteMask mask = 0;
    for (int digit = 1; digit <= kGridSize; ++digit) {
        if (counts[static_cast<std::size_t>(digit)] == kGridSize) {
            mask |= NoteBit(digit);
        }
    }
    return mask;
}

std::string ToString(const Board& board) {
    std::string text;
    text.reserve(kCellCount);
    for (const auto& cell : board.cells()) {
        text.push_back(static_cast<char>('0' + cell.value));
    }
    return text;
}

std::optional<Board> ParseBoard(const std::string& text, bool mark_fixed) {
    Board board;
    int index = 0;
    for (char ch : text) {
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
            continue;
        }
        if (index >= kCellCount) {
            return std::nullopt;
        }
        int value = kEmptyValue;
        if (ch >= '1' && ch <= '9') {
            value = ch - '0';
        } else if (ch != '0' && ch != '.') {
            return std::nullopt;
        }
        board.set(index / kGridSize, index % kGridSize, value);
        ++index;
    }
    if (index != kCellCount) {
        return std::nullopt;
    }
    if (mark_fixed) {
        board.lockClues();
    }
    return board;
}

}  // namespace sudoku::core
