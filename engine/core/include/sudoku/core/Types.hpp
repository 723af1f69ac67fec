#pragma once

#include <cstdint>

namespace sudoku::core {

inline constexpr int kGridSize = 9;
inline constexpr int kBoxSize = 3;
inline constexpr int kCellCount = kGridSize * kGridSize;
inline constexpr int kEmptyValue = 0;

// Bit (d - 1) set means digit d is noted.
using NoteMask = std::uint16_t;
inline constexpr NoteMask kAllNotes = 0x1FF;

struct Position {
    std::int32_t row{};
    std::int32_t col{};

    constexpr bool operator==(const Position& other) const noexcept {
        return row == other.row && col == other.col;
    }

    constexpr bool operator!=(const Position& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Position& other) const noexcept {
        return row < other.row || (row == other.row && col < other.col);
    }
};

enum class Direction { Up, Down, Left, Right };

constexpr bool IsDigit(int value) noexcept {
    return value >= 1 && value <= kGridSize;
}

constexpr bool InGrid(int row, int col) noexcept {
    return row >= 0 && row < kGridSize && col >= 0 && col < kGridSize;
}

constexpr bool InGrid(const Position& pos) noexcept {
    return InGrid(pos.row, pos.col);
}

constexpr int BoxIndex(int row, int col) noexcept {
    return (row / kBoxSize) * kBoxSize + col / kBoxSize;
}

constexpr NoteMask NoteBit(int digit) noexcept {
    return static_cast<NoteMask>(1u << (digit - 1));
}

constexpr bool SharesUnit(const Position& a, const Position& b) noexcept {
    return a.row == b.row || a.col == b.col ||
           BoxIndex(a.row, a.col) == BoxIndex(b.row, b.col);
}

}  // namespace sudoku::core
