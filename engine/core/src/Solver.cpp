#include "sudoku/core/Solver.hpp"

#include <array>
#include <bitset>

namespace sudoku::core {

namespace {

class Search {
public:
    explicit Search(const Board& board) {
        for (int row = 0; row < kGridSize; ++row) {
            for (int col = 0; col < kGridSize; ++col) {
                const int value = board.get(row, col);
                if (value == kEmptyValue) {
                    continue;
                }
                if (!allowed(row, col, value)) {
                    consistent_ = false;
                }
                assign(row, col, value);
            }
        }
    }

    int count(int limit) {
        if (!consistent_) {
            return 0;
        }
        limit_ = limit;
        found_ = 0;
        recurse();
        return found_;
    }

    bool solveInto(Board& board) {
        if (!consistent_) {
            return false;
        }
        limit_ = 1;
        found_ = 0;
        recurse();
        if (found_ == 0) {
            return false;
        }
        for (int i = 0; i < kCellCount; ++i) {
            board.set(i / kGridSize, i % kGridSize, solution_[static_cast<std::size_t>(i)]);
        }
        return true;
    }

private:
    bool allowed(int row, int col, int value) const noexcept {
        const NoteMask bit = NoteBit(value);
        return !(rows_[row] & bit) && !(cols_[col] & bit) && !(boxes_[BoxIndex(row, col)] & bit);
    }

    NoteMask candidates(int row, int col) const noexcept {
        const NoteMask used = rows_[row] | cols_[col] | boxes_[BoxIndex(row, col)];
        return static_cast<NoteMask>(~used & kAllNotes);
    }

    void assign(int row, int col, int value) noexcept {
        const NoteMask bit = NoteBit(value);
        grid_[static_cast<std::size_t>(row * kGridSize + col)] = value;
        rows_[row] |= bit;
        cols_[col] |= bit;
        boxes_[BoxIndex(row, col)] |= bit;
    }

    void unassign(int row, int col, int value) noexcept {
        const NoteMask bit = static_cast<NoteMask>(~NoteBit(value));
        grid_[static_cast<std::size_t>(row * kGridSize + col)] = kEmptyValue;
        rows_[row] &= bit;
        cols_[col] &= bit;
        boxes_[BoxIndex(row, col)] &= bit;
    }

    void recurse() {
        // Branch on the empty cell with the fewest candidates.
        int best = -1;
        std::size_t best_count = kGridSize + 1;
        NoteMask best_mask = 0;
        for (int i = 0; i < kCellCount; ++i) {
            if (grid_[static_cast<std::size_t>(i)] != kEmptyValue) {
                continue;
            }
            const NoteMask mask = candidates(i / kGridSize, i % kGridSize);
            const std::size_t count = std::bitset<kGridSize>(mask).count();
            if (count < best_count) {
                best = i;
                best_count = count;
                best_mask = mask;
                if (count <= 1) {
                    break;
                }
            }
        }

        if (best < 0) {
            ++found_;
            if (found_ == 1) {
                solution_ = grid_;
            }
            return;
        }
        if (best_count == 0) {
            return;
        }

        const int row = best / kGridSize;
        const int col = best % kGridSize;
        for (int digit = 1; digit <= kGridSize; ++digit) {
            if (!(best_mask & NoteBit(digit))) {
                continue;
            }
            assign(row, col, digit);
            recurse();
            unassign(row, col, digit);
            if (found_ >= limit_) {
                return;
            }
        }
    }

    std::array<int, kCellCount> grid_{};
    std::array<int, kCellCount> solution_{};
    std::array<NoteMask, kGridSize> rows_{};
    std::array<NoteMask, kGridSize> cols_{};
    std::array<NoteMask, kGridSize> boxes_{};
    bool consistent_ = true;
    int limit_ = 2;
    int found_ = 0;
};

}  // namespace

int CountSolutions(const Board& board, int limit) {
    if (limit <= 0) {
        return 0;
    }
    Search search(board);
    return search.count(limit);
}

bool HasUniqueSolution(const Board& board) {
    return CountSolutions(board, 2) == 1;
}

std::optional<Board> Solve(const Board& board) {
    Board solved = board;
    Search search(board);
    if (!search.solveInto(solved)) {
        return std::nullopt;
    }
    return solved;
}

}  // namespace sudoku::core
