#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "sudoku/core/Board.hpp"

namespace sudoku::core {

enum class MoveStatus {
    Ok,
    OutOfRange,
    InvalidDigit,
    FixedCell,
    CellFilled,
    NothingToUndo,
    NotActive
};

const char* ToString(MoveStatus status) noexcept;

struct Move {
    Position position{};
    int prev_value = kEmptyValue;
    int new_value = kEmptyValue;
    NoteMask prev_notes = 0;
    NoteMask new_notes = 0;
    // Peers that lost the note for new_value when it was placed.
    std::vector<Position> cleared_peer_notes;
};

struct MoveResult {
    MoveStatus status = MoveStatus::Ok;
    Move move{};

    bool ok() const noexcept { return status == MoveStatus::Ok; }
};

class MoveHistory {
public:
    void push(Move move) { moves_.push_back(std::move(move)); }
    bool empty() const noexcept { return moves_.empty(); }
    std::size_t size() const noexcept { return moves_.size(); }
    void clear() noexcept { moves_.clear(); }

    const Move& back() const { return moves_.back(); }
    Move pop();

    const std::vector<Move>& moves() const noexcept { return moves_; }

private:
    std::vector<Move> moves_;
};

struct PlaceOptions {
    bool clear_peer_notes = true;
};

MoveResult Place(Board& board, int row, int col, int value, const PlaceOptions& options = {});
MoveResult Erase(Board& board, int row, int col);
MoveResult ToggleNote(Board& board, int row, int col, int digit);

// Reverts a move previously produced for this board. Moves touching a
// clue are refused with FixedCell and leave the board unchanged.
MoveStatus Revert(Board& board, const Move& move);

MoveResult Undo(Board& board, MoveHistory& history);

}  // namespace sudoku::core
