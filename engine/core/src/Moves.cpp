#include "sudoku/core/Moves.hpp"

#include <utility>

namespace sudoku::core {

namespace {

MoveResult Rejected(MoveStatus status) {
    MoveResult result;
    result.status = status;
    return result;
}

}  // namespace

const char* ToString(MoveStatus status) noexcept {
    switch (status) {
        case MoveStatus::Ok:
            return "ok";
        case MoveStatus::OutOfRange:
            return "out of range";
        case MoveStatus::InvalidDigit:
            return "invalid digit";
        case MoveStatus::FixedCell:
            return "fixed cell";
        case MoveStatus::CellFilled:
            return "cell filled";
        case MoveStatus::NothingToUndo:
            return "nothing to undo";
        case MoveStatus::NotActive:
            return "game not active";
    }
    return "unknown";
}

Move MoveHistory::pop() {
    Move move = std::move(moves_.back());
    moves_.pop_back();
    return move;
}

MoveResult Place(Board& board, int row, int col, int value, const PlaceOptions& options) {
    if (!board.inBounds(row, col)) {
        return Rejected(MoveStatus::OutOfRange);
    }
    if (value != kEmptyValue && !IsDigit(value)) {
        return Rejected(MoveStatus::InvalidDigit);
    }
    if (board.isFixed(row, col)) {
        return Rejected(MoveStatus::FixedCell);
    }

    MoveResult result;
    Move& move = result.move;
    Cell& target = board.cell(row, col);
    move.position = Position{row, col};
    move.prev_value = target.value;
    move.prev_notes = target.notes;
    move.new_value = value;
    move.new_notes = 0;

    target.value = value;
    target.notes = 0;

    if (options.clear_peer_notes && value != kEmptyValue) {
        const NoteMask bit = NoteBit(value);
        for (const auto& peer : Peers(move.position)) {
            Cell& other = board.cell(peer);
            if (other.notes & bit) {
                other.notes = static_cast<NoteMask>(other.notes & ~bit);
                move.cleared_peer_notes.push_back(peer);
            }
        }
    }
    return result;
}

MoveResult Erase(Board& board, int row, int col) {
    return Place(board, row, col, kEmptyValue, PlaceOptions{false});
}

MoveResult ToggleNote(Board& board, int row, int col, int digit) {
    if (!board.inBounds(row, col)) {
        return Rejected(MoveStatus::OutOfRange);
    }
    if (!IsDigit(digit)) {
        return Rejected(MoveStatus::InvalidDigit);
    }
    if (board.isFixed(row, col)) {
        return Rejected(MoveStatus::FixedCell);
    }
    Cell& target = board.cell(row, col);
    if (target.value != kEmptyValue) {
        return Rejected(MoveStatus::CellFilled);
    }

    MoveResult result;
    result.move.position = Position{row, col};
    result.move.prev_value = target.value;
    result.move.new_value = target.value;
    result.move.prev_notes = target.notes;
    target.notes = static_cast<NoteMask>(target.notes ^ NoteBit(digit));
    result.move.new_notes = target.notes;
    return result;
}

MoveStatus Revert(Board& board, const Move& move) {
    if (!InGrid(move.position)) {
        return MoveStatus::OutOfRange;
    }
    if (board.isFixed(move.position)) {
        return MoveStatus::FixedCell;
    }
    for (const auto& peer : move.cleared_peer_notes) {
        if (!InGrid(peer)) {
            return MoveStatus::OutOfRange;
        }
        if (board.isFixed(peer)) {
            return MoveStatus::FixedCell;
        }
    }

    Cell& target = board.cell(move.position);
    target.value = move.prev_value;
    target.notes = move.prev_notes;
    if (move.new_value == kEmptyValue) {
        return MoveStatus::Ok;
    }
    const NoteMask bit = NoteBit(move.new_value);
    for (const auto& peer : move.cleared_peer_notes) {
        Cell& other = board.cell(peer);
        other.notes = static_cast<NoteMask>(other.notes | bit);
    }
    return MoveStatus::Ok;
}

MoveResult Undo(Board& board, MoveHistory& history) {
    if (history.empty()) {
        return Rejected(MoveStatus::NothingToUndo);
    }
    // A move that would touch a clue stays on the history.
    const MoveStatus status = Revert(board, history.back());
    if (status != MoveStatus::Ok) {
        return Rejected(status);
    }
    MoveResult result;
    result.move = history.pop();
    return result;
}

}  // namespace sudoku::core
