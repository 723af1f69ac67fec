#include <cassert>
#include <iostream>

#include "sudoku/core/Board.hpp"
#include "sudoku/core/Moves.hpp"

using namespace sudoku::core;

namespace {

Board MakeBoard() {
    auto board = ParseBoard(
        "530070000"
        "600195000"
        "098000060"
        "800060003"
        "400803001"
        "700020006"
        "060000280"
        "000419005"
        "000080079");
    assert(board.has_value());
    return *board;
}

void TestPlaceAndUndoRestoresExactState() {
    Board board = MakeBoard();
    // Notes for 4 in peers of (0,2) plus one outside its units.
    board.cell(0, 3).notes = NoteBit(4) | NoteBit(2);
    board.cell(5, 2).notes = NoteBit(4);
    board.cell(1, 1).notes = NoteBit(4);
    board.cell(4, 4).notes = NoteBit(4);
    board.cell(0, 2).notes = NoteBit(1) | NoteBit(4);
    const Board before = board;

    MoveHistory history;
    auto result = Place(board, 0, 2, 4);
    assert(result.ok());
    assert(board.get(0, 2) == 4);
    assert(board.notes(0, 2) == 0);
    assert(board.notes(0, 3) == NoteBit(2));
    assert(board.notes(5, 2) == 0);
    assert(board.notes(1, 1) == 0);
    assert(board.notes(4, 4) == NoteBit(4));
    assert(result.move.cleared_peer_notes.size() == 3);
    assert(result.move.prev_value == kEmptyValue);
    assert(result.move.new_value == 4);
    history.push(result.move);

    auto undone = Undo(board, history);
    assert(undone.ok());
    assert(board == before);
    assert(history.empty());
}

void TestPlaceWithoutPeerClearing() {
    Board board = MakeBoard();
    board.cell(0, 3).notes = NoteBit(4);
    PlaceOptions options;
    options.clear_peer_notes = false;
    auto result = Place(board, 0, 2, 4, options);
    assert(result.ok());
    assert(board.notes(0, 3) == NoteBit(4));
    assert(result.move.cleared_peer_notes.empty());
}

void TestPlaceRejections() {
    Board board = MakeBoard();
    const Board before = board;
    assert(Place(board, 0, 0, 1).status == MoveStatus::FixedCell);
    assert(Place(board, 9, 0, 1).status == MoveStatus::OutOfRange);
    assert(Place(board, 0, -1, 1).status == MoveStatus::OutOfRange);
    assert(Place(board, 0, 2, 10).status == MoveStatus::InvalidDigit);
    assert(Place(board, 0, 2, -1).status == MoveStatus::InvalidDigit);
    assert(Erase(board, 0, 0).status == MoveStatus::FixedCell);
    assert(board == before);
}

void TestConflictingPlaceIsAccepted() {
    Board board = MakeBoard();
    auto result = Place(board, 0, 2, 5);
    assert(result.ok());
    assert(HasConflictAt(board, 0, 2));
}

void TestOverwriteAndErase() {
    Board board = MakeBoard();
    MoveHistory history;
    history.push(Place(board, 0, 2, 4).move);
    history.push(Place(board, 0, 2, 1).move);
    assert(board.get(0, 2) == 1);
    assert(history.back().prev_value == 4);

    auto erased = Erase(board, 0, 2);
    assert(erased.ok());
    assert(board.get(0, 2) == kEmptyValue);
    history.push(erased.move);

    assert(Undo(board, history).ok());
    assert(board.get(0, 2) == 1);
    assert(Undo(board, history).ok());
    assert(board.get(0, 2) == 4);
    assert(Undo(board, history).ok());
    assert(board.get(0, 2) == kEmptyValue);
    assert(Undo(board, history).status == MoveStatus::NothingToUndo);
}

void TestToggleNote() {
    Board board = MakeBoard();
    const Board before = board;

    auto first = ToggleNote(board, 0, 2, 4);
    assert(first.ok());
    assert(board.hasNote(0, 2, 4));
    assert(first.move.prev_notes == 0);
    assert(first.move.new_notes == NoteBit(4));

    auto second = ToggleNote(board, 0, 2, 4);
    assert(second.ok());
    assert(board == before);

    // Filled and fixed cells never take notes.
    assert(ToggleNote(board, 0, 0, 4).status == MoveStatus::FixedCell);
    assert(Place(board, 0, 2, 1).ok());
    const Board filled = board;
    assert(ToggleNote(board, 0, 2, 4).status == MoveStatus::CellFilled);
    assert(board == filled);

    assert(ToggleNote(board, 0, 3, 0).status == MoveStatus::InvalidDigit);
    assert(ToggleNote(board, 0, 9, 1).status == MoveStatus::OutOfRange);
}

void TestUndoNote() {
    Board board = MakeBoard();
    MoveHistory history;
    history.push(ToggleNote(board, 1, 1, 2).move);
    history.push(ToggleNote(board, 1, 1, 7).move);
    assert(board.notes(1, 1) == (NoteBit(2) | NoteBit(7)));
    assert(Undo(board, history).ok());
    assert(board.notes(1, 1) == NoteBit(2));
    assert(Undo(board, history).ok());
    assert(board.notes(1, 1) == 0);
}

void TestUndoRefusesClueMove() {
    Board board = MakeBoard();
    MoveHistory history;
    Move forged;
    forged.position = Position{0, 0};
    forged.prev_value = kEmptyValue;
    forged.new_value = 5;
    history.push(forged);

    auto undone = Undo(board, history);
    assert(undone.status == MoveStatus::FixedCell);
    assert(board.get(0, 0) == 5);
    assert(board.isFixed(0, 0));
    assert(history.size() == 1);

    // A clue listed among cleared peers is refused too.
    Move peer_clue = Place(board, 0, 2, 4).move;
    peer_clue.cleared_peer_notes.push_back(Position{0, 1});
    const Board before = board;
    assert(Revert(board, peer_clue) == MoveStatus::FixedCell);
    assert(board == before);
}

}  // namespace

int main() {
    TestPlaceAndUndoRestoresExactState();
    TestPlaceWithoutPeerClearing();
    TestPlaceRejections();
    TestConflictingPlaceIsAccepted();
    TestOverwriteAndErase();
    TestToggleNote();
    TestUndoNote();
    TestUndoRefusesClueMove();
    std::cout << "All move tests passed.\n";
    return 0;
}
