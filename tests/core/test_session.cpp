#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>

#include "MemoryStorage.hpp"
#include "sudoku/core/GameSession.hpp"
#include "sudoku/core/Solver.hpp"

using namespace sudoku::core;
using sudoku::test::MemoryStorage;

namespace {

struct Fixture {
    Fixture()
        : profile(storage),
          session(profile, GameConfig{}, /*seed=*/2024, [this] { return now; }) {}

    std::uint64_t now = 0;
    MemoryStorage storage;
    ProfileStore profile;
    GameSession session;
};

std::optional<Position> FirstEmpty(const Board& board) {
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            if (board.get(row, col) == kEmptyValue) {
                return Position{row, col};
            }
        }
    }
    return std::nullopt;
}

// Fills every empty cell from the solution, leaving the last one for the caller.
Position FillAllButOne(GameSession& session) {
    auto solution = Solve(session.board());
    assert(solution.has_value());
    Position last{};
    int empties = kCellCount - session.board().filledCount();
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            if (session.board().get(row, col) != kEmptyValue) {
                continue;
            }
            if (--empties == 0) {
                last = Position{row, col};
                continue;
            }
            assert(session.selectCell(Position{row, col}) == MoveStatus::Ok);
            assert(session.enterDigit(solution->get(row, col)).ok());
        }
    }
    return last;
}

void TestNewGame() {
    Fixture f;
    assert(f.session.state() == SessionState::New);
    assert(f.session.enterDigit(1).status == MoveStatus::NotActive);

    f.session.newGame(Difficulty::Easy);
    assert(f.session.state() == SessionState::InProgress);
    assert(f.session.board().clueCount() == 30);
    assert(f.session.history().empty());
    assert(!f.session.selected().has_value());

    // Without a selection digits have nowhere to go.
    assert(f.session.enterDigit(1).status == MoveStatus::OutOfRange);
}

void TestSelectionWraps() {
    Fixture f;
    f.session.newGame(Difficulty::Easy);
    assert(f.session.moveSelection(Direction::Left) == MoveStatus::Ok);
    assert((*f.session.selected() == Position{0, 0}));
    f.session.moveSelection(Direction::Left);
    assert((*f.session.selected() == Position{0, 8}));
    f.session.moveSelection(Direction::Up);
    assert((*f.session.selected() == Position{8, 8}));
    f.session.moveSelection(Direction::Down);
    f.session.moveSelection(Direction::Right);
    assert((*f.session.selected() == Position{0, 0}));

    assert(f.session.selectCell(Position{9, 9}) == MoveStatus::OutOfRange);
    assert(!f.session.selected().has_value());
}

void TestMovesNotesAndUndo() {
    Fixture f;
    f.session.newGame(Difficulty::Easy);
    auto empty = FirstEmpty(f.session.board());
    assert(empty.has_value());
    f.session.selectCell(*empty);
    const Board before = f.session.board();

    assert(!f.session.toggleNotesMode());
    assert(f.session.toggleNotesMode());
    assert(f.session.enterDigit(3).ok());
    assert(f.session.board().hasNote(empty->row, empty->col, 3));
    assert(f.session.toggleNotesMode() == false);

    assert(f.session.enterDigit(7).ok());
    assert(f.session.board().get(*empty) == 7);
    assert(f.session.board().notes(empty->row, empty->col) == 0);
    assert(f.session.erase().ok());
    assert(f.session.history().size() == 3);

    assert(f.session.undo().ok());
    assert(f.session.undo().ok());
    assert(f.session.undo().ok());
    assert(f.session.board() == before);
    assert(f.session.undo().status == MoveStatus::NothingToUndo);

    // Clues cannot be changed.
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            if (f.session.board().isFixed(row, col)) {
                f.session.selectCell(Position{row, col});
                assert(f.session.enterDigit(1).status == MoveStatus::FixedCell);
                assert(f.session.erase().status == MoveStatus::FixedCell);
                return;
            }
        }
    }
}

void TestPauseStopsClockAndInput() {
    Fixture f;
    f.session.newGame(Difficulty::Easy);
    f.now = 5000;
    assert(f.session.elapsedMs() == 5000);

    assert(f.session.togglePause());
    assert(f.session.state() == SessionState::Paused);
    f.now = 65000;
    assert(f.session.elapsedMs() == 5000);
    assert(f.session.selectCell(Position{0, 0}) == MoveStatus::NotActive);
    assert(f.session.moveSelection(Direction::Up) == MoveStatus::NotActive);
    assert(f.session.enterDigit(1).status == MoveStatus::NotActive);
    assert(f.session.erase().status == MoveStatus::NotActive);
    assert(f.session.undo().status == MoveStatus::NotActive);
    assert(!f.session.view().can_undo);

    assert(!f.session.togglePause());
    f.now = 66000;
    assert(f.session.elapsedMs() == 6000);
}

void TestCompletionRecordsStatisticsOnce() {
    Fixture f;
    f.session.newGame(Difficulty::Easy);
    assert(f.profile.storeSavedGame(f.session.toSavedGame()));

    const Position last = FillAllButOne(f.session);
    auto solution = Solve(f.session.board());
    assert(solution.has_value());
    f.now = 95000;
    f.session.selectCell(last);
    assert(f.session.enterDigit(solution->get(last)).ok());

    assert(f.session.state() == SessionState::Complete);
    const auto& done = f.session.completion();
    assert(done.has_value());
    assert(done->time_ms == 95000);
    assert(done->new_record);
    assert(done->stats_saved);
    assert(done->profile_error.empty());
    assert(!f.profile.hasSavedGame());

    Statistics stats = f.profile.loadStatistics();
    assert(stats.get(Difficulty::Easy).games == 1);
    assert(stats.get(Difficulty::Easy).best_ms == 95000);
    assert(stats.get(Difficulty::Easy).averageMs() == 95000);

    // A finished game takes no more input, so it is counted once.
    f.now = 120000;
    assert(f.session.elapsedMs() == 95000);
    assert(f.session.erase().status == MoveStatus::NotActive);
    assert(f.session.undo().status == MoveStatus::NotActive);
    assert(f.profile.loadStatistics().get(Difficulty::Easy).games == 1);

    // A slower second game updates the count and average, not the best.
    f.session.newGame(Difficulty::Easy);
    const Position second_last = FillAllButOne(f.session);
    auto second_solution = Solve(f.session.board());
    assert(second_solution.has_value());
    f.now = 120000 + 105000;
    f.session.selectCell(second_last);
    assert(f.session.enterDigit(second_solution->get(second_last)).ok());
    assert(!f.session.completion()->new_record);
    stats = f.profile.loadStatistics();
    assert(stats.get(Difficulty::Easy).games == 2);
    assert(stats.get(Difficulty::Easy).best_ms == 95000);
    assert(stats.get(Difficulty::Easy).averageMs() == 100000);
}

void TestCompletionWithFailingStorage() {
    Fixture f;
    f.session.newGame(Difficulty::Easy);
    const Position last = FillAllButOne(f.session);
    auto solution = Solve(f.session.board());
    assert(solution.has_value());
    f.storage.fail_writes = true;
    f.session.selectCell(last);
    assert(f.session.enterDigit(solution->get(last)).ok());
    assert(f.session.state() == SessionState::Complete);
    assert(!f.session.completion()->stats_saved);
    assert(!f.session.completion()->profile_error.empty());
}

void TestSaveAndResume() {
    Fixture f;
    f.session.newGame(Difficulty::Medium);
    auto empty = FirstEmpty(f.session.board());
    assert(empty.has_value());
    f.session.selectCell(*empty);
    assert(f.session.enterDigit(5).ok());
    f.session.toggleNotesMode();
    f.now = 42000;
    f.session.pause();
    const SavedGame saved = f.session.toSavedGame();
    assert(saved.elapsed_ms == 42000);
    assert(saved.notes_mode);

    Fixture g;
    g.now = 1000000;
    assert(g.session.resume(saved));
    assert(g.session.state() == SessionState::InProgress);
    assert(g.session.difficulty() == Difficulty::Medium);
    assert(g.session.board() == f.session.board());
    assert(g.session.notesMode());
    assert(g.session.selected() == f.session.selected());
    assert(g.session.elapsedMs() == 42000);
    g.now += 3000;
    assert(g.session.elapsedMs() == 45000);

    // The restored history still undoes the restored board.
    assert(g.session.undo().ok());
    assert(g.session.board().get(*empty) == kEmptyValue);

    SavedGame finished = saved;
    finished.board.set(empty->row, empty->col, kEmptyValue);
    auto solved = Solve(finished.board);
    assert(solved.has_value());
    finished.board = *solved;
    assert(!g.session.resume(finished));
}

void TestView() {
    Fixture f;
    f.session.newGame(Difficulty::Easy);
    auto empty = FirstEmpty(f.session.board());
    assert(empty.has_value());
    f.session.selectCell(*empty);

    BoardView view = f.session.view();
    assert(view.state == SessionState::InProgress);
    assert(view.difficulty == Difficulty::Easy);
    assert(!view.can_undo);
    assert(view.selected == empty);
    const CellView& selected = view.at(empty->row, empty->col);
    assert(selected.selected);
    assert(!selected.peer);
    assert(view.at(empty->row, (empty->col + 1) % kGridSize).peer);

    // Writing a digit already in the row shows up as a conflict.
    int clash = kEmptyValue;
    for (int col = 0; col < kGridSize; ++col) {
        if (f.session.board().get(empty->row, col) != kEmptyValue) {
            clash = f.session.board().get(empty->row, col);
            break;
        }
    }
    assert(clash != kEmptyValue);
    assert(f.session.enterDigit(clash).ok());
    view = f.session.view();
    assert(view.can_undo);
    assert(view.at(empty->row, empty->col).conflict);
    assert(view.at(empty->row, empty->col).same_value);
    assert(f.session.state() == SessionState::InProgress);
}

}  // namespace

int main() {
    TestNewGame();
    TestSelectionWraps();
    TestMovesNotesAndUndo();
    TestPauseStopsClockAndInput();
    TestCompletionRecordsStatisticsOnce();
    TestCompletionWithFailingStorage();
    TestSaveAndResume();
    TestView();
    std::cout << "All session tests passed.\n";
    return 0;
}
