#include "sudoku/core/GameSession.hpp"

#include <utility>

#include "sudoku/core/Generator.hpp"

namespace sudoku::core {

namespace {

MoveResult Rejected(MoveStatus status) {
    MoveResult result;
    result.status = status;
    return result;
}

int Wrap(int value) {
    return (value + kGridSize) % kGridSize;
}

}  // namespace

const char* ToString(SessionState state) noexcept {
    switch (state) {
        case SessionState::New:
            return "new";
        case SessionState::InProgress:
            return "in progress";
        case SessionState::Paused:
            return "paused";
        case SessionState::Complete:
            return "complete";
    }
    return "new";
}

GameSession::GameSession(ProfileStore& profile, GameConfig config, std::uint32_t seed,
                         ClockFn clock)
    : profile_(profile), config_(std::move(config)), rng_(seed), clock_(std::move(clock)) {}

void GameSession::newGame(Difficulty difficulty) {
    GeneratorSettings settings;
    settings.clue_count = config_.clueCount(difficulty);
    settings.unique_solution = config_.unique_solution;
    settings.max_attempts = config_.max_attempts;
    Puzzle puzzle = GeneratePuzzle(settings, rng_);

    difficulty_ = difficulty;
    board_ = puzzle.board;
    history_.clear();
    selected_.reset();
    notes_mode_ = false;
    completion_.reset();
    clock_.reset();
    clock_.start();
    state_ = SessionState::InProgress;
}

bool GameSession::resume(const SavedGame& saved) {
    if (IsComplete(saved.board)) {
        return false;
    }
    difficulty_ = saved.difficulty;
    board_ = saved.board;
    history_.clear();
    for (const auto& move : saved.history) {
        history_.push(move);
    }
    selected_.reset();
    if (InGrid(saved.selected)) {
        selected_ = saved.selected;
    }
    notes_mode_ = saved.notes_mode;
    completion_.reset();
    clock_.reset(saved.elapsed_ms);
    clock_.start();
    state_ = SessionState::InProgress;
    return true;
}

SavedGame GameSession::toSavedGame() const {
    SavedGame saved;
    saved.difficulty = difficulty_;
    saved.elapsed_ms = clock_.elapsedMs();
    saved.notes_mode = notes_mode_;
    if (selected_) {
        saved.selected = *selected_;
    }
    saved.board = board_;
    saved.history = history_.moves();
    return saved;
}

MoveStatus GameSession::selectCell(const Position& pos) {
    if (!active()) {
        return MoveStatus::NotActive;
    }
    if (!InGrid(pos)) {
        selected_.reset();
        return MoveStatus::OutOfRange;
    }
    selected_ = pos;
    return MoveStatus::Ok;
}

MoveStatus GameSession::moveSelection(Direction direction) {
    if (!active()) {
        return MoveStatus::NotActive;
    }
    if (!selected_) {
        selected_ = Position{0, 0};
        return MoveStatus::Ok;
    }
    Position next = *selected_;
    switch (direction) {
        case Direction::Up:
            next.row = Wrap(next.row - 1);
            break;
        case Direction::Down:
            next.row = Wrap(next.row + 1);
            break;
        case Direction::Left:
            next.col = Wrap(next.col - 1);
            break;
        case Direction::Right:
            next.col = Wrap(next.col + 1);
            break;
    }
    selected_ = next;
    return MoveStatus::Ok;
}

MoveResult GameSession::enterDigit(int digit) {
    if (!active()) {
        return Rejected(MoveStatus::NotActive);
    }
    if (!selected_) {
        return Rejected(MoveStatus::OutOfRange);
    }
    if (!IsDigit(digit)) {
        return Rejected(MoveStatus::InvalidDigit);
    }
    if (notes_mode_) {
        return apply(ToggleNote(board_, selected_->row, selected_->col, digit));
    }
    PlaceOptions options;
    options.clear_peer_notes = config_.auto_clear_notes;
    return apply(Place(board_, selected_->row, selected_->col, digit, options));
}

MoveResult GameSession::erase() {
    if (!active()) {
        return Rejected(MoveStatus::NotActive);
    }
    if (!selected_) {
        return Rejected(MoveStatus::OutOfRange);
    }
    return apply(Erase(board_, selected_->row, selected_->col));
}

MoveResult GameSession::undo() {
    if (!active()) {
        return Rejected(MoveStatus::NotActive);
    }
    return Undo(board_, history_);
}

MoveResult GameSession::apply(MoveResult result) {
    if (!result.ok()) {
        return result;
    }
    history_.push(result.move);
    if (IsComplete(board_)) {
        finish();
    }
    return result;
}

void GameSession::finish() {
    clock_.pause();
    state_ = SessionState::Complete;

    Completion done;
    done.difficulty = difficulty_;
    done.time_ms = clock_.elapsedMs();
    Statistics stats = profile_.loadStatistics();
    done.new_record = stats.record(difficulty_, done.time_ms);
    done.stats_saved = profile_.saveStatistics(stats);
    if (!done.stats_saved) {
        done.profile_error = profile_.lastError();
    } else if (!profile_.clearSavedGame()) {
        done.profile_error = profile_.lastError();
    }
    completion_ = done;
}

bool GameSession::toggleNotesMode() {
    if (!active()) {
        return notes_mode_;
    }
    notes_mode_ = !notes_mode_;
    return notes_mode_;
}

bool GameSession::togglePause() {
    if (state_ == SessionState::InProgress) {
        pause();
    } else if (state_ == SessionState::Paused) {
        unpause();
    }
    return state_ == SessionState::Paused;
}

void GameSession::pause() {
    if (state_ != SessionState::InProgress) {
        return;
    }
    clock_.pause();
    state_ = SessionState::Paused;
}

void GameSession::unpause() {
    if (state_ != SessionState::Paused) {
        return;
    }
    clock_.start();
    state_ = SessionState::InProgress;
}

BoardView GameSession::view() const {
    BoardView view;
    view.selected = selected_;
    view.completed_digits = CompletedDigits(board_);
    view.elapsed_ms = clock_.elapsedMs();
    view.notes_mode = notes_mode_;
    view.can_undo = active() && !history_.empty();
    view.state = state_;
    view.difficulty = difficulty_;

    const int selected_value = selected_ ? board_.get(*selected_) : kEmptyValue;
    for (int row = 0; row < kGridSize; ++row) {
        for (int col = 0; col < kGridSize; ++col) {
            const Position pos{row, col};
            const Cell& cell = board_.cell(pos);
            CellView& out = view.cells[static_cast<std::size_t>(row * kGridSize + col)];
            out.value = cell.value;
            out.fixed = cell.fixed;
            out.notes = cell.notes;
            out.conflict = HasConflictAt(board_, row, col);
            if (selected_) {
                out.selected = pos == *selected_;
                out.peer = !out.selected && SharesUnit(pos, *selected_);
                out.same_value = selected_value != kEmptyValue && cell.value == selected_value;
            }
        }
    }
    return view;
}

}  // namespace sudoku::core
