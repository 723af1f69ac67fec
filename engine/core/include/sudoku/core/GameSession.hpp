#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "sudoku/core/Board.hpp"
#include "sudoku/core/Difficulty.hpp"
#include "sudoku/core/GameClock.hpp"
#include "sudoku/core/GameConfig.hpp"
#include "sudoku/core/Moves.hpp"
#include "sudoku/core/ProfileStore.hpp"
#include "sudoku/core/SavedGame.hpp"

namespace sudoku::core {

enum class SessionState { New, InProgress, Paused, Complete };

const char* ToString(SessionState state) noexcept;

struct CellView {
    int value = kEmptyValue;
    bool fixed = false;
    NoteMask notes = 0;
    bool selected = false;
    // Shares a row, column or box with the selected cell.
    bool peer = false;
    bool same_value = false;
    bool conflict = false;
};

// Everything a renderer needs to draw one frame of the game screen.
struct BoardView {
    std::array<CellView, kCellCount> cells{};
    std::optional<Position> selected;
    NoteMask completed_digits = 0;
    std::uint64_t elapsed_ms = 0;
    bool notes_mode = false;
    bool can_undo = false;
    SessionState state = SessionState::New;
    Difficulty difficulty = Difficulty::Easy;

    const CellView& at(int row, int col) const {
        return cells[static_cast<std::size_t>(row * kGridSize + col)];
    }
};

struct Completion {
    Difficulty difficulty = Difficulty::Easy;
    std::uint64_t time_ms = 0;
    bool new_record = false;
    bool stats_saved = false;
    std::string profile_error;
};

class GameSession {
public:
    GameSession(ProfileStore& profile, GameConfig config, std::uint32_t seed,
                ClockFn clock = SteadyClock());

    // Throws GenerationError when no puzzle could be produced; the current game is kept then.
    void newGame(Difficulty difficulty);
    // Rejects saved games whose board is already complete.
    bool resume(const SavedGame& saved);
    SavedGame toSavedGame() const;

    MoveStatus selectCell(const Position& pos);
    MoveStatus moveSelection(Direction direction);
    void clearSelection() noexcept { selected_.reset(); }

    MoveResult enterDigit(int digit);
    MoveResult erase();
    MoveResult undo();

    bool toggleNotesMode();
    // Returns true when the session is paused afterwards.
    bool togglePause();
    void pause();
    void unpause();

    SessionState state() const noexcept { return state_; }
    bool active() const noexcept { return state_ == SessionState::InProgress; }
    Difficulty difficulty() const noexcept { return difficulty_; }
    const Board& board() const noexcept { return board_; }
    const MoveHistory& history() const noexcept { return history_; }
    const std::optional<Position>& selected() const noexcept { return selected_; }
    bool notesMode() const noexcept { return notes_mode_; }
    std::uint64_t elapsedMs() const { return clock_.elapsedMs(); }
    const std::optional<Completion>& completion() const noexcept { return completion_; }
    const GameConfig& config() const noexcept { return config_; }
    void setConfig(const GameConfig& config) { config_ = config; }

    BoardView view() const;

private:
    MoveResult apply(MoveResult result);
    void finish();

    ProfileStore& profile_;
    GameConfig config_;
    std::mt19937 rng_;
    GameClock clock_;
    SessionState state_ = SessionState::New;
    Difficulty difficulty_ = Difficulty::Easy;
    Board board_;
    MoveHistory history_;
    std::optional<Position> selected_;
    bool notes_mode_ = false;
    std::optional<Completion> completion_;
};

}  // namespace sudoku::core
