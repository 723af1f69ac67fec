#pragma once

#include <SDL2/SDL.h>

#include <array>
#include <optional>
#include <string>

#include "sudoku/core/Difficulty.hpp"
#include "sudoku/core/GameSession.hpp"
#include "sudoku/core/Statistics.hpp"
#include "sudoku/platform/InputEvents.hpp"
#include "sudoku/ui/Strings.hpp"

namespace sudoku::ui {

inline constexpr int kLogicalWidth = 800;
inline constexpr int kLogicalHeight = 600;
inline constexpr int kBoardPixels = 504;
inline constexpr int kSquarePixels = kBoardPixels / core::kGridSize;

enum class Screen { Menu, Stats, Game };

// Hit areas of the 800x600 logical screen, scaled to the real window.
class Layout {
public:
    Layout() = default;
    Layout(int window_width, int window_height);

    SDL_Point ToLogical(int x, int y) const noexcept;

    // Cell under a window coordinate, if any.
    std::optional<core::Position> CellAt(int x, int y) const noexcept;
    // Number pad digit under a window coordinate, if any.
    std::optional<int> NumpadDigitAt(int x, int y) const noexcept;
    bool Hits(const SDL_Rect& logical_rect, int x, int y) const noexcept;

    SDL_Rect board() const noexcept { return board_; }
    SDL_Rect cellRect(const core::Position& pos) const noexcept;
    SDL_Rect numpad() const noexcept { return numpad_; }
    SDL_Rect pauseButton() const noexcept { return pause_; }
    SDL_Rect notesButton() const noexcept { return notes_; }
    SDL_Rect eraseButton() const noexcept { return erase_; }
    SDL_Rect undoButton() const noexcept { return undo_; }
    SDL_Rect returnButton() const noexcept { return return_; }
    SDL_Rect winReturnButton() const noexcept { return win_return_; }
    SDL_Rect languageButton() const noexcept { return language_; }
    SDL_Rect statsReturnButton() const noexcept { return stats_return_; }
    SDL_Rect statsResetButton() const noexcept { return stats_reset_; }

    // Menu buttons are stacked and centred; Continue only takes a slot when offered.
    SDL_Rect menuButton(int slot, bool with_continue) const noexcept;
    SDL_Rect difficultyButton(core::Difficulty difficulty) const noexcept;

private:
    float scale_x_ = 1.0f;
    float scale_y_ = 1.0f;
    SDL_Rect board_{98, 48, kBoardPixels, kBoardPixels};
    SDL_Rect pause_{707, 48, 38, 38};
    SDL_Rect notes_{627, 98, 136, 25};
    SDL_Rect numpad_{627, 148, 135, 135};
    SDL_Rect erase_{627, 309, 136, 25};
    SDL_Rect undo_{627, 344, 136, 25};
    SDL_Rect return_{627, 512, 136, 40};
    SDL_Rect win_return_{250, 395, 300, 75};
    SDL_Rect language_{710, 30, 60, 33};
    SDL_Rect stats_return_{160, 535, 136, 40};
    SDL_Rect stats_reset_{480, 535, 136, 40};
};

enum class MenuButton { Continue, NewGame, Stats, Exit };

struct MenuState {
    bool can_continue = false;
    bool choosing_difficulty = false;
    core::Difficulty chosen = core::Difficulty::Easy;
};

enum class MenuAction {
    None,
    Continue,
    ChooseDifficulty,
    CancelDifficulty,
    StartGame,
    Stats,
    CycleLanguage,
    Quit
};

MenuAction HandleMenuEvent(MenuState& state,
                           const platform::InputEvent& evt,
                           const Layout& layout);

enum class StatsAction { None, Back, Reset };

StatsAction HandleStatsEvent(const platform::InputEvent& evt, const Layout& layout);

enum class GameAction {
    None,
    Accepted,
    Rejected,
    Completed,
    ReturnToMenu
};

// Feeds one input event into the session.
GameAction HandleGameEvent(core::GameSession& session,
                           const platform::InputEvent& evt,
                           const Layout& layout);

std::string DifficultyLabel(const Strings& strings, core::Difficulty difficulty);
std::string NotesStatus(const Strings& strings, bool notes_mode);

// One-line summary shown in the window title for each screen.
std::string MenuTitle(const Strings& strings, const MenuState& state);
std::string StatsTitle(const Strings& strings, const core::Statistics& stats);
std::string GameTitle(const Strings& strings, const core::BoardView& view,
                      const std::optional<core::Completion>& completion);

// Text dump of the board for debug logging.
std::string FormatBoard(const core::BoardView& view);

}  // namespace sudoku::ui
