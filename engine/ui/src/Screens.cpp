#include "sudoku/ui/Screens.hpp"

#include <sstream>

namespace sudoku::ui {

using platform::InputEvent;
using platform::InputEventType;
using platform::KeyCode;
using platform::MouseButton;

namespace {

constexpr int kMenuButtonWidth = 300;
constexpr int kMenuButtonHeight = 100;
constexpr int kMenuSpacing = 15;
constexpr int kDifficultyButtonHeight = 75;
constexpr int kDifficultyTop = 102;
constexpr int kNumpadSquare = 45;

bool IsLeftClick(const InputEvent& evt) {
    return evt.type == InputEventType::MouseButtonDown && evt.mouse_button == MouseButton::Left;
}

bool IsKey(const InputEvent& evt, KeyCode key) {
    return evt.type == InputEventType::KeyDown && evt.key == key;
}

GameAction FromStatus(core::MoveStatus status) {
    return status == core::MoveStatus::Ok ? GameAction::Accepted : GameAction::Rejected;
}

GameAction AfterMove(const core::GameSession& session, const core::MoveResult& result) {
    if (result.ok() && session.state() == core::SessionState::Complete) {
        return GameAction::Completed;
    }
    return FromStatus(result.status);
}

GameAction HandleGameClick(core::GameSession& session, const InputEvent& evt,
                           const Layout& layout) {
    if (auto digit = layout.NumpadDigitAt(evt.x, evt.y)) {
        return AfterMove(session, session.enterDigit(*digit));
    }
    if (layout.Hits(layout.eraseButton(), evt.x, evt.y)) {
        return AfterMove(session, session.erase());
    }
    if (layout.Hits(layout.undoButton(), evt.x, evt.y)) {
        return FromStatus(session.undo().status);
    }
    if (layout.Hits(layout.pauseButton(), evt.x, evt.y)) {
        session.togglePause();
        return GameAction::Accepted;
    }
    if (layout.Hits(layout.notesButton(), evt.x, evt.y)) {
        if (!session.active()) {
            return GameAction::Rejected;
        }
        session.toggleNotesMode();
        return GameAction::Accepted;
    }
    if (layout.Hits(layout.returnButton(), evt.x, evt.y)) {
        return GameAction::ReturnToMenu;
    }
    if (auto cell = layout.CellAt(evt.x, evt.y)) {
        return FromStatus(session.selectCell(*cell));
    }
    if (session.active()) {
        session.clearSelection();
    }
    return GameAction::None;
}

GameAction HandleGameKey(core::GameSession& session, const InputEvent& evt) {
    switch (evt.key) {
        case KeyCode::Digit:
            return AfterMove(session, session.enterDigit(evt.digit));
        case KeyCode::Backspace:
        case KeyCode::Delete:
            return AfterMove(session, session.erase());
        case KeyCode::Up:
            return FromStatus(session.moveSelection(core::Direction::Up));
        case KeyCode::Down:
            return FromStatus(session.moveSelection(core::Direction::Down));
        case KeyCode::Left:
            return FromStatus(session.moveSelection(core::Direction::Left));
        case KeyCode::Right:
            return FromStatus(session.moveSelection(core::Direction::Right));
        case KeyCode::Tab:
            if (!session.active()) {
                return GameAction::Rejected;
            }
            session.toggleNotesMode();
            return GameAction::Accepted;
        case KeyCode::Space:
            session.togglePause();
            return GameAction::Accepted;
        case KeyCode::Z:
            if (!evt.ctrl) {
                return GameAction::None;
            }
            return FromStatus(session.undo().status);
        case KeyCode::Escape:
            return GameAction::ReturnToMenu;
        default:
            return GameAction::None;
    }
}

}  // namespace

Layout::Layout(int window_width, int window_height) {
    if (window_width > 0 && window_height > 0) {
        scale_x_ = static_cast<float>(window_width) / static_cast<float>(kLogicalWidth);
        scale_y_ = static_cast<float>(window_height) / static_cast<float>(kLogicalHeight);
    }
}

SDL_Point Layout::ToLogical(int x, int y) const noexcept {
    return SDL_Point{static_cast<int>(static_cast<float>(x) / scale_x_),
                     static_cast<int>(static_cast<float>(y) / scale_y_)};
}

bool Layout::Hits(const SDL_Rect& logical_rect, int x, int y) const noexcept {
    const SDL_Point point = ToLogical(x, y);
    return SDL_PointInRect(&point, &logical_rect) == SDL_TRUE;
}

std::optional<core::Position> Layout::CellAt(int x, int y) const noexcept {
    if (!Hits(board_, x, y)) {
        return std::nullopt;
    }
    const SDL_Point point = ToLogical(x, y);
    return core::Position{(point.y - board_.y) / kSquarePixels,
                          (point.x - board_.x) / kSquarePixels};
}

std::optional<int> Layout::NumpadDigitAt(int x, int y) const noexcept {
    if (!Hits(numpad_, x, y)) {
        return std::nullopt;
    }
    const SDL_Point point = ToLogical(x, y);
    const int row = (point.y - numpad_.y) / kNumpadSquare;
    const int col = (point.x - numpad_.x) / kNumpadSquare;
    return row * core::kBoxSize + col + 1;
}

SDL_Rect Layout::cellRect(const core::Position& pos) const noexcept {
    return SDL_Rect{board_.x + pos.col * kSquarePixels, board_.y + pos.row * kSquarePixels,
                    kSquarePixels, kSquarePixels};
}

SDL_Rect Layout::menuButton(int slot, bool with_continue) const noexcept {
    const int count = with_continue ? 4 : 3;
    const int step = kMenuButtonHeight + kMenuSpacing;
    const int top = (kLogicalHeight - count * step) / 2;
    return SDL_Rect{(kLogicalWidth - kMenuButtonWidth) / 2, top + slot * step, kMenuButtonWidth,
                    kMenuButtonHeight};
}

SDL_Rect Layout::difficultyButton(core::Difficulty difficulty) const noexcept {
    const int index = static_cast<int>(core::DifficultyIndex(difficulty));
    return SDL_Rect{(kLogicalWidth - kMenuButtonWidth) / 2,
                    kDifficultyTop + index * (kDifficultyButtonHeight + kMenuSpacing),
                    kMenuButtonWidth, kDifficultyButtonHeight};
}

MenuAction HandleMenuEvent(MenuState& state, const InputEvent& evt, const Layout& layout) {
    if (evt.type == InputEventType::Quit) {
        return MenuAction::Quit;
    }

    if (state.choosing_difficulty) {
        if (IsKey(evt, KeyCode::Escape)) {
            state.choosing_difficulty = false;
            return MenuAction::CancelDifficulty;
        }
        if (IsKey(evt, KeyCode::Digit) && evt.digit >= 1 &&
            evt.digit <= static_cast<int>(core::kDifficulties.size())) {
            state.chosen = core::kDifficulties[static_cast<std::size_t>(evt.digit - 1)];
            state.choosing_difficulty = false;
            return MenuAction::StartGame;
        }
        if (IsLeftClick(evt)) {
            for (core::Difficulty difficulty : core::kDifficulties) {
                if (layout.Hits(layout.difficultyButton(difficulty), evt.x, evt.y)) {
                    state.chosen = difficulty;
                    state.choosing_difficulty = false;
                    return MenuAction::StartGame;
                }
            }
        }
        return MenuAction::None;
    }

    auto activate = [&state](MenuButton button) {
        switch (button) {
            case MenuButton::Continue:
                return state.can_continue ? MenuAction::Continue : MenuAction::None;
            case MenuButton::NewGame:
                state.choosing_difficulty = true;
                return MenuAction::ChooseDifficulty;
            case MenuButton::Stats:
                return MenuAction::Stats;
            case MenuButton::Exit:
                return MenuAction::Quit;
        }
        return MenuAction::None;
    };

    if (IsLeftClick(evt)) {
        if (layout.Hits(layout.languageButton(), evt.x, evt.y)) {
            return MenuAction::CycleLanguage;
        }
        const std::array<MenuButton, 4> buttons{
            {MenuButton::Continue, MenuButton::NewGame, MenuButton::Stats, MenuButton::Exit}};
        const int first = state.can_continue ? 0 : 1;
        for (int i = first; i < static_cast<int>(buttons.size()); ++i) {
            if (layout.Hits(layout.menuButton(i - first, state.can_continue), evt.x, evt.y)) {
                return activate(buttons[static_cast<std::size_t>(i)]);
            }
        }
        return MenuAction::None;
    }

    if (evt.type != InputEventType::KeyDown) {
        return MenuAction::None;
    }
    switch (evt.key) {
        case KeyCode::C:
        case KeyCode::Enter:
            return activate(MenuButton::Continue);
        case KeyCode::N:
            return activate(MenuButton::NewGame);
        case KeyCode::S:
            return activate(MenuButton::Stats);
        case KeyCode::L:
            return MenuAction::CycleLanguage;
        case KeyCode::Q:
            return activate(MenuButton::Exit);
        default:
            return MenuAction::None;
    }
}

StatsAction HandleStatsEvent(const InputEvent& evt, const Layout& layout) {
    if (IsLeftClick(evt)) {
        if (layout.Hits(layout.statsReturnButton(), evt.x, evt.y)) {
            return StatsAction::Back;
        }
        if (layout.Hits(layout.statsResetButton(), evt.x, evt.y)) {
            return StatsAction::Reset;
        }
        return StatsAction::None;
    }
    if (IsKey(evt, KeyCode::Escape) || IsKey(evt, KeyCode::Enter)) {
        return StatsAction::Back;
    }
    if (IsKey(evt, KeyCode::R)) {
        return StatsAction::Reset;
    }
    return StatsAction::None;
}

GameAction HandleGameEvent(core::GameSession& session, const InputEvent& evt,
                           const Layout& layout) {
    if (session.state() == core::SessionState::Complete) {
        if ((IsLeftClick(evt) && layout.Hits(layout.winReturnButton(), evt.x, evt.y)) ||
            IsKey(evt, KeyCode::Enter) || IsKey(evt, KeyCode::Escape)) {
            return GameAction::ReturnToMenu;
        }
        return GameAction::None;
    }
    if (IsLeftClick(evt)) {
        return HandleGameClick(session, evt, layout);
    }
    if (evt.type == InputEventType::KeyDown) {
        return HandleGameKey(session, evt);
    }
    return GameAction::None;
}

std::string DifficultyLabel(const Strings& strings, core::Difficulty difficulty) {
    return strings.get("menu_diff_btn_" + std::to_string(core::DifficultyIndex(difficulty)));
}

std::string NotesStatus(const Strings& strings, bool notes_mode) {
    return strings.get("notes_mode_btn") +
           strings.get(notes_mode ? "notes_mode_on" : "notes_mode_off");
}

std::string MenuTitle(const Strings& strings, const MenuState& state) {
    std::ostringstream out;
    out << strings.get("menu_title");
    if (state.choosing_difficulty) {
        for (core::Difficulty difficulty : core::kDifficulties) {
            out << "  [" << core::DifficultyIndex(difficulty) + 1 << "] "
                << DifficultyLabel(strings, difficulty);
        }
    }
    return out.str();
}

std::string StatsTitle(const Strings& strings, const core::Statistics& stats) {
    std::ostringstream out;
    out << strings.get("stats_title");
    for (core::Difficulty difficulty : core::kDifficulties) {
        const auto& entry = stats.get(difficulty);
        out << " | " << DifficultyLabel(strings, difficulty) << ": "
            << strings.get("stats_best_time") << ' ' << core::FormatDuration(entry.best_ms)
            << ", " << strings.get("stats_avg_time") << ' '
            << core::FormatDuration(entry.averageMs()) << ", "
            << strings.get("stats_games_count") << ' ' << entry.games;
    }
    return out.str();
}

std::string GameTitle(const Strings& strings, const core::BoardView& view,
                      const std::optional<core::Completion>& completion) {
    std::ostringstream out;
    out << strings.get("game_title") << " - " << DifficultyLabel(strings, view.difficulty)
        << " - " << core::FormatDuration(view.elapsed_ms);
    switch (view.state) {
        case core::SessionState::Paused:
            out << " - " << strings.get("paused_txt");
            break;
        case core::SessionState::Complete:
            out << " - " << strings.get("win_txt_0") << ' ' << strings.get("win_txt_2") << ' '
                << core::FormatDuration(completion ? completion->time_ms : view.elapsed_ms);
            if (completion && completion->new_record) {
                out << ' ' << strings.get("win_txt_3");
            }
            break;
        default:
            out << " - " << NotesStatus(strings, view.notes_mode);
            break;
    }
    return out.str();
}

std::string FormatBoard(const core::BoardView& view) {
    std::ostringstream out;
    for (int row = 0; row < core::kGridSize; ++row) {
        if (row > 0 && row % core::kBoxSize == 0) {
            out << "------+-------+------\n";
        }
        for (int col = 0; col < core::kGridSize; ++col) {
            if (col > 0 && col % core::kBoxSize == 0) {
                out << "| ";
            }
            const auto& cell = view.at(row, col);
            out << (cell.value == core::kEmptyValue ? '.' : static_cast<char>('0' + cell.value))
                << ' ';
        }
        out << '\n';
    }
    return out.str();
}

}  // namespace sudoku::ui
