#include <SDL2/SDL.h>
#include <SDL2/SDL_main.h>

#include <cstdint>
#include <random>
#include <string>
#include <utility>

#include "sudoku/core/GameConfig.hpp"
#include "sudoku/core/GameSession.hpp"
#include "sudoku/core/Generator.hpp"
#include "sudoku/core/ProfileStore.hpp"
#include "sudoku/core/Statistics.hpp"
#include "sudoku/platform/AudioSystem.hpp"
#include "sudoku/platform/InputEvents.hpp"
#include "sudoku/platform/SdlInput.hpp"
#include "sudoku/platform/SdlSaveService.hpp"
#include "sudoku/ui/Screens.hpp"
#include "sudoku/ui/Strings.hpp"

using sudoku::platform::AudioSystem;
using sudoku::platform::InputEvent;
using sudoku::platform::InputEventType;
using sudoku::platform::SdlInput;
using sudoku::platform::SdlSaveService;

namespace core = sudoku::core;
namespace ui = sudoku::ui;

namespace {

constexpr Uint32 kFrameDelayMs = 16;
constexpr Uint32 kTitleRefreshMs = 250;

struct AppContext {
    AppContext(core::ProfileStore& store, core::GameConfig cfg, std::uint32_t seed)
        : profile(store), config(cfg), session(store, cfg, seed) {}

    core::ProfileStore& profile;
    core::GameConfig config;
    core::GameSession session;
    ui::Strings strings;
    ui::Screen screen = ui::Screen::Menu;
    ui::MenuState menu;
    core::Statistics stats;
    const AudioSystem* audio = nullptr;
    bool running = true;
};

void PlayClick(const AppContext& ctx) {
    if (ctx.audio) {
        ctx.audio->PlayClick();
    }
}

void PlayError(const AppContext& ctx) {
    if (ctx.audio) {
        ctx.audio->PlayError();
    }
}

void LogProfileError(const core::ProfileStore& profile, const char* what) {
    if (!profile.lastError().empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s: %s", what, profile.lastError().c_str());
    }
}

void SaveCurrentGame(AppContext& ctx) {
    const auto state = ctx.session.state();
    if (state != core::SessionState::InProgress && state != core::SessionState::Paused) {
        return;
    }
    ctx.session.pause();
    if (ctx.profile.storeSavedGame(ctx.session.toSavedGame())) {
        ctx.menu.can_continue = true;
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Saved %s game at %s",
                    core::ToString(ctx.session.difficulty()),
                    core::FormatDuration(ctx.session.elapsedMs()).c_str());
    } else {
        LogProfileError(ctx.profile, "Saving game failed");
        // The paused session itself can still be continued this run.
        ctx.menu.can_continue = true;
    }
}

void StartNewGame(AppContext& ctx, core::Difficulty difficulty) {
    try {
        ctx.session.newGame(difficulty);
    } catch (const core::GenerationError& ex) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Puzzle generation failed: %s", ex.what());
        PlayError(ctx);
        return;
    }
    if (!ctx.profile.clearSavedGame()) {
        LogProfileError(ctx.profile, "Clearing old saved game failed");
    }
    ctx.menu.can_continue = false;
    ctx.screen = ui::Screen::Game;
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "New %s game with %d clues",
                core::ToString(difficulty), ctx.session.board().clueCount());
}

void ContinueGame(AppContext& ctx) {
    if (ctx.session.state() == core::SessionState::Paused) {
        ctx.session.unpause();
        ctx.screen = ui::Screen::Game;
        return;
    }
    auto saved = ctx.profile.loadSavedGame();
    if (!saved) {
        LogProfileError(ctx.profile, "Loading saved game failed");
        ctx.menu.can_continue = false;
        PlayError(ctx);
        return;
    }
    if (!ctx.session.resume(*saved)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Saved game is already complete; discarding");
        if (!ctx.profile.clearSavedGame()) {
            LogProfileError(ctx.profile, "Clearing saved game failed");
        }
        ctx.menu.can_continue = false;
        return;
    }
    ctx.screen = ui::Screen::Game;
}

void ChangeLanguage(AppContext& ctx) {
    const ui::Language next = ui::NextLanguage(ctx.strings.language());
    ctx.strings = ui::Strings::Load(next);
    ctx.config.language = ui::LanguageCode(next);
    ctx.session.setConfig(ctx.config);
    if (!ctx.profile.saveConfig(ctx.config)) {
        LogProfileError(ctx.profile, "Saving config failed");
    }
}

void OpenStats(AppContext& ctx) {
    ctx.stats = ctx.profile.loadStatistics();
    LogProfileError(ctx.profile, "Loading statistics failed");
    ctx.screen = ui::Screen::Stats;
}

void HandleMenu(AppContext& ctx, const InputEvent& evt, const ui::Layout& layout) {
    switch (ui::HandleMenuEvent(ctx.menu, evt, layout)) {
        case ui::MenuAction::None:
            break;
        case ui::MenuAction::Continue:
            PlayClick(ctx);
            ContinueGame(ctx);
            break;
        case ui::MenuAction::ChooseDifficulty:
        case ui::MenuAction::CancelDifficulty:
            PlayClick(ctx);
            break;
        case ui::MenuAction::StartGame:
            PlayClick(ctx);
            StartNewGame(ctx, ctx.menu.chosen);
            break;
        case ui::MenuAction::Stats:
            PlayClick(ctx);
            OpenStats(ctx);
            break;
        case ui::MenuAction::CycleLanguage:
            PlayClick(ctx);
            ChangeLanguage(ctx);
            break;
        case ui::MenuAction::Quit:
            ctx.running = false;
            break;
    }
}

void HandleStats(AppContext& ctx, const InputEvent& evt, const ui::Layout& layout) {
    switch (ui::HandleStatsEvent(evt, layout)) {
        case ui::StatsAction::None:
            break;
        case ui::StatsAction::Back:
            PlayClick(ctx);
            ctx.screen = ui::Screen::Menu;
            break;
        case ui::StatsAction::Reset:
            PlayClick(ctx);
            ctx.stats.reset();
            if (!ctx.profile.saveStatistics(ctx.stats)) {
                LogProfileError(ctx.profile, "Resetting statistics failed");
            }
            break;
    }
}

void HandleGame(AppContext& ctx, const InputEvent& evt, const ui::Layout& layout) {
    switch (ui::HandleGameEvent(ctx.session, evt, layout)) {
        case ui::GameAction::None:
            break;
        case ui::GameAction::Accepted:
            PlayClick(ctx);
            break;
        case ui::GameAction::Rejected:
            PlayError(ctx);
            break;
        case ui::GameAction::Completed: {
            if (ctx.audio) {
                ctx.audio->PlayWin();
            }
            const auto& done = ctx.session.completion();
            if (done) {
                SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Solved %s in %s%s",
                            core::ToString(done->difficulty),
                            core::FormatDuration(done->time_ms).c_str(),
                            done->new_record ? " (new record)" : "");
                if (!done->profile_error.empty()) {
                    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Recording result failed: %s",
                                done->profile_error.c_str());
                }
            }
            ctx.menu.can_continue = false;
            break;
        }
        case ui::GameAction::ReturnToMenu:
            PlayClick(ctx);
            SaveCurrentGame(ctx);
            ctx.screen = ui::Screen::Menu;
            break;
    }
}

void Dispatch(AppContext& ctx, const InputEvent& evt, const ui::Layout& layout) {
    if (evt.type == InputEventType::Quit) {
        ctx.running = false;
        return;
    }
    switch (ctx.screen) {
        case ui::Screen::Menu:
            HandleMenu(ctx, evt, layout);
            break;
        case ui::Screen::Stats:
            HandleStats(ctx, evt, layout);
            break;
        case ui::Screen::Game:
            HandleGame(ctx, evt, layout);
            break;
    }
}

std::string CurrentTitle(const AppContext& ctx) {
    switch (ctx.screen) {
        case ui::Screen::Menu:
            return ui::MenuTitle(ctx.strings, ctx.menu);
        case ui::Screen::Stats:
            return ui::StatsTitle(ctx.strings, ctx.stats);
        case ui::Screen::Game:
            return ui::GameTitle(ctx.strings, ctx.session.view(), ctx.session.completion());
    }
    return "Sudoku";
}

}  // namespace

int main(int /*argc*/, char* /*argv*/[]) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_EVENTS) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    SdlSaveService save_service({});
    if (!save_service.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Progress will not be saved");
    }
    core::ProfileStore profile(save_service);
    core::GameConfig config = profile.loadConfig();
    LogProfileError(profile, "Loading config failed");

    ui::Language language = ui::Language::English;
    if (auto parsed = ui::ParseLanguage(config.language)) {
        language = *parsed;
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown language %s, using %s",
                    config.language.c_str(), ui::LanguageCode(language));
        config.language = ui::LanguageCode(language);
    }

    AudioSystem audio;
    bool audio_ready = false;
    if (config.sound_on) {
        audio_ready = audio.Initialize();
        if (!audio_ready) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Audio disabled: %s", Mix_GetError());
        }
    }

    SDL_Window* window = SDL_CreateWindow("Sudoku", SDL_WINDOWPOS_CENTERED,
                                          SDL_WINDOWPOS_CENTERED, config.window_size[0],
                                          config.window_size[1],
                                          SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        audio.Shutdown();
        SDL_Quit();
        return 1;
    }

    SdlInput input;
    if (!input.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SdlInput initialization failed: %s",
                    SDL_GetError());
    }

    AppContext ctx(profile, config, std::random_device{}());
    ctx.strings = ui::Strings::Load(language);
    ctx.audio = audio_ready ? &audio : nullptr;
    ctx.menu.can_continue = profile.hasSavedGame();

    std::string last_title;
    Uint32 last_title_tick = 0;
    while (ctx.running) {
        int window_width = 0;
        int window_height = 0;
        SDL_GetWindowSize(window, &window_width, &window_height);
        const ui::Layout layout(window_width, window_height);

        for (const auto& evt : input.Poll()) {
            Dispatch(ctx, evt, layout);
            if (!ctx.running) {
                break;
            }
        }

        const Uint32 now = SDL_GetTicks();
        if (now - last_title_tick >= kTitleRefreshMs) {
            last_title_tick = now;
            std::string title = CurrentTitle(ctx);
            if (title != last_title) {
                SDL_SetWindowTitle(window, title.c_str());
                last_title = std::move(title);
                if (ctx.screen == ui::Screen::Game) {
                    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "\n%s",
                                 ui::FormatBoard(ctx.session.view()).c_str());
                }
            }
        }
        SDL_Delay(kFrameDelayMs);
    }

    SaveCurrentGame(ctx);
    if (!profile.saveConfig(ctx.config)) {
        LogProfileError(profile, "Saving config failed");
    }

    input.Shutdown();
    SDL_DestroyWindow(window);
    audio.Shutdown();
    SDL_Quit();
    return 0;
}
