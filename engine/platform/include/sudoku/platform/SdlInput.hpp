#pragma once

#include <SDL2/SDL.h>

#include <optional>
#include <vector>

#include "sudoku/platform/InputEvents.hpp"

namespace sudoku::platform {

// Maps one SDL event; events the game does not use yield nullopt.
std::optional<InputEvent> TranslateEvent(const SDL_Event& sdl_event);

class SdlInput {
public:
    SdlInput() = default;
    ~SdlInput();

    bool Initialize();
    void Shutdown();
    std::vector<InputEvent> Poll();

private:
    bool initialized_ = false;
};

}  // namespace sudoku::platform
