#include "sudoku/platform/SdlInput.hpp"

#include <SDL2/SDL.h>

namespace sudoku::platform {

namespace {

MouseButton ToMouseButton(Uint8 button) {
    switch (button) {
        case SDL_BUTTON_LEFT:
            return MouseButton::Left;
        case SDL_BUTTON_RIGHT:
            return MouseButton::Right;
        case SDL_BUTTON_MIDDLE:
            return MouseButton::Middle;
        default:
            return MouseButton::Unknown;
    }
}

int ToDigit(SDL_Keycode key) {
    if (key >= SDLK_1 && key <= SDLK_9) {
        return static_cast<int>(key - SDLK_1) + 1;
    }
    if (key >= SDLK_KP_1 && key <= SDLK_KP_9) {
        return static_cast<int>(key - SDLK_KP_1) + 1;
    }
    return 0;
}

KeyCode ToKey(SDL_Keycode key) {
    switch (key) {
        case SDLK_ESCAPE:
            return KeyCode::Escape;
        case SDLK_UP:
            return KeyCode::Up;
        case SDLK_DOWN:
            return KeyCode::Down;
        case SDLK_LEFT:
            return KeyCode::Left;
        case SDLK_RIGHT:
            return KeyCode::Right;
        case SDLK_TAB:
            return KeyCode::Tab;
        case SDLK_SPACE:
            return KeyCode::Space;
        case SDLK_BACKSPACE:
            return KeyCode::Backspace;
        case SDLK_DELETE:
        case SDLK_KP_PERIOD:
            return KeyCode::Delete;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            return KeyCode::Enter;
        case SDLK_c:
            return KeyCode::C;
        case SDLK_l:
            return KeyCode::L;
        case SDLK_n:
            return KeyCode::N;
        case SDLK_q:
            return KeyCode::Q;
        case SDLK_r:
            return KeyCode::R;
        case SDLK_s:
            return KeyCode::S;
        case SDLK_z:
            return KeyCode::Z;
        default:
            return KeyCode::Unknown;
    }
}

}  // namespace

std::optional<InputEvent> TranslateEvent(const SDL_Event& sdl_event) {
    InputEvent evt;
    switch (sdl_event.type) {
        case SDL_QUIT:
            evt.type = InputEventType::Quit;
            return evt;
        case SDL_MOUSEMOTION:
            evt.type = InputEventType::MouseMove;
            evt.x = sdl_event.motion.x;
            evt.y = sdl_event.motion.y;
            return evt;
        case SDL_MOUSEBUTTONDOWN:
            evt.type = InputEventType::MouseButtonDown;
            evt.x = sdl_event.button.x;
            evt.y = sdl_event.button.y;
            evt.mouse_button = ToMouseButton(sdl_event.button.button);
            return evt;
        case SDL_KEYDOWN: {
            const SDL_Keycode sym = sdl_event.key.keysym.sym;
            evt.type = InputEventType::KeyDown;
            evt.ctrl = (sdl_event.key.keysym.mod & KMOD_CTRL) != 0;
            evt.digit = ToDigit(sym);
            evt.key = evt.digit != 0 ? KeyCode::Digit : ToKey(sym);
            if (evt.key == KeyCode::Unknown) {
                return std::nullopt;
            }
            return evt;
        }
        case SDL_WINDOWEVENT:
            if (sdl_event.window.event == SDL_WINDOWEVENT_RESTORED) {
                evt.type = InputEventType::WindowRestored;
                return evt;
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

SdlInput::~SdlInput() {
    Shutdown();
}

bool SdlInput::Initialize() {
    if (initialized_) {
        return true;
    }
    if (SDL_WasInit(SDL_INIT_EVENTS) == 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_INPUT, "SDL event subsystem is not initialized");
        return false;
    }
    // Digits arrive as key events; text input would duplicate them.
    SDL_StopTextInput();
    initialized_ = true;
    return true;
}

void SdlInput::Shutdown() {
    initialized_ = false;
}

std::vector<InputEvent> SdlInput::Poll() {
    std::vector<InputEvent> events;
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
        if (auto evt = TranslateEvent(sdl_event)) {
            events.push_back(*evt);
        }
    }
    return events;
}

}  // namespace sudoku::platform
