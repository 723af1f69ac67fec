#pragma once

namespace sudoku::platform {

enum class InputEventType {
    Quit,
    MouseMove,
    MouseButtonDown,
    KeyDown,
    WindowRestored
};

enum class MouseButton { Left, Right, Middle, Unknown };

enum class KeyCode {
    Digit,
    Escape,
    Up,
    Down,
    Left,
    Right,
    Tab,
    Space,
    Backspace,
    Delete,
    Enter,
    C,
    L,
    N,
    Q,
    R,
    S,
    Z,
    Unknown
};

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    int x = 0;
    int y = 0;
    MouseButton mouse_button = MouseButton::Unknown;
    KeyCode key = KeyCode::Unknown;
    // 1..9 when key is KeyCode::Digit (number row or keypad).
    int digit = 0;
    bool ctrl = false;
};

}  // namespace sudoku::platform
