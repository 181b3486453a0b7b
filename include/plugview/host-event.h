#pragma once

#include <cstdint>

namespace plugview {

// Host modifier bits as delivered by the windowing layer.
namespace keymod {
constexpr uint32_t Shift = 1u << 0;
constexpr uint32_t Control = 1u << 1;
constexpr uint32_t Alt = 1u << 2;
constexpr uint32_t Meta = 1u << 3;
constexpr uint32_t CapsLock = 1u << 4;
constexpr uint32_t NumLock = 1u << 5;
constexpr uint32_t ScrollLock = 1u << 6;
constexpr uint32_t AltGraph = 1u << 7;
} // namespace keymod

enum class MouseButton : uint8_t {
    Left,
    Middle,
    Right,
    Back,
    Forward,
    Other
};

enum class ScrollUnit : uint8_t {
    Lines,
    Pixels
};

enum class KeyState : uint8_t {
    Down,
    Up
};

// Raw keyboard notification. Also forwarded untouched to the widget root.
struct KeyboardEvent {
    KeyState state;
    int key;           // host key code
    int scancode;
    uint32_t codepoint; // 0 when the key produces no text
    bool repeat;
    uint32_t modifiers; // keymod bits
};

//-----------------------------------------------------------------------------
// HostEvent - one raw notification from the host window.
// Positions and sizes are physical pixels.
//-----------------------------------------------------------------------------
struct HostEvent {
    enum class Type {
        None,
        // Mouse
        CursorMoved,
        ButtonPressed,
        ButtonReleased,
        WheelScrolled,
        CursorEntered,
        CursorLeft,
        // Drag and drop
        DragEntered,
        DragMoved,
        DragLeft,
        DragDropped,
        // Keyboard
        Keyboard,
        // Window
        Resized,
        Focused,
        Unfocused,
        WillClose
    };

    struct CursorEvent {
        double x;
        double y;
        uint32_t modifiers;
    };

    struct ButtonEvent {
        MouseButton button;
        uint8_t otherIndex; // host index when button == Other
        uint32_t modifiers;
    };

    struct WheelEvent {
        ScrollUnit unit;
        float x;
        float y;
        uint32_t modifiers;
    };

    struct DragEvent {
        double x;
        double y;
        uint32_t modifiers;
    };

    struct WindowInfo {
        uint32_t physicalWidth;
        uint32_t physicalHeight;
        double scale;
    };

    Type type = Type::None;

    union {
        CursorEvent cursor;
        ButtonEvent button;
        WheelEvent wheel;
        DragEvent drag;
        KeyboardEvent keyboard;
        WindowInfo window;
    };

    HostEvent() : cursor{0.0, 0.0, 0} {}

    static HostEvent cursorMoved(double x, double y, uint32_t mods = 0) {
        HostEvent e;
        e.type = Type::CursorMoved;
        e.cursor = {x, y, mods};
        return e;
    }

    static HostEvent buttonPressed(MouseButton b, uint32_t mods = 0, uint8_t otherIndex = 0) {
        HostEvent e;
        e.type = Type::ButtonPressed;
        e.button = {b, otherIndex, mods};
        return e;
    }

    static HostEvent buttonReleased(MouseButton b, uint32_t mods = 0, uint8_t otherIndex = 0) {
        HostEvent e;
        e.type = Type::ButtonReleased;
        e.button = {b, otherIndex, mods};
        return e;
    }

    static HostEvent wheelScrolled(ScrollUnit unit, float x, float y, uint32_t mods = 0) {
        HostEvent e;
        e.type = Type::WheelScrolled;
        e.wheel = {unit, x, y, mods};
        return e;
    }

    static HostEvent cursorEntered() {
        HostEvent e;
        e.type = Type::CursorEntered;
        return e;
    }

    static HostEvent cursorLeft() {
        HostEvent e;
        e.type = Type::CursorLeft;
        return e;
    }

    static HostEvent dragEvent(Type type, double x, double y, uint32_t mods = 0) {
        HostEvent e;
        e.type = type;
        e.drag = {x, y, mods};
        return e;
    }

    static HostEvent keyboardEvent(const KeyboardEvent& key) {
        HostEvent e;
        e.type = Type::Keyboard;
        e.keyboard = key;
        return e;
    }

    static HostEvent resized(uint32_t physicalWidth, uint32_t physicalHeight, double scale) {
        HostEvent e;
        e.type = Type::Resized;
        e.window = {physicalWidth, physicalHeight, scale};
        return e;
    }

    static HostEvent focused() {
        HostEvent e;
        e.type = Type::Focused;
        return e;
    }

    static HostEvent unfocused() {
        HostEvent e;
        e.type = Type::Unfocused;
        return e;
    }

    static HostEvent willClose() {
        HostEvent e;
        e.type = Type::WillClose;
        return e;
    }
};

} // namespace plugview
