#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace dscope
{
// Host-neutral logical keys. Host layouts (SDL keycodes, DOM `code` strings)
// resolve into this set; anything else is "unrecognized" and dropped.
enum class Key : std::uint16_t
{
    None = 0,

    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,

    Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,

    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,

    Left, Right, Up, Down,
    Home, End, PageUp, PageDown,
    Insert, Delete, Backspace,
    Enter, KeypadEnter, Escape, Tab, Space,

    Comma, Minus, Equal, Period, Slash, Semicolon, Apostrophe,
    LeftBracket, RightBracket, Backslash, GraveAccent,

    LeftCtrl, RightCtrl, LeftShift, RightShift,
    LeftAlt, RightAlt, LeftSuper, RightSuper,

    Count
};

enum class PointerButton : std::uint8_t
{
    Left = 0,
    Right,
    Middle,
    Back,
    Forward,
};

struct Modifiers
{
    bool ctrl  = false;
    bool shift = false;
    bool alt   = false;
    bool super = false;

    bool operator==(const Modifiers& o) const
    {
        return ctrl == o.ctrl && shift == o.shift && alt == o.alt && super == o.super;
    }
    bool operator!=(const Modifiers& o) const { return !(*this == o); }
};

// Payloads. Coordinates are always logical pixels (already divided by the
// host scale factor by the InputTranslator).
struct PointerMove
{
    float x = 0.0f;
    float y = 0.0f;
};

struct PointerButtonEvent
{
    PointerButton button = PointerButton::Left;
    bool  pressed = false;
    float x = 0.0f;
    float y = 0.0f;
};

struct KeyDown
{
    Key       key = Key::None;
    Modifiers mods;
    bool      repeat = false;
};

struct KeyUp
{
    Key       key = Key::None;
    Modifiers mods;
};

struct TextInput
{
    std::string utf8;
};

struct Scroll
{
    float dx = 0.0f;
    float dy = 0.0f;
};

struct HostResize
{
    float width = 0.0f;  // logical
    float height = 0.0f; // logical
    float scale = 1.0f;
};

struct FocusChange
{
    bool focused = false;
};

using EventPayload = std::variant<PointerMove,
                                  PointerButtonEvent,
                                  KeyDown,
                                  KeyUp,
                                  TextInput,
                                  Scroll,
                                  HostResize,
                                  FocusChange>;

struct InputEvent
{
    // Assigned by EventQueue::Push(); 0 means "not queued yet".
    std::uint64_t seq = 0;
    double        timestamp_s = 0.0;
    EventPayload  payload;

    template <typename T>
    const T* As() const { return std::get_if<T>(&payload); }
};

// Press/release classification used by the queue's backpressure policy.
// A pointer-button press or key-down (non-repeat) opens a pair; the matching
// release/key-up closes it.
bool IsPairOpen(const InputEvent& ev);
bool IsPairClose(const InputEvent& ev);
bool ClosesPair(const InputEvent& open, const InputEvent& close);

const char* EventKindName(const InputEvent& ev);
const char* KeyName(Key key);

// Convenience constructors (mostly for hosts and tests).
InputEvent MakeEvent(EventPayload payload, double timestamp_s = 0.0);
} // namespace dscope
