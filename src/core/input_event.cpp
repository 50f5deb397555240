#include "core/input_event.h"

#include <utility>

namespace dscope
{
namespace
{
static const char* const kKeyNames[] = {
    "None",
    "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M",
    "N", "O", "P", "Q", "R", "S", "T", "U", "V", "W", "X", "Y", "Z",
    "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
    "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12",
    "Left", "Right", "Up", "Down",
    "Home", "End", "PageUp", "PageDown",
    "Insert", "Delete", "Backspace",
    "Enter", "KeypadEnter", "Escape", "Tab", "Space",
    "Comma", "Minus", "Equal", "Period", "Slash", "Semicolon", "Apostrophe",
    "LeftBracket", "RightBracket", "Backslash", "GraveAccent",
    "LeftCtrl", "RightCtrl", "LeftShift", "RightShift",
    "LeftAlt", "RightAlt", "LeftSuper", "RightSuper",
};
static_assert(sizeof(kKeyNames) / sizeof(kKeyNames[0]) == (size_t)Key::Count,
              "kKeyNames must match the Key enum");
} // namespace

bool IsPairOpen(const InputEvent& ev)
{
    if (const auto* b = ev.As<PointerButtonEvent>())
        return b->pressed;
    if (const auto* k = ev.As<KeyDown>())
        return !k->repeat;
    return false;
}

bool IsPairClose(const InputEvent& ev)
{
    if (const auto* b = ev.As<PointerButtonEvent>())
        return !b->pressed;
    return ev.As<KeyUp>() != nullptr;
}

bool ClosesPair(const InputEvent& open, const InputEvent& close)
{
    if (!IsPairOpen(open) || !IsPairClose(close))
        return false;

    const auto* ob = open.As<PointerButtonEvent>();
    const auto* cb = close.As<PointerButtonEvent>();
    if (ob && cb)
        return ob->button == cb->button;

    const auto* kd = open.As<KeyDown>();
    const auto* ku = close.As<KeyUp>();
    if (kd && ku)
        return kd->key == ku->key;

    return false;
}

const char* EventKindName(const InputEvent& ev)
{
    switch (ev.payload.index())
    {
        case 0: return "pointer-move";
        case 1: return "pointer-button";
        case 2: return "key-down";
        case 3: return "key-up";
        case 4: return "text-input";
        case 5: return "scroll";
        case 6: return "host-resize";
        case 7: return "focus-change";
        default: return "unknown";
    }
}

const char* KeyName(Key key)
{
    const size_t idx = (size_t)key;
    if (idx >= (size_t)Key::Count)
        return "None";
    return kKeyNames[idx];
}

InputEvent MakeEvent(EventPayload payload, double timestamp_s)
{
    InputEvent ev;
    ev.timestamp_s = timestamp_s;
    ev.payload = std::move(payload);
    return ev;
}
} // namespace dscope
