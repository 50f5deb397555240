#include "platform/web/dom_key_layout.h"

#include <iterator>

namespace dscope
{
namespace
{
struct DomKey
{
    const char* code;
    Key         key;
};

// Host code = index + 1.
static const DomKey kDomKeys[] = {
    {"KeyA", Key::A}, {"KeyB", Key::B}, {"KeyC", Key::C}, {"KeyD", Key::D}, {"KeyE", Key::E},
    {"KeyF", Key::F}, {"KeyG", Key::G}, {"KeyH", Key::H}, {"KeyI", Key::I}, {"KeyJ", Key::J},
    {"KeyK", Key::K}, {"KeyL", Key::L}, {"KeyM", Key::M}, {"KeyN", Key::N}, {"KeyO", Key::O},
    {"KeyP", Key::P}, {"KeyQ", Key::Q}, {"KeyR", Key::R}, {"KeyS", Key::S}, {"KeyT", Key::T},
    {"KeyU", Key::U}, {"KeyV", Key::V}, {"KeyW", Key::W}, {"KeyX", Key::X}, {"KeyY", Key::Y},
    {"KeyZ", Key::Z},

    {"Digit0", Key::Num0}, {"Digit1", Key::Num1}, {"Digit2", Key::Num2}, {"Digit3", Key::Num3},
    {"Digit4", Key::Num4}, {"Digit5", Key::Num5}, {"Digit6", Key::Num6}, {"Digit7", Key::Num7},
    {"Digit8", Key::Num8}, {"Digit9", Key::Num9},

    {"F1", Key::F1}, {"F2", Key::F2}, {"F3", Key::F3}, {"F4", Key::F4}, {"F5", Key::F5}, {"F6", Key::F6},
    {"F7", Key::F7}, {"F8", Key::F8}, {"F9", Key::F9}, {"F10", Key::F10}, {"F11", Key::F11}, {"F12", Key::F12},

    {"ArrowLeft", Key::Left}, {"ArrowRight", Key::Right}, {"ArrowUp", Key::Up}, {"ArrowDown", Key::Down},
    {"Home", Key::Home}, {"End", Key::End}, {"PageUp", Key::PageUp}, {"PageDown", Key::PageDown},
    {"Insert", Key::Insert}, {"Delete", Key::Delete}, {"Backspace", Key::Backspace},
    {"Enter", Key::Enter}, {"NumpadEnter", Key::KeypadEnter}, {"Escape", Key::Escape},
    {"Tab", Key::Tab}, {"Space", Key::Space},

    {"Comma", Key::Comma}, {"Minus", Key::Minus}, {"Equal", Key::Equal}, {"Period", Key::Period},
    {"Slash", Key::Slash}, {"Semicolon", Key::Semicolon}, {"Quote", Key::Apostrophe},
    {"BracketLeft", Key::LeftBracket}, {"BracketRight", Key::RightBracket},
    {"Backslash", Key::Backslash}, {"Backquote", Key::GraveAccent},

    {"ControlLeft", Key::LeftCtrl}, {"ControlRight", Key::RightCtrl},
    {"ShiftLeft", Key::LeftShift}, {"ShiftRight", Key::RightShift},
    {"AltLeft", Key::LeftAlt}, {"AltRight", Key::RightAlt},
    {"MetaLeft", Key::LeftSuper}, {"MetaRight", Key::RightSuper},
    // Older Firefox
    {"OSLeft", Key::LeftSuper}, {"OSRight", Key::RightSuper},
};
} // namespace

std::uint32_t DomKeyLayout::CodeFromDom(std::string_view dom_code)
{
    for (size_t i = 0; i < std::size(kDomKeys); ++i)
        if (dom_code == kDomKeys[i].code)
            return (std::uint32_t)(i + 1);
    return 0;
}

Key DomKeyLayout::Resolve(std::uint32_t host_code) const
{
    if (host_code == 0 || host_code > std::size(kDomKeys))
        return Key::None;
    return kDomKeys[host_code - 1].key;
}
} // namespace dscope
