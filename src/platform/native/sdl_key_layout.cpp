#include "platform/native/sdl_key_layout.h"

#include <SDL3/SDL.h>

namespace dscope
{
static Key KeyFromSdlKeycode(SDL_Keycode k)
{
    if (k >= SDLK_A && k <= SDLK_Z)
        return (Key)((int)Key::A + (int)(k - SDLK_A));
    if (k >= SDLK_0 && k <= SDLK_9)
        return (Key)((int)Key::Num0 + (int)(k - SDLK_0));
    if (k >= SDLK_F1 && k <= SDLK_F12)
        return (Key)((int)Key::F1 + (int)(k - SDLK_F1));

    switch (k)
    {
        case SDLK_LEFT: return Key::Left;
        case SDLK_RIGHT: return Key::Right;
        case SDLK_UP: return Key::Up;
        case SDLK_DOWN: return Key::Down;
        case SDLK_HOME: return Key::Home;
        case SDLK_END: return Key::End;
        case SDLK_PAGEUP: return Key::PageUp;
        case SDLK_PAGEDOWN: return Key::PageDown;
        case SDLK_INSERT: return Key::Insert;
        case SDLK_DELETE: return Key::Delete;
        case SDLK_BACKSPACE: return Key::Backspace;
        case SDLK_RETURN: return Key::Enter;
        case SDLK_KP_ENTER: return Key::KeypadEnter;
        case SDLK_ESCAPE: return Key::Escape;
        case SDLK_TAB: return Key::Tab;
        case SDLK_SPACE: return Key::Space;
        case SDLK_COMMA: return Key::Comma;
        case SDLK_MINUS: return Key::Minus;
        case SDLK_EQUALS: return Key::Equal;
        case SDLK_PERIOD: return Key::Period;
        case SDLK_SLASH: return Key::Slash;
        case SDLK_SEMICOLON: return Key::Semicolon;
        case SDLK_APOSTROPHE: return Key::Apostrophe;
        case SDLK_LEFTBRACKET: return Key::LeftBracket;
        case SDLK_RIGHTBRACKET: return Key::RightBracket;
        case SDLK_BACKSLASH: return Key::Backslash;
        case SDLK_GRAVE: return Key::GraveAccent;
        case SDLK_LCTRL: return Key::LeftCtrl;
        case SDLK_RCTRL: return Key::RightCtrl;
        case SDLK_LSHIFT: return Key::LeftShift;
        case SDLK_RSHIFT: return Key::RightShift;
        case SDLK_LALT: return Key::LeftAlt;
        case SDLK_RALT: return Key::RightAlt;
        case SDLK_LGUI: return Key::LeftSuper;
        case SDLK_RGUI: return Key::RightSuper;
        default: return Key::None;
    }
}

Key SdlKeyLayout::Resolve(std::uint32_t host_code) const
{
    const SDL_Scancode sc = (SDL_Scancode)host_code;
    if (sc <= SDL_SCANCODE_UNKNOWN || sc >= SDL_SCANCODE_COUNT)
        return Key::None;

    return KeyFromSdlKeycode(SDL_GetKeyFromScancode(sc, SDL_KMOD_NONE, false));
}
} // namespace dscope
