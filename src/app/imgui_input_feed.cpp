#include "app/imgui_input_feed.h"

namespace app
{
ImGuiKey ToImGuiKey(dscope::Key key)
{
    using dscope::Key;

    if (key >= Key::A && key <= Key::Z)
        return (ImGuiKey)(ImGuiKey_A + ((int)key - (int)Key::A));
    if (key >= Key::Num0 && key <= Key::Num9)
        return (ImGuiKey)(ImGuiKey_0 + ((int)key - (int)Key::Num0));
    if (key >= Key::F1 && key <= Key::F12)
        return (ImGuiKey)(ImGuiKey_F1 + ((int)key - (int)Key::F1));

    switch (key)
    {
        case Key::Left: return ImGuiKey_LeftArrow;
        case Key::Right: return ImGuiKey_RightArrow;
        case Key::Up: return ImGuiKey_UpArrow;
        case Key::Down: return ImGuiKey_DownArrow;
        case Key::Home: return ImGuiKey_Home;
        case Key::End: return ImGuiKey_End;
        case Key::PageUp: return ImGuiKey_PageUp;
        case Key::PageDown: return ImGuiKey_PageDown;
        case Key::Insert: return ImGuiKey_Insert;
        case Key::Delete: return ImGuiKey_Delete;
        case Key::Backspace: return ImGuiKey_Backspace;
        case Key::Enter: return ImGuiKey_Enter;
        case Key::KeypadEnter: return ImGuiKey_KeypadEnter;
        case Key::Escape: return ImGuiKey_Escape;
        case Key::Tab: return ImGuiKey_Tab;
        case Key::Space: return ImGuiKey_Space;
        case Key::Comma: return ImGuiKey_Comma;
        case Key::Minus: return ImGuiKey_Minus;
        case Key::Equal: return ImGuiKey_Equal;
        case Key::Period: return ImGuiKey_Period;
        case Key::Slash: return ImGuiKey_Slash;
        case Key::Semicolon: return ImGuiKey_Semicolon;
        case Key::Apostrophe: return ImGuiKey_Apostrophe;
        case Key::LeftBracket: return ImGuiKey_LeftBracket;
        case Key::RightBracket: return ImGuiKey_RightBracket;
        case Key::Backslash: return ImGuiKey_Backslash;
        case Key::GraveAccent: return ImGuiKey_GraveAccent;
        case Key::LeftCtrl: return ImGuiKey_LeftCtrl;
        case Key::RightCtrl: return ImGuiKey_RightCtrl;
        case Key::LeftShift: return ImGuiKey_LeftShift;
        case Key::RightShift: return ImGuiKey_RightShift;
        case Key::LeftAlt: return ImGuiKey_LeftAlt;
        case Key::RightAlt: return ImGuiKey_RightAlt;
        case Key::LeftSuper: return ImGuiKey_LeftSuper;
        case Key::RightSuper: return ImGuiKey_RightSuper;
        default: return ImGuiKey_None;
    }
}

static ImGuiMouseButton ToImGuiButton(dscope::PointerButton b)
{
    switch (b)
    {
        case dscope::PointerButton::Left: return ImGuiMouseButton_Left;
        case dscope::PointerButton::Right: return ImGuiMouseButton_Right;
        case dscope::PointerButton::Middle: return ImGuiMouseButton_Middle;
        case dscope::PointerButton::Back: return 3;
        case dscope::PointerButton::Forward: return 4;
    }
    return ImGuiMouseButton_Left;
}

static void AddModifiers(ImGuiIO& io, const dscope::Modifiers& m)
{
    io.AddKeyEvent(ImGuiMod_Ctrl, m.ctrl);
    io.AddKeyEvent(ImGuiMod_Shift, m.shift);
    io.AddKeyEvent(ImGuiMod_Alt, m.alt);
    io.AddKeyEvent(ImGuiMod_Super, m.super);
}

void FeedImGuiInput(const dscope::FrameContext& ctx)
{
    ImGuiIO& io = ImGui::GetIO();

    const dscope::Viewport& vp = ctx.viewport;
    io.DisplaySize = ImVec2(vp.width > 0.0f ? vp.width : 1.0f, vp.height > 0.0f ? vp.height : 1.0f);
    io.DisplayFramebufferScale = ImVec2(vp.scale, vp.scale);
    // ImGui asserts on a zero delta.
    io.DeltaTime = ctx.dt_s > 0.0 ? (float)ctx.dt_s : (1.0f / 60.0f);

    for (const dscope::InputEvent& ev : ctx.events)
    {
        if (const auto* m = ev.As<dscope::PointerMove>())
        {
            io.AddMousePosEvent(m->x, m->y);
        }
        else if (const auto* b = ev.As<dscope::PointerButtonEvent>())
        {
            io.AddMousePosEvent(b->x, b->y);
            io.AddMouseButtonEvent(ToImGuiButton(b->button), b->pressed);
        }
        else if (const auto* k = ev.As<dscope::KeyDown>())
        {
            AddModifiers(io, k->mods);
            const ImGuiKey key = ToImGuiKey(k->key);
            if (key != ImGuiKey_None)
                io.AddKeyEvent(key, true);
        }
        else if (const auto* k = ev.As<dscope::KeyUp>())
        {
            AddModifiers(io, k->mods);
            const ImGuiKey key = ToImGuiKey(k->key);
            if (key != ImGuiKey_None)
                io.AddKeyEvent(key, false);
        }
        else if (const auto* t = ev.As<dscope::TextInput>())
        {
            io.AddInputCharactersUTF8(t->utf8.c_str());
        }
        else if (const auto* s = ev.As<dscope::Scroll>())
        {
            // ImGui: +x scrolls left, +y scrolls up.
            io.AddMouseWheelEvent(s->dx, s->dy);
        }
        else if (const auto* f = ev.As<dscope::FocusChange>())
        {
            io.AddFocusEvent(f->focused);
        }
        // HostResize needs nothing here: DisplaySize follows the viewport snapshot.
    }
}
} // namespace app
