#include "core/input_translator.h"

namespace dscope
{
InputTranslator::InputTranslator(const KeyLayout* layout, std::uint32_t button_index_base)
    : layout_(layout), button_index_base_(button_index_base)
{
}

void InputTranslator::SetScale(float scale)
{
    // Guard against hosts reporting 0 while minimized.
    scale_ = (scale > 0.0f) ? scale : 1.0f;
}

bool InputTranslator::Reject()
{
    stats_.unrecognized++;
    return false;
}

bool InputTranslator::ResolveButton(std::uint32_t index, PointerButton& out) const
{
    if (index < button_index_base_)
        return false;
    switch (index - button_index_base_)
    {
        case 0: out = PointerButton::Left; return true;
        case 1: out = PointerButton::Middle; return true;
        case 2: out = PointerButton::Right; return true;
        case 3: out = PointerButton::Back; return true;
        case 4: out = PointerButton::Forward; return true;
        default: return false;
    }
}

void InputTranslator::ToLogical(const RawInput& raw, float& x, float& y) const
{
    if (raw.space == CoordSpace::Device)
    {
        x = raw.x / scale_;
        y = raw.y / scale_;
    }
    else
    {
        x = raw.x;
        y = raw.y;
    }
}

bool InputTranslator::Translate(const RawInput& raw, InputEvent& out)
{
    out = InputEvent{};
    out.timestamp_s = raw.timestamp_s;

    switch (raw.kind)
    {
        case RawInput::Kind::PointerMove:
        {
            PointerMove m;
            ToLogical(raw, m.x, m.y);
            out.payload = m;
            break;
        }
        case RawInput::Kind::PointerButton:
        {
            PointerButtonEvent b;
            if (!ResolveButton(raw.code, b.button))
                return Reject();
            b.pressed = raw.pressed;
            ToLogical(raw, b.x, b.y);
            out.payload = b;
            break;
        }
        case RawInput::Kind::Key:
        {
            const Key key = layout_ ? layout_->Resolve(raw.code) : Key::None;
            if (key == Key::None)
                return Reject();
            if (raw.pressed)
            {
                KeyDown k;
                k.key = key;
                k.mods = raw.mods;
                k.repeat = raw.repeat;
                out.payload = k;
            }
            else
            {
                KeyUp k;
                k.key = key;
                k.mods = raw.mods;
                out.payload = k;
            }
            break;
        }
        case RawInput::Kind::Text:
        {
            // Empty composition updates carry nothing for the UI.
            if (raw.text.empty())
                return false;
            out.payload = TextInput{raw.text};
            break;
        }
        case RawInput::Kind::Wheel:
        {
            if (raw.wheel_dx == 0.0f && raw.wheel_dy == 0.0f)
                return false;
            out.payload = Scroll{raw.wheel_dx, raw.wheel_dy};
            break;
        }
        case RawInput::Kind::Resize:
        {
            HostResize r;
            ToLogical(raw, r.width, r.height);
            r.scale = scale_;
            out.payload = r;
            break;
        }
        case RawInput::Kind::Focus:
        {
            out.payload = FocusChange{raw.focused};
            break;
        }
        default:
            return Reject();
    }

    stats_.translated++;
    return true;
}
} // namespace dscope
