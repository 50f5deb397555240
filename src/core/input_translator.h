#pragma once

#include <cstdint>
#include <string>

#include "core/input_event.h"

namespace dscope
{
// Resolves host key codes into logical keys.
// Native: SDL scancode -> keyboard layout service -> Key.
// Browser: DOM KeyboardEvent.code -> Key.
class KeyLayout
{
public:
    virtual ~KeyLayout() = default;

    // Returns Key::None for codes with no logical mapping.
    virtual Key Resolve(std::uint32_t host_code) const = 0;
};

enum class CoordSpace : std::uint8_t
{
    Logical = 0, // already in UI units (SDL window coords, CSS pixels)
    Device,      // physical pixels; divided by the scale factor
};

// One host input record, before normalization.
struct RawInput
{
    enum class Kind : std::uint8_t
    {
        PointerMove,
        PointerButton,
        Key,
        Text,
        Wheel,
        Resize,
        Focus,
    };

    Kind       kind = Kind::PointerMove;
    double     timestamp_s = 0.0;
    CoordSpace space = CoordSpace::Logical;

    // Pointer position (PointerMove/PointerButton) or surface size (Resize).
    float x = 0.0f;
    float y = 0.0f;

    // Wheel deltas in lines: +y scrolls content up (towards the top), +x towards the left.
    float wheel_dx = 0.0f;
    float wheel_dy = 0.0f;

    // Key: host key code. PointerButton: host button index.
    std::uint32_t code = 0;

    bool pressed = false; // PointerButton/Key: down
    bool repeat  = false; // Key: auto-repeat
    bool focused = false; // Focus

    Modifiers   mods;
    std::string text; // Text: UTF-8
};

struct TranslatorStats
{
    std::uint64_t translated = 0;
    std::uint64_t unrecognized = 0;
};

// Maps RawInput into host-neutral InputEvents.
//
// Coordinates tagged CoordSpace::Device are divided by the current scale factor;
// logical coordinates pass through. The rule is the same on every host, so UI code
// never branches on the host type.
class InputTranslator
{
public:
    // `button_index_base` is the host index of the left button: SDL numbers
    // buttons from 1, the DOM from 0. Both use the order left, middle, right,
    // back, forward.
    InputTranslator(const KeyLayout* layout, std::uint32_t button_index_base);

    void  SetScale(float scale);
    float Scale() const { return scale_; }

    // Returns false (and bumps `unrecognized`) when the record cannot be mapped.
    bool Translate(const RawInput& raw, InputEvent& out);

    const TranslatorStats& Stats() const { return stats_; }

private:
    bool ResolveButton(std::uint32_t index, PointerButton& out) const;
    void ToLogical(const RawInput& raw, float& x, float& y) const;
    bool Reject();

    const KeyLayout* layout_ = nullptr;
    std::uint32_t    button_index_base_ = 0;
    float            scale_ = 1.0f;
    TranslatorStats  stats_;
};
} // namespace dscope
