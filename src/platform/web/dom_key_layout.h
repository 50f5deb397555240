#pragma once

#include <cstdint>
#include <string_view>

#include "core/input_translator.h"

namespace dscope
{
// DOM `KeyboardEvent.code` -> Key.
//
// `code` names the physical key ("KeyA", "Enter", "NumpadEnter"), independent of
// the active layout. The browser adapter turns the string into a compact host
// code with CodeFromDom() before handing it to the translator, so the raw record
// stays a plain integer like on the native host.
class DomKeyLayout final : public KeyLayout
{
public:
    // 0 for codes with no mapping.
    static std::uint32_t CodeFromDom(std::string_view dom_code);

    Key Resolve(std::uint32_t host_code) const override;
};
} // namespace dscope
