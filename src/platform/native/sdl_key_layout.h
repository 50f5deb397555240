#pragma once

#include "core/input_translator.h"

namespace dscope
{
// SDL scancode -> current keyboard layout (SDL_GetKeyFromScancode) -> Key.
// Letters follow the layout ('Z' on a German keyboard is the key labelled Z),
// which is what chord strings like "Ctrl+Z" mean to the user.
class SdlKeyLayout final : public KeyLayout
{
public:
    Key Resolve(std::uint32_t host_code) const override;
};
} // namespace dscope
