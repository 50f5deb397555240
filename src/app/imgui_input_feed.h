#pragma once

#include "imgui.h"

#include "core/frame_context.h"

namespace app
{
ImGuiKey ToImGuiKey(dscope::Key key);

// Feeds one frame of host-neutral input into ImGuiIO: display size and scale,
// delta time, then every event in sequence order. Replaces a platform backend,
// so the same code drives ImGui on the desktop and in the browser.
void FeedImGuiInput(const dscope::FrameContext& ctx);
} // namespace app
