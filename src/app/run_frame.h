#pragma once

struct AppState;

namespace dscope
{
struct FrameContext;
struct FrameOutput;
}

namespace app
{
// The UI logic handed to the FrameDriver: feed input to ImGui, handle key
// bindings and clipboard results, advance the scan, build the window and
// finish the ImGui frame into `out.draw`.
void RunFrame(AppState& st, const dscope::FrameContext& ctx, dscope::FrameOutput& out);
} // namespace app
