#include "core/frame_driver.h"

#include <cstdio>
#include <utility>

#include "core/accessibility_bridge.h"
#include "core/clipboard_bridge.h"
#include "core/host_adapter.h"

namespace dscope
{
const char* FrameStateName(FrameDriver::State s)
{
    switch (s)
    {
        case FrameDriver::State::Idle: return "idle";
        case FrameDriver::State::Draining: return "draining";
        case FrameDriver::State::Dispatching: return "dispatching";
        case FrameDriver::State::Presenting: return "presenting";
        case FrameDriver::State::Stopped: return "stopped";
        default: return "unknown";
    }
}

FrameDriver::FrameDriver(HostAdapter& host, ClipboardBridge& clipboard, AccessibilityBridge& a11y, UiLogic ui)
    : host_(host), clipboard_(clipboard), a11y_(a11y), ui_(std::move(ui))
{
}

void FrameDriver::Stop(HostError reason, std::string message)
{
    state_ = State::Stopped;
    stop_reason_ = reason;
    stop_message_ = std::move(message);
}

void FrameDriver::ForwardSideEffects(FrameOutput& out)
{
    for (ClipboardRequest& r : out.clipboard)
    {
        if (r.op == ClipboardOp::Write)
            (void)clipboard_.Write(r.tag, std::move(r.payload));
        else
            (void)clipboard_.Read(r.tag, r.mime_type);
    }
    for (const Announcement& a : out.announcements)
        a11y_.Announce(a);
}

FrameDriver::TickResult FrameDriver::Tick()
{
    if (state_ == State::Stopped)
        return TickResult::Stopped;

    // Draining
    state_ = State::Draining;
    a11y_.BeginFrame();
    host_.BeginFrame();

    FrameContext ctx(host_.Capabilities());
    ctx.frame_index = frame_index_++;
    ctx.time_s = host_.NowSeconds();
    ctx.dt_s = (last_time_s_ < 0.0) ? 0.0 : (ctx.time_s - last_time_s_);
    if (ctx.dt_s < 0.0)
        ctx.dt_s = 0.0;
    last_time_s_ = ctx.time_s;
    // Pump first so the snapshot matches the events of this frame.
    ctx.events = host_.PollEvents();
    ctx.viewport = host_.CurrentViewport();
    ctx.modifiers = host_.CurrentModifiers();
    ctx.clipboard = clipboard_.TakeCompleted();

    // Dispatching
    state_ = State::Dispatching;
    FrameOutput out;
    if (ui_)
        ui_(ctx, out);

    // Presenting
    state_ = State::Presenting;
    std::string err;
    if (!host_.PresentFrame(out.draw, err))
    {
        std::fprintf(stderr, "[host] presentation surface lost: %s\n", err.c_str());
        Stop(HostError::PresentationLost, err);
        return TickResult::Stopped;
    }
    frames_presented_++;

    ForwardSideEffects(out);

    if (out.stop_requested)
    {
        Stop(HostError::None, "stop requested");
        return TickResult::Stopped;
    }

    state_ = State::Idle;
    return TickResult::Presented;
}
} // namespace dscope
