#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "core/frame_context.h"
#include "core/host_error.h"

namespace dscope
{
class AccessibilityBridge;
class ClipboardBridge;
class HostAdapter;

// The per-frame control loop.
//
//   Idle -> Draining     poll host, drain the event queue, collect clipboard results,
//                        build the FrameContext
//        -> Dispatching  run the UI logic synchronously, collect FrameOutput
//        -> Presenting   present draw commands, forward clipboard requests and
//                        announcements to the bridges
//        -> Idle
//
// A failed present moves the driver to Stopped (terminal). So does a stop
// requested by the UI. Once Stopped, Tick() does nothing.
class FrameDriver
{
public:
    enum class State : std::uint8_t
    {
        Idle = 0,
        Draining,
        Dispatching,
        Presenting,
        Stopped,
    };

    enum class TickResult : std::uint8_t
    {
        Presented = 0,
        Stopped,
    };

    using UiLogic = std::function<void(const FrameContext& ctx, FrameOutput& out)>;

    FrameDriver(HostAdapter& host, ClipboardBridge& clipboard, AccessibilityBridge& a11y, UiLogic ui);

    // One cycle; called once per host animation tick.
    TickResult Tick();

    State GetState() const { return state_; }
    bool  IsStopped() const { return state_ == State::Stopped; }

    // HostError::None when stopped on request, PresentationLost after a surface loss.
    HostError          StopReason() const { return stop_reason_; }
    const std::string& StopMessage() const { return stop_message_; }

    std::uint64_t FramesPresented() const { return frames_presented_; }

private:
    void Stop(HostError reason, std::string message);
    void ForwardSideEffects(FrameOutput& out);

    HostAdapter&         host_;
    ClipboardBridge&     clipboard_;
    AccessibilityBridge& a11y_;
    UiLogic              ui_;

    State         state_ = State::Idle;
    HostError     stop_reason_ = HostError::None;
    std::string   stop_message_;
    std::uint64_t frame_index_ = 0;
    std::uint64_t frames_presented_ = 0;
    double        last_time_s_ = -1.0;
};

const char* FrameStateName(FrameDriver::State s);
} // namespace dscope
