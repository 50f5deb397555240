#pragma once

#include <string>
#include <vector>

#include "core/event_queue.h"
#include "core/frame_context.h"
#include "core/host_capabilities.h"
#include "core/input_event.h"

namespace dscope
{
class AccessibilityBackend;
class ClipboardBackend;

// Startup parameters shared by every host.
struct HostConfig
{
    std::string title = "Dirscope";

    // Initial logical window size; ignored by hosts that size to their container.
    int  window_w = 1280;
    int  window_h = 800;
    int  window_x = 0;
    int  window_y = 0;
    bool window_pos_valid = false;
    bool window_maximized = false;

    bool accessibility_enabled = true;
};

// The platform seam. One implementation per host, chosen at build time:
// SdlHostAdapter (native) and WebHostAdapter (browser).
//
// Both variants feed translated input into the shared EventQueue: the native one
// from its polling pump, the browser one from DOM callbacks that may fire between
// frames. PollEvents() pumps the host and drains the queue, so the caller cannot
// tell the two apart.
class HostAdapter
{
public:
    explicit HostAdapter(EventQueue& queue) : queue_(queue) {}
    virtual ~HostAdapter() = default;

    HostAdapter(const HostAdapter&) = delete;
    HostAdapter& operator=(const HostAdapter&) = delete;

    // Creates the window/canvas and the presentation surface and fills Capabilities().
    virtual bool Initialize(const HostConfig& cfg, std::string& err) = 0;
    virtual void Shutdown() = 0;

    // Non-blocking. Returns every event received since the previous call (possibly none).
    std::vector<InputEvent> PollEvents()
    {
        PumpEvents();
        return queue_.Drain();
    }

    // Host-side preparation before the UI pass (swapchain resize, renderer NewFrame).
    virtual void BeginFrame() {}

    // Submits the finished frame. Returns false when the surface is gone (window
    // destroyed, device/context lost); `err` describes the loss. Fatal for the caller.
    virtual bool PresentFrame(const DrawCommands& draw, std::string& err) = 0;

    const HostCapabilities& Capabilities() const { return caps_; }

    virtual double    NowSeconds() const = 0;
    virtual Viewport  CurrentViewport() const = 0;
    virtual Modifiers CurrentModifiers() const = 0;

    // Style scale for displays whose logical pixels are small (desktop content scale).
    virtual float UiScale() const { return 1.0f; }

    // True once the user closed the window. The present failure that follows is
    // the normal end of a native session rather than a crash of the surface.
    virtual bool CloseRequested() const { return false; }

    // Null when the host has no such service.
    virtual ClipboardBackend*     Clipboard() = 0;
    virtual AccessibilityBackend* Accessibility() = 0;

protected:
    // Moves pending host input into queue_. Callback-driven hosts have
    // already pushed by the time this runs.
    virtual void PumpEvents() = 0;

    EventQueue&      queue_;
    HostCapabilities caps_;
};
} // namespace dscope
