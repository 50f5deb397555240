#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/accessibility_bridge.h"
#include "core/clipboard_bridge.h"
#include "core/host_capabilities.h"
#include "core/input_event.h"

namespace dscope
{
struct Viewport
{
    float width = 0.0f;  // logical pixels
    float height = 0.0f; // logical pixels
    float scale = 1.0f;  // device pixels per logical pixel
};

// Everything the UI logic may look at for one frame. Built by the FrameDriver,
// handed to exactly one UI invocation, then discarded (not copyable, so it
// cannot be kept and fed to a later frame by accident).
struct FrameContext
{
    explicit FrameContext(const HostCapabilities& capabilities) : caps(capabilities) {}

    FrameContext(const FrameContext&) = delete;
    FrameContext& operator=(const FrameContext&) = delete;

    const HostCapabilities& caps;

    std::uint64_t frame_index = 0;
    double        time_s = 0.0;
    double        dt_s = 0.0; // 0 on the first frame

    Viewport  viewport;
    Modifiers modifiers;

    std::vector<InputEvent>            events;    // in sequence order
    std::vector<ClipboardNotification> clipboard; // completed since the previous frame
};

// Renderer-specific draw data produced by the UI pass. `draw_data` points at the
// ImDrawData of the current ImGui frame; the core never dereferences it.
struct DrawCommands
{
    void* draw_data = nullptr;
    float clear_color[4] = {0.10f, 0.10f, 0.12f, 1.00f};
};

struct ClipboardRequest
{
    ClipboardOp      op = ClipboardOp::Read;
    int              tag = 0;
    ClipboardPayload payload;   // Write
    std::string      mime_type; // Read; empty = text
};

// Side effects requested by the UI logic during one frame.
struct FrameOutput
{
    DrawCommands                  draw;
    std::vector<ClipboardRequest> clipboard;
    std::vector<Announcement>     announcements;
    bool                          stop_requested = false;

    void WriteClipboard(int tag, ClipboardPayload payload)
    {
        ClipboardRequest r;
        r.op = ClipboardOp::Write;
        r.tag = tag;
        r.payload = std::move(payload);
        clipboard.push_back(std::move(r));
    }

    void ReadClipboard(int tag, std::string mime_type = {})
    {
        ClipboardRequest r;
        r.op = ClipboardOp::Read;
        r.tag = tag;
        r.mime_type = std::move(mime_type);
        clipboard.push_back(std::move(r));
    }

    void Announce(std::string text, AnnouncePriority priority = AnnouncePriority::Polite)
    {
        announcements.push_back(Announcement{priority, std::move(text)});
    }

    void RequestStop() { stop_requested = true; }
};
} // namespace dscope
