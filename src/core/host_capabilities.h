#pragma once

#include <string>

namespace dscope
{
// What the active host actually supports. Filled once by the HostAdapter during
// initialization and read-only afterwards; the FrameDriver and UI receive it by
// const reference.
struct HostCapabilities
{
    std::string host_name;             // "sdl3-vulkan", "emscripten-webgl2"
    bool clipboard = false;            // text read/write
    bool clipboard_binary = false;     // mime-typed byte payloads
    bool clipboard_async = false;      // results arrive on a later frame
    bool accessibility = false;        // announcements reach a screen reader / speech service
    bool resize_events = false;
    bool quit_menu = false;            // the app may close its own window
    bool filesystem_home = false;      // a user home directory exists
};

// Single-line summary for logs, e.g. "sdl3-vulkan [clipboard binary a11y resize quit home]".
std::string DescribeCapabilities(const HostCapabilities& caps);
} // namespace dscope
