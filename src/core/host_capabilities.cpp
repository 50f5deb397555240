#include "core/host_capabilities.h"

namespace dscope
{
std::string DescribeCapabilities(const HostCapabilities& caps)
{
    std::string out = caps.host_name.empty() ? std::string("host") : caps.host_name;
    out += " [";
    bool first = true;
    auto add = [&](bool on, const char* label) {
        if (!on)
            return;
        if (!first)
            out.push_back(' ');
        out += label;
        first = false;
    };
    add(caps.clipboard, "clipboard");
    add(caps.clipboard_binary, "binary");
    add(caps.clipboard_async, "async");
    add(caps.accessibility, "a11y");
    add(caps.resize_events, "resize");
    add(caps.quit_menu, "quit");
    add(caps.filesystem_home, "home");
    out.push_back(']');
    return out;
}
} // namespace dscope
