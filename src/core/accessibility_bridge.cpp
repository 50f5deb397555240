#include "core/accessibility_bridge.h"

#include <cctype>
#include <cstdio>

#include "core/host_error.h"

namespace dscope
{
namespace
{
static std::string Trim(const std::string& s)
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b]))
        ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return s.substr(b, e - b);
}
} // namespace

AccessibilityBridge::AccessibilityBridge(AccessibilityBackend* backend, bool enabled)
    : backend_(backend), enabled_(enabled)
{
}

void AccessibilityBridge::BeginFrame()
{
    last_text_this_frame_.clear();
    if (backend_)
        backend_->Pump();
}

void AccessibilityBridge::Announce(const std::string& text, AnnouncePriority priority)
{
    const std::string t = Trim(text);
    if (!Enabled() || t.empty() || t == last_text_this_frame_)
    {
        stats_.skipped++;
        return;
    }
    last_text_this_frame_ = t;

    Announcement a;
    a.priority = priority;
    a.text = t;

    std::string err;
    if (backend_->Speak(a, err))
    {
        stats_.delivered++;
        return;
    }

    stats_.failed++;
    if (!logged_failure_)
    {
        std::fprintf(stderr, "[a11y] %s: %s (further failures are not logged)\n",
                     HostErrorName(HostError::AccessibilityUnavailable),
                     err.empty() ? "service unavailable" : err.c_str());
        logged_failure_ = true;
    }
}
} // namespace dscope
