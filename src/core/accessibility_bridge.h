#pragma once

#include <cstdint>
#include <string>

namespace dscope
{
enum class AnnouncePriority : std::uint8_t
{
    Polite = 0,
    Assertive,
};

struct Announcement
{
    AnnouncePriority priority = AnnouncePriority::Polite;
    std::string      text;
};

// Host narration sink: a speech service on desktop, an aria-live region in the browser.
class AccessibilityBackend
{
public:
    virtual ~AccessibilityBackend() = default;

    // Hand `a` to the host. Must not block on speech; returns false when the
    // service is absent or refused the request.
    virtual bool Speak(const Announcement& a, std::string& err) = 0;

    // Called once per frame for housekeeping (e.g. reaping finished speech processes).
    virtual void Pump() {}
};

struct AccessibilityStats
{
    std::uint64_t delivered = 0;
    std::uint64_t failed = 0;
    std::uint64_t skipped = 0; // empty text, disabled, or repeated within a frame
};

// Best-effort announcements. Failures are counted and logged once; they never
// reach the caller and never stop the frame loop.
class AccessibilityBridge
{
public:
    AccessibilityBridge(AccessibilityBackend* backend, bool enabled);

    void SetEnabled(bool enabled) { enabled_ = enabled; }
    bool Enabled() const { return enabled_ && backend_ != nullptr; }

    // Resets the per-frame duplicate filter and pumps the backend.
    void BeginFrame();

    void Announce(const std::string& text, AnnouncePriority priority);
    void Announce(const Announcement& a) { Announce(a.text, a.priority); }

    const AccessibilityStats& Stats() const { return stats_; }

private:
    AccessibilityBackend* backend_ = nullptr;
    bool enabled_ = false;
    bool logged_failure_ = false;
    std::string last_text_this_frame_;
    AccessibilityStats stats_;
};
} // namespace dscope
