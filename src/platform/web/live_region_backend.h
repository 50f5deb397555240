#pragma once

#include "core/accessibility_bridge.h"

namespace dscope
{
// Screen reader announcements through two visually hidden aria-live regions
// (polite and assertive) appended to the page body on first use.
class LiveRegionBackend final : public AccessibilityBackend
{
public:
    bool Speak(const Announcement& a, std::string& err) override;
};
} // namespace dscope
