#pragma once

#include <cstdint>

#include "core/clipboard_bridge.h"

namespace dscope
{
// Failure taxonomy of the platform layer.
// Only PresentationLost is fatal (it stops the FrameDriver). Clipboard failures
// reach the UI as tagged notifications carrying a ClipboardOutcome (see
// HostErrorFromOutcome); accessibility and input failures are counted in
// AccessibilityStats/TranslatorStats and logged under their name.
enum class HostError : std::uint8_t
{
    None = 0,
    PresentationLost,
    ClipboardUnavailable,
    PermissionDenied,
    AccessibilityUnavailable,
    UnrecognizedInput,
};

const char* HostErrorName(HostError e);

// Ok -> None, PermissionDenied -> PermissionDenied, Unavailable -> ClipboardUnavailable.
HostError HostErrorFromOutcome(ClipboardOutcome o);

inline bool IsFatal(HostError e) { return e == HostError::PresentationLost; }
} // namespace dscope
