#include "core/host_error.h"

namespace dscope
{
const char* HostErrorName(HostError e)
{
    switch (e)
    {
        case HostError::None: return "none";
        case HostError::PresentationLost: return "presentation-lost";
        case HostError::ClipboardUnavailable: return "clipboard-unavailable";
        case HostError::PermissionDenied: return "permission-denied";
        case HostError::AccessibilityUnavailable: return "accessibility-unavailable";
        case HostError::UnrecognizedInput: return "unrecognized-input";
        default: return "unknown";
    }
}

HostError HostErrorFromOutcome(ClipboardOutcome o)
{
    switch (o)
    {
        case ClipboardOutcome::Ok: return HostError::None;
        case ClipboardOutcome::PermissionDenied: return HostError::PermissionDenied;
        case ClipboardOutcome::Unavailable: return HostError::ClipboardUnavailable;
        default: return HostError::ClipboardUnavailable;
    }
}
} // namespace dscope
