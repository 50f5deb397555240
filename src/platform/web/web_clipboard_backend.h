#pragma once

#include <unordered_map>

#include "core/clipboard_bridge.h"

namespace dscope
{
// Asynchronous Clipboard API (navigator.clipboard) glue.
//
// Every request starts a JS promise and returns at once. The promise settles on a
// later turn of the browser event loop and calls back into the module, which
// completes the stored request. A rejected promise with NotAllowedError (no user
// activation, permission prompt dismissed) maps to PermissionDenied; a missing API
// or any other failure to Unavailable.
//
// Only compiled with DSCOPE_WEB_CLIPBOARD; browsers still gate parts of the API.
class WebClipboardBackend final : public ClipboardBackend
{
public:
    WebClipboardBackend();
    ~WebClipboardBackend() override;

    WebClipboardBackend(const WebClipboardBackend&) = delete;
    WebClipboardBackend& operator=(const WebClipboardBackend&) = delete;

    bool IsAsync() const override { return true; }

    void Read(const std::string& mime_type, Completion done) override;
    void Write(const ClipboardPayload& payload, Completion done) override;

    // True if the page exposes navigator.clipboard (secure context).
    static bool ApiAvailable();
    // True if ClipboardItem exists (binary payloads).
    static bool BinaryAvailable();

    // Called from the promise handlers.
    void Complete(int request_id, ClipboardOutcome outcome, std::optional<ClipboardPayload> payload, std::string detail);

private:
    int Track(Completion done);

    int next_id_ = 1;
    std::unordered_map<int, Completion> pending_;
};
} // namespace dscope
