#pragma once

#include "core/clipboard_bridge.h"

namespace dscope
{
// Synchronous system clipboard through SDL3.
// Text goes through SDL_{Get,Set}ClipboardText; other mime types through
// SDL_{Get,Set}ClipboardData, served from a buffer owned by the backend.
class SdlClipboardBackend final : public ClipboardBackend
{
public:
    SdlClipboardBackend() = default;
    ~SdlClipboardBackend() override;

    SdlClipboardBackend(const SdlClipboardBackend&) = delete;
    SdlClipboardBackend& operator=(const SdlClipboardBackend&) = delete;

    bool IsAsync() const override { return false; }

    void Read(const std::string& mime_type, Completion done) override;
    void Write(const ClipboardPayload& payload, Completion done) override;

private:
    // Bytes currently offered to other applications.
    ClipboardBytes offered_;
    // SDL holds a pointer to offered_ while this is set.
    bool offering_ = false;
};
} // namespace dscope
