#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dscope
{
struct ClipboardText
{
    std::string utf8;
};

struct ClipboardBytes
{
    std::string               mime_type;
    std::vector<std::uint8_t> data;
};

using ClipboardPayload = std::variant<ClipboardText, ClipboardBytes>;

bool operator==(const ClipboardText& a, const ClipboardText& b);
bool operator==(const ClipboardBytes& a, const ClipboardBytes& b);

enum class ClipboardOp : std::uint8_t
{
    Read = 0,
    Write,
};

enum class ClipboardOutcome : std::uint8_t
{
    Ok = 0,
    PermissionDenied,
    Unavailable,
};

const char* ClipboardOutcomeName(ClipboardOutcome o);

using ClipboardTicket = std::uint64_t;

// Delivered to the UI through FrameContext::clipboard, on a frame after the one
// that issued the request (also for synchronous hosts, so the UI has one path).
struct ClipboardNotification
{
    ClipboardTicket  ticket = 0;
    int              tag = 0;  // caller-chosen routing id (see app/clipboard_tags.h)
    ClipboardOp      op = ClipboardOp::Read;
    ClipboardOutcome outcome = ClipboardOutcome::Unavailable;

    // Set for successful reads.
    std::optional<ClipboardPayload> payload;

    // Host-provided detail for failures (e.g. "NotAllowedError: Read permission denied.").
    std::string detail;
};

// Host clipboard access. Native backends finish inside Read()/Write() and call
// `done` before returning; browser backends call `done` later, from a promise
// resolution, possibly after several frames.
class ClipboardBackend
{
public:
    using Completion = std::function<void(ClipboardOutcome outcome,
                                          std::optional<ClipboardPayload> payload,
                                          std::string detail)>;

    virtual ~ClipboardBackend() = default;

    virtual bool IsAsync() const = 0;

    // `mime_type` empty means UTF-8 text.
    virtual void Read(const std::string& mime_type, Completion done) = 0;
    virtual void Write(const ClipboardPayload& payload, Completion done) = 0;
};

// Request/response front for the synchronous frame loop.
//
// Read()/Write() never block: they hand the request to the backend and return a
// ticket. Completions are collected under a mutex and handed to the FrameDriver via
// TakeCompleted() when it builds the next FrameContext.
//
// Completion callbacks only hold a weak reference to the bridge state, so results
// that arrive after the bridge is destroyed are discarded.
class ClipboardBridge
{
public:
    // `backend` may be null (host without clipboard). When `enabled` is false every
    // request completes with ClipboardOutcome::Unavailable.
    ClipboardBridge(ClipboardBackend* backend, bool enabled);
    ~ClipboardBridge();

    ClipboardBridge(const ClipboardBridge&) = delete;
    ClipboardBridge& operator=(const ClipboardBridge&) = delete;

    ClipboardTicket Write(int tag, ClipboardPayload payload);
    ClipboardTicket Read(int tag, const std::string& mime_type = {});

    // Completed requests in completion order. Clears the completed list.
    std::vector<ClipboardNotification> TakeCompleted();

    // Requests handed to the backend and not completed yet.
    std::size_t PendingCount() const;

    bool Enabled() const { return enabled_; }

private:
    struct Shared
    {
        std::mutex mtx;
        std::vector<ClipboardNotification> completed;
        std::size_t pending = 0;
    };

    ClipboardBackend::Completion MakeCompletion(ClipboardTicket ticket, int tag, ClipboardOp op);

    ClipboardBackend* backend_ = nullptr;
    bool enabled_ = false;
    ClipboardTicket next_ticket_ = 1;
    std::shared_ptr<Shared> shared_;
};
} // namespace dscope
