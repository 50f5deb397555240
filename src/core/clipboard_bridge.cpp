#include "core/clipboard_bridge.h"

#include <utility>

namespace dscope
{
bool operator==(const ClipboardText& a, const ClipboardText& b)
{
    return a.utf8 == b.utf8;
}

bool operator==(const ClipboardBytes& a, const ClipboardBytes& b)
{
    return a.mime_type == b.mime_type && a.data == b.data;
}

const char* ClipboardOutcomeName(ClipboardOutcome o)
{
    switch (o)
    {
        case ClipboardOutcome::Ok: return "ok";
        case ClipboardOutcome::PermissionDenied: return "permission-denied";
        case ClipboardOutcome::Unavailable: return "unavailable";
        default: return "unknown";
    }
}

ClipboardBridge::ClipboardBridge(ClipboardBackend* backend, bool enabled)
    : backend_(backend), enabled_(enabled && backend != nullptr), shared_(std::make_shared<Shared>())
{
}

// Dropping `shared_` is enough: outstanding completions see an expired weak_ptr.
ClipboardBridge::~ClipboardBridge() = default;

ClipboardBackend::Completion ClipboardBridge::MakeCompletion(ClipboardTicket ticket, int tag, ClipboardOp op)
{
    {
        std::lock_guard<std::mutex> lock(shared_->mtx);
        shared_->pending++;
    }

    std::weak_ptr<Shared> weak = shared_;
    auto fired = std::make_shared<bool>(false);
    return [weak, fired, ticket, tag, op](ClipboardOutcome outcome,
                                          std::optional<ClipboardPayload> payload,
                                          std::string detail) {
        // A backend must complete once; ignore a second call.
        if (*fired)
            return;
        *fired = true;

        std::shared_ptr<Shared> shared = weak.lock();
        if (!shared)
            return;

        ClipboardNotification n;
        n.ticket = ticket;
        n.tag = tag;
        n.op = op;
        n.outcome = outcome;
        if (outcome == ClipboardOutcome::Ok && op == ClipboardOp::Read)
            n.payload = std::move(payload);
        n.detail = std::move(detail);

        std::lock_guard<std::mutex> lock(shared->mtx);
        if (shared->pending > 0)
            shared->pending--;
        shared->completed.push_back(std::move(n));
    };
}

ClipboardTicket ClipboardBridge::Write(int tag, ClipboardPayload payload)
{
    const ClipboardTicket ticket = next_ticket_++;
    ClipboardBackend::Completion done = MakeCompletion(ticket, tag, ClipboardOp::Write);
    if (!enabled_)
    {
        done(ClipboardOutcome::Unavailable, std::nullopt, "clipboard not supported by this host");
        return ticket;
    }
    backend_->Write(payload, std::move(done));
    return ticket;
}

ClipboardTicket ClipboardBridge::Read(int tag, const std::string& mime_type)
{
    const ClipboardTicket ticket = next_ticket_++;
    ClipboardBackend::Completion done = MakeCompletion(ticket, tag, ClipboardOp::Read);
    if (!enabled_)
    {
        done(ClipboardOutcome::Unavailable, std::nullopt, "clipboard not supported by this host");
        return ticket;
    }
    backend_->Read(mime_type, std::move(done));
    return ticket;
}

std::vector<ClipboardNotification> ClipboardBridge::TakeCompleted()
{
    std::vector<ClipboardNotification> out;
    std::lock_guard<std::mutex> lock(shared_->mtx);
    out.swap(shared_->completed);
    return out;
}

std::size_t ClipboardBridge::PendingCount() const
{
    std::lock_guard<std::mutex> lock(shared_->mtx);
    return shared_->pending;
}
} // namespace dscope
