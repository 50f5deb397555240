#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "core/clipboard_bridge.h"
#include "core/host_error.h"

using namespace dscope;

namespace
{
// Completes inside the call, like the SDL clipboard.
class SyncBackend final : public ClipboardBackend
{
public:
    bool IsAsync() const override { return false; }

    void Read(const std::string& mime_type, Completion done) override
    {
        if (!mime_type.empty())
        {
            done(ClipboardOutcome::Unavailable, std::nullopt, "no such type");
            return;
        }
        done(ClipboardOutcome::Ok, stored, {});
    }

    void Write(const ClipboardPayload& payload, Completion done) override
    {
        stored = payload;
        done(ClipboardOutcome::Ok, std::nullopt, {});
    }

    std::optional<ClipboardPayload> stored;
};

// Holds completions until the test settles them, like browser promises.
class DeferredBackend final : public ClipboardBackend
{
public:
    bool IsAsync() const override { return true; }

    void Read(const std::string&, Completion done) override { pending.push_back(std::move(done)); }
    void Write(const ClipboardPayload&, Completion done) override { pending.push_back(std::move(done)); }

    std::vector<Completion> pending;
};
} // namespace

TEST(ClipboardBridge, SyncRoundTripDeliversThroughTakeCompleted)
{
    SyncBackend backend;
    ClipboardBridge bridge(&backend, true);

    const ClipboardTicket w = bridge.Write(7, ClipboardText{"hello"});
    const ClipboardTicket r = bridge.Read(8);
    EXPECT_NE(w, r);
    EXPECT_EQ(bridge.PendingCount(), 0u);

    const std::vector<ClipboardNotification> done = bridge.TakeCompleted();
    ASSERT_EQ(done.size(), 2u);
    EXPECT_EQ(done[0].ticket, w);
    EXPECT_EQ(done[0].tag, 7);
    EXPECT_EQ(done[0].op, ClipboardOp::Write);
    EXPECT_EQ(done[0].outcome, ClipboardOutcome::Ok);
    EXPECT_FALSE(done[0].payload.has_value());

    EXPECT_EQ(done[1].ticket, r);
    EXPECT_EQ(done[1].tag, 8);
    ASSERT_TRUE(done[1].payload.has_value());
    const ClipboardText* text = std::get_if<ClipboardText>(&*done[1].payload);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->utf8, "hello");

    EXPECT_TRUE(bridge.TakeCompleted().empty());
}

TEST(ClipboardBridge, BytesRoundTripKeepsMimeType)
{
    SyncBackend backend;
    ClipboardBridge bridge(&backend, true);

    ClipboardBytes png;
    png.mime_type = "image/png";
    png.data = {0x89, 'P', 'N', 'G'};
    bridge.Write(1, png);

    ASSERT_TRUE(backend.stored.has_value());
    const ClipboardBytes* stored = std::get_if<ClipboardBytes>(&*backend.stored);
    ASSERT_NE(stored, nullptr);
    EXPECT_TRUE(*stored == png);
}

TEST(ClipboardBridge, DisabledBridgeCompletesUnavailable)
{
    SyncBackend backend;
    ClipboardBridge bridge(&backend, false);
    EXPECT_FALSE(bridge.Enabled());

    bridge.Write(1, ClipboardText{"x"});
    bridge.Read(2);

    const std::vector<ClipboardNotification> done = bridge.TakeCompleted();
    ASSERT_EQ(done.size(), 2u);
    EXPECT_EQ(done[0].outcome, ClipboardOutcome::Unavailable);
    EXPECT_EQ(done[1].outcome, ClipboardOutcome::Unavailable);
    EXPECT_FALSE(backend.stored.has_value());
}

TEST(ClipboardBridge, NullBackendIsDisabled)
{
    ClipboardBridge bridge(nullptr, true);
    EXPECT_FALSE(bridge.Enabled());
    bridge.Read(3);
    const std::vector<ClipboardNotification> done = bridge.TakeCompleted();
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0].outcome, ClipboardOutcome::Unavailable);
}

TEST(ClipboardBridge, AsyncCompletionArrivesLaterInCompletionOrder)
{
    DeferredBackend backend;
    ClipboardBridge bridge(&backend, true);

    const ClipboardTicket first = bridge.Read(1);
    const ClipboardTicket second = bridge.Write(2, ClipboardText{"y"});
    EXPECT_EQ(bridge.PendingCount(), 2u);
    EXPECT_TRUE(bridge.TakeCompleted().empty());

    ASSERT_EQ(backend.pending.size(), 2u);
    backend.pending[1](ClipboardOutcome::Ok, std::nullopt, {});
    backend.pending[0](ClipboardOutcome::PermissionDenied, std::nullopt, "NotAllowedError");

    const std::vector<ClipboardNotification> done = bridge.TakeCompleted();
    ASSERT_EQ(done.size(), 2u);
    EXPECT_EQ(done[0].ticket, second);
    EXPECT_EQ(done[1].ticket, first);
    EXPECT_EQ(done[1].outcome, ClipboardOutcome::PermissionDenied);
    EXPECT_EQ(done[1].detail, "NotAllowedError");
    EXPECT_EQ(bridge.PendingCount(), 0u);
}

TEST(ClipboardBridge, SecondCompletionOfSameRequestIsIgnored)
{
    DeferredBackend backend;
    ClipboardBridge bridge(&backend, true);
    bridge.Read(1);

    backend.pending[0](ClipboardOutcome::Ok, ClipboardPayload{ClipboardText{"a"}}, {});
    backend.pending[0](ClipboardOutcome::Ok, ClipboardPayload{ClipboardText{"b"}}, {});
    EXPECT_EQ(bridge.TakeCompleted().size(), 1u);
}

TEST(ClipboardBridge, LateCompletionAfterTeardownIsDropped)
{
    DeferredBackend backend;
    {
        ClipboardBridge bridge(&backend, true);
        bridge.Read(1);
    }
    ASSERT_EQ(backend.pending.size(), 1u);
    // Must not touch the destroyed bridge.
    backend.pending[0](ClipboardOutcome::Ok, ClipboardPayload{ClipboardText{"late"}}, {});
    SUCCEED();
}

TEST(ClipboardBridge, OutcomeNames)
{
    EXPECT_STREQ(ClipboardOutcomeName(ClipboardOutcome::Ok), "ok");
    EXPECT_STREQ(ClipboardOutcomeName(ClipboardOutcome::PermissionDenied), "permission-denied");
    EXPECT_STREQ(ClipboardOutcomeName(ClipboardOutcome::Unavailable), "unavailable");
}

TEST(ClipboardBridge, OutcomesMapOntoHostErrors)
{
    EXPECT_EQ(HostErrorFromOutcome(ClipboardOutcome::Ok), HostError::None);
    EXPECT_EQ(HostErrorFromOutcome(ClipboardOutcome::PermissionDenied), HostError::PermissionDenied);
    EXPECT_EQ(HostErrorFromOutcome(ClipboardOutcome::Unavailable), HostError::ClipboardUnavailable);
    EXPECT_FALSE(IsFatal(HostErrorFromOutcome(ClipboardOutcome::PermissionDenied)));
    EXPECT_STREQ(HostErrorName(HostError::ClipboardUnavailable), "clipboard-unavailable");
}
