#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "core/accessibility_bridge.h"
#include "core/clipboard_bridge.h"
#include "core/frame_driver.h"
#include "core/host_adapter.h"

using namespace dscope;

namespace
{
// Promise-style clipboard: completions wait until the test settles them.
class DeferredClipboard final : public ClipboardBackend
{
public:
    bool IsAsync() const override { return true; }
    void Read(const std::string&, Completion done) override { pending.push_back(std::move(done)); }
    void Write(const ClipboardPayload&, Completion done) override { pending.push_back(std::move(done)); }

    std::vector<Completion> pending;
};

class RecordingSpeech final : public AccessibilityBackend
{
public:
    bool Speak(const Announcement& a, std::string&) override
    {
        spoken.push_back(a.text);
        return true;
    }

    std::vector<std::string> spoken;
};

// Scripted host: a manual clock, injectable input and a present that can fail.
class FakeHost final : public HostAdapter
{
public:
    explicit FakeHost(EventQueue& queue) : HostAdapter(queue)
    {
        caps_.host_name = "fake";
        caps_.clipboard = true;
        caps_.clipboard_async = true;
        caps_.accessibility = true;
    }

    bool Initialize(const HostConfig&, std::string&) override { return true; }
    void Shutdown() override {}

    bool PresentFrame(const DrawCommands&, std::string& err) override
    {
        presents++;
        if (fail_present)
        {
            err = "device lost";
            return false;
        }
        return true;
    }

    double    NowSeconds() const override { return now_s; }
    Viewport  CurrentViewport() const override { return viewport; }
    Modifiers CurrentModifiers() const override { return mods; }

    ClipboardBackend*     Clipboard() override { return &clipboard; }
    AccessibilityBackend* Accessibility() override { return &speech; }

    void Inject(EventPayload payload) { pending_input.push_back(MakeEvent(std::move(payload), now_s)); }

    // Resize applied by the next pump, the way SDL updates its window state.
    void InjectResize(float w, float h)
    {
        pending_viewport = Viewport{w, h, viewport.scale};
        Inject(HostResize{w, h, viewport.scale});
    }

    double    now_s = 0.0;
    Viewport  viewport{800.0f, 600.0f, 2.0f};
    Modifiers mods;
    std::optional<Viewport>  pending_viewport;
    std::optional<Modifiers> pending_mods;
    bool     fail_present = false;
    int      presents = 0;

    DeferredClipboard clipboard;
    RecordingSpeech   speech;

protected:
    void PumpEvents() override
    {
        if (pending_viewport)
            viewport = *pending_viewport;
        if (pending_mods)
            mods = *pending_mods;
        pending_viewport.reset();
        pending_mods.reset();
        for (InputEvent& ev : pending_input)
            queue_.Push(std::move(ev));
        pending_input.clear();
    }

private:
    std::vector<InputEvent> pending_input;
};

struct Harness
{
    Harness() : host(queue), clipboard(&host.clipboard, true), a11y(&host.speech, true) {}

    FrameDriver MakeDriver(FrameDriver::UiLogic ui) { return FrameDriver(host, clipboard, a11y, std::move(ui)); }

    EventQueue          queue;
    FakeHost            host;
    ClipboardBridge     clipboard;
    AccessibilityBridge a11y;
};
} // namespace

TEST(FrameDriver, BuildsContextWithEventsAndTiming)
{
    Harness h;
    std::vector<std::uint64_t> frames;
    std::vector<double> dts;
    std::vector<size_t> event_counts;
    float width = 0.0f;

    FrameDriver driver = h.MakeDriver([&](const FrameContext& ctx, FrameOutput&) {
        frames.push_back(ctx.frame_index);
        dts.push_back(ctx.dt_s);
        event_counts.push_back(ctx.events.size());
        width = ctx.viewport.width;
    });

    h.host.now_s = 10.0;
    h.host.Inject(PointerMove{1.0f, 2.0f});
    h.host.Inject(TextInput{"a"});
    EXPECT_EQ(driver.Tick(), FrameDriver::TickResult::Presented);

    h.host.now_s = 10.25;
    EXPECT_EQ(driver.Tick(), FrameDriver::TickResult::Presented);

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], 0u);
    EXPECT_EQ(frames[1], 1u);
    EXPECT_DOUBLE_EQ(dts[0], 0.0);
    EXPECT_DOUBLE_EQ(dts[1], 0.25);
    EXPECT_EQ(event_counts[0], 2u);
    EXPECT_EQ(event_counts[1], 0u);
    EXPECT_FLOAT_EQ(width, 800.0f);
    EXPECT_EQ(driver.GetState(), FrameDriver::State::Idle);
    EXPECT_EQ(driver.FramesPresented(), 2u);
}

TEST(FrameDriver, SnapshotIncludesStatePumpedThisFrame)
{
    Harness h;
    float width = 0.0f;
    bool ctrl = false;
    size_t resizes = 0;
    FrameDriver driver = h.MakeDriver([&](const FrameContext& ctx, FrameOutput&) {
        width = ctx.viewport.width;
        ctrl = ctx.modifiers.ctrl;
        resizes = 0;
        for (const InputEvent& ev : ctx.events)
            if (ev.As<HostResize>())
                resizes++;
    });

    h.host.InjectResize(1024.0f, 768.0f);
    Modifiers held;
    held.ctrl = true;
    h.host.pending_mods = held;
    driver.Tick();

    EXPECT_EQ(resizes, 1u);
    EXPECT_FLOAT_EQ(width, 1024.0f);
    EXPECT_TRUE(ctrl);
}

TEST(FrameDriver, PresentFailureStopsForGood)
{
    Harness h;
    int ui_calls = 0;
    FrameDriver driver = h.MakeDriver([&](const FrameContext&, FrameOutput&) { ui_calls++; });

    EXPECT_EQ(driver.Tick(), FrameDriver::TickResult::Presented);
    h.host.fail_present = true;
    EXPECT_EQ(driver.Tick(), FrameDriver::TickResult::Stopped);

    EXPECT_TRUE(driver.IsStopped());
    EXPECT_EQ(driver.StopReason(), HostError::PresentationLost);
    EXPECT_EQ(driver.StopMessage(), "device lost");
    EXPECT_EQ(driver.FramesPresented(), 1u);

    h.host.fail_present = false;
    EXPECT_EQ(driver.Tick(), FrameDriver::TickResult::Stopped);
    EXPECT_EQ(h.host.presents, 2);
    EXPECT_EQ(ui_calls, 2);
}

TEST(FrameDriver, StopRequestPresentsThenStops)
{
    Harness h;
    FrameDriver driver = h.MakeDriver([](const FrameContext&, FrameOutput& out) { out.RequestStop(); });

    EXPECT_EQ(driver.Tick(), FrameDriver::TickResult::Stopped);
    EXPECT_EQ(driver.StopReason(), HostError::None);
    EXPECT_FALSE(IsFatal(driver.StopReason()));
    EXPECT_EQ(driver.FramesPresented(), 1u);
}

TEST(FrameDriver, DeniedClipboardReadArrivesOnLaterFrame)
{
    Harness h;
    std::vector<std::vector<ClipboardNotification>> seen;
    FrameDriver driver = h.MakeDriver([&](const FrameContext& ctx, FrameOutput& out) {
        if (ctx.frame_index == 0)
            out.ReadClipboard(42);
        seen.push_back(ctx.clipboard);
    });

    driver.Tick();
    ASSERT_EQ(h.host.clipboard.pending.size(), 1u);

    // Still unsettled: the loop keeps running without a result.
    driver.Tick();
    EXPECT_EQ(h.clipboard.PendingCount(), 1u);

    h.host.clipboard.pending[0](ClipboardOutcome::PermissionDenied, std::nullopt, "NotAllowedError");
    driver.Tick();

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_TRUE(seen[0].empty());
    EXPECT_TRUE(seen[1].empty());
    ASSERT_EQ(seen[2].size(), 1u);
    EXPECT_EQ(seen[2][0].tag, 42);
    EXPECT_EQ(seen[2][0].op, ClipboardOp::Read);
    EXPECT_EQ(seen[2][0].outcome, ClipboardOutcome::PermissionDenied);
    EXPECT_FALSE(seen[2][0].payload.has_value());
}

TEST(FrameDriver, SideEffectsWaitForSuccessfulPresent)
{
    Harness h;
    h.host.fail_present = true;
    FrameDriver driver = h.MakeDriver([](const FrameContext&, FrameOutput& out) {
        out.WriteClipboard(1, ClipboardText{"x"});
        out.Announce("Scan complete");
    });

    driver.Tick();
    EXPECT_TRUE(h.host.clipboard.pending.empty());
    EXPECT_TRUE(h.host.speech.spoken.empty());
}

TEST(FrameDriver, AnnouncementsReachTheBackend)
{
    Harness h;
    FrameDriver driver = h.MakeDriver([](const FrameContext& ctx, FrameOutput& out) {
        if (ctx.frame_index == 0)
        {
            out.Announce("Scan complete");
            out.Announce("Scan complete");
        }
    });

    driver.Tick();
    ASSERT_EQ(h.host.speech.spoken.size(), 1u);
    EXPECT_EQ(h.host.speech.spoken[0], "Scan complete");
}

TEST(FrameDriver, StateNames)
{
    EXPECT_STREQ(FrameStateName(FrameDriver::State::Idle), "idle");
    EXPECT_STREQ(FrameStateName(FrameDriver::State::Presenting), "presenting");
    EXPECT_STREQ(FrameStateName(FrameDriver::State::Stopped), "stopped");
}
