#include <gtest/gtest.h>

#include <vector>

#include "core/accessibility_bridge.h"

using namespace dscope;

namespace
{
class RecordingBackend final : public AccessibilityBackend
{
public:
    bool Speak(const Announcement& a, std::string& err) override
    {
        if (fail)
        {
            err = "speech service missing";
            return false;
        }
        spoken.push_back(a);
        return true;
    }

    void Pump() override { pumps++; }

    bool fail = false;
    int pumps = 0;
    std::vector<Announcement> spoken;
};
} // namespace

TEST(AccessibilityBridge, DeliversTrimmedTextWithPriority)
{
    RecordingBackend backend;
    AccessibilityBridge bridge(&backend, true);

    bridge.BeginFrame();
    bridge.Announce("  Scan complete.  ", AnnouncePriority::Assertive);

    ASSERT_EQ(backend.spoken.size(), 1u);
    EXPECT_EQ(backend.spoken[0].text, "Scan complete.");
    EXPECT_EQ(backend.spoken[0].priority, AnnouncePriority::Assertive);
    EXPECT_EQ(bridge.Stats().delivered, 1u);
    EXPECT_EQ(backend.pumps, 1);
}

TEST(AccessibilityBridge, SkipsEmptyAndSameFrameDuplicates)
{
    RecordingBackend backend;
    AccessibilityBridge bridge(&backend, true);

    bridge.BeginFrame();
    bridge.Announce("   ", AnnouncePriority::Polite);
    bridge.Announce("Done", AnnouncePriority::Polite);
    bridge.Announce("Done", AnnouncePriority::Polite);
    EXPECT_EQ(backend.spoken.size(), 1u);
    EXPECT_EQ(bridge.Stats().skipped, 2u);

    // A new frame may repeat the message.
    bridge.BeginFrame();
    bridge.Announce("Done", AnnouncePriority::Polite);
    EXPECT_EQ(backend.spoken.size(), 2u);
}

TEST(AccessibilityBridge, FailuresAreCountedAndSwallowed)
{
    RecordingBackend backend;
    backend.fail = true;
    AccessibilityBridge bridge(&backend, true);

    bridge.BeginFrame();
    bridge.Announce("one", AnnouncePriority::Polite);
    bridge.Announce("two", AnnouncePriority::Polite);
    EXPECT_EQ(bridge.Stats().failed, 2u);
    EXPECT_EQ(bridge.Stats().delivered, 0u);
}

TEST(AccessibilityBridge, DisabledOrMissingBackendSkips)
{
    RecordingBackend backend;
    AccessibilityBridge disabled(&backend, false);
    disabled.Announce("x", AnnouncePriority::Polite);
    EXPECT_TRUE(backend.spoken.empty());
    EXPECT_EQ(disabled.Stats().skipped, 1u);

    AccessibilityBridge missing(nullptr, true);
    EXPECT_FALSE(missing.Enabled());
    missing.BeginFrame();
    missing.Announce("x", AnnouncePriority::Polite);
    EXPECT_EQ(missing.Stats().skipped, 1u);
}

TEST(AccessibilityBridge, CanBeSwitchedAtRuntime)
{
    RecordingBackend backend;
    AccessibilityBridge bridge(&backend, true);

    bridge.SetEnabled(false);
    EXPECT_FALSE(bridge.Enabled());
    bridge.Announce("muted", AnnouncePriority::Polite);
    EXPECT_TRUE(backend.spoken.empty());

    bridge.SetEnabled(true);
    bridge.Announce("back", AnnouncePriority::Polite);
    ASSERT_EQ(backend.spoken.size(), 1u);
    EXPECT_EQ(backend.spoken[0].text, "back");
}
