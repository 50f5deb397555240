#include <gtest/gtest.h>

#include <SDL3/SDL.h>

#include <cstdio>
#include <vector>

#include "core/clipboard_bridge.h"
#include "platform/native/sdl_clipboard_backend.h"

using namespace dscope;

namespace
{
// The dummy video driver keeps the clipboard inside the process, so the
// suite runs headless.
class SdlClipboard : public ::testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        SDL_SetHint(SDL_HINT_VIDEO_DRIVER, "dummy");
        video_ready_ = SDL_Init(SDL_INIT_VIDEO);
        if (!video_ready_)
            std::fprintf(stderr, "[test] SDL_Init failed: %s\n", SDL_GetError());
    }

    static void TearDownTestSuite()
    {
        if (video_ready_)
            SDL_Quit();
        video_ready_ = false;
    }

    void SetUp() override
    {
        if (!video_ready_)
            GTEST_SKIP() << "no SDL video subsystem";
        SDL_ClearClipboardData();
    }

    static ClipboardNotification Only(ClipboardBridge& bridge)
    {
        std::vector<ClipboardNotification> done = bridge.TakeCompleted();
        EXPECT_EQ(done.size(), 1u);
        return done.empty() ? ClipboardNotification{} : done.front();
    }

    static bool video_ready_;
};

bool SdlClipboard::video_ready_ = false;
} // namespace

TEST_F(SdlClipboard, TextRoundTrip)
{
    SdlClipboardBackend backend;
    ClipboardBridge bridge(&backend, true);

    bridge.Write(1, ClipboardText{"/var/log"});
    EXPECT_EQ(Only(bridge).outcome, ClipboardOutcome::Ok);

    bridge.Read(2);
    const ClipboardNotification n = Only(bridge);
    ASSERT_EQ(n.outcome, ClipboardOutcome::Ok);
    ASSERT_TRUE(n.payload.has_value());
    const ClipboardText* text = std::get_if<ClipboardText>(&*n.payload);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->utf8, "/var/log");
}

TEST_F(SdlClipboard, BytesRoundTrip)
{
    SdlClipboardBackend backend;
    ClipboardBridge bridge(&backend, true);

    ClipboardBytes bytes;
    bytes.mime_type = "application/x-dscope";
    bytes.data = {0x00, 0x01, 0xfe, 0xff, 'd', 's'};
    bridge.Write(1, bytes);
    EXPECT_EQ(Only(bridge).outcome, ClipboardOutcome::Ok);

    bridge.Read(2, "application/x-dscope");
    const ClipboardNotification n = Only(bridge);
    ASSERT_EQ(n.outcome, ClipboardOutcome::Ok);
    ASSERT_TRUE(n.payload.has_value());
    const ClipboardBytes* got = std::get_if<ClipboardBytes>(&*n.payload);
    ASSERT_NE(got, nullptr);
    EXPECT_TRUE(*got == bytes);
}

TEST_F(SdlClipboard, EmptyClipboardReadsEmptyText)
{
    SdlClipboardBackend backend;
    ClipboardBridge bridge(&backend, true);

    bridge.Read(3);
    const ClipboardNotification n = Only(bridge);
    ASSERT_EQ(n.outcome, ClipboardOutcome::Ok);
    ASSERT_TRUE(n.payload.has_value());
    const ClipboardText* text = std::get_if<ClipboardText>(&*n.payload);
    ASSERT_NE(text, nullptr);
    EXPECT_TRUE(text->utf8.empty());
}

TEST_F(SdlClipboard, MissingMimeTypeIsUnavailable)
{
    SdlClipboardBackend backend;
    ClipboardBridge bridge(&backend, true);

    bridge.Read(4, "application/x-not-offered");
    const ClipboardNotification n = Only(bridge);
    EXPECT_EQ(n.outcome, ClipboardOutcome::Unavailable);
    EXPECT_FALSE(n.payload.has_value());
}

TEST_F(SdlClipboard, BytesWithoutMimeTypeAreRejected)
{
    SdlClipboardBackend backend;
    ClipboardBridge bridge(&backend, true);

    bridge.Write(5, ClipboardBytes{});
    EXPECT_EQ(Only(bridge).outcome, ClipboardOutcome::Unavailable);
}

TEST_F(SdlClipboard, DestroyedBackendWithdrawsItsBytes)
{
    {
        SdlClipboardBackend backend;
        ClipboardBridge bridge(&backend, true);
        ClipboardBytes bytes;
        bytes.mime_type = "application/x-dscope";
        bytes.data = {1, 2, 3};
        bridge.Write(1, bytes);
        EXPECT_EQ(Only(bridge).outcome, ClipboardOutcome::Ok);
    }

    SdlClipboardBackend next;
    ClipboardBridge bridge(&next, true);
    bridge.Read(2, "application/x-dscope");
    EXPECT_EQ(Only(bridge).outcome, ClipboardOutcome::Unavailable);
}
