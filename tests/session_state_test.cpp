#include <gtest/gtest.h>

#include <algorithm>

#include "io/session/session_state.h"
#include "test_util.h"

using dscope_test::ScopedTempDir;

TEST(SessionState, MissingFileKeepsDefaults)
{
    ScopedTempDir tmp;
    SessionState st;
    std::string err;
    EXPECT_TRUE(LoadSessionStateFrom((tmp.Path() / "session.json").string(), st, err));
    EXPECT_TRUE(err.empty());
    EXPECT_EQ(st.window_w, 1280);
    EXPECT_EQ(st.event_queue_capacity, 256u);
    EXPECT_EQ(st.ui_theme, "dirscope-dark");
}

TEST(SessionState, SaveThenLoad)
{
    ScopedTempDir tmp;
    const std::string path = (tmp.Path() / "nested" / "session.json").string();

    SessionState st;
    st.window_w = 1000;
    st.window_h = 700;
    st.window_x = 40;
    st.window_y = 50;
    st.window_pos_valid = true;
    st.scan_path = "/srv/data";
    st.recent_paths = {"/srv/data", "/home/user"};
    st.event_queue_capacity = 64;
    st.tick_hz = 30;
    st.announce_scan_complete = false;
    st.ui_theme = "dirscope-light";

    std::string err;
    ASSERT_TRUE(SaveSessionStateTo(path, st, err)) << err;

    SessionState loaded;
    ASSERT_TRUE(LoadSessionStateFrom(path, loaded, err)) << err;
    EXPECT_EQ(loaded.window_w, 1000);
    EXPECT_EQ(loaded.window_h, 700);
    EXPECT_EQ(loaded.window_x, 40);
    EXPECT_TRUE(loaded.window_pos_valid);
    EXPECT_EQ(loaded.scan_path, "/srv/data");
    EXPECT_EQ(loaded.recent_paths, st.recent_paths);
    EXPECT_EQ(loaded.event_queue_capacity, 64u);
    EXPECT_EQ(loaded.tick_hz, 30);
    EXPECT_FALSE(loaded.announce_scan_complete);
    EXPECT_EQ(loaded.ui_theme, "dirscope-light");
}

TEST(SessionState, OutOfRangeValuesAreClamped)
{
    ScopedTempDir tmp;
    const std::string path = (tmp.Path() / "session.json").string();
    dscope_test::WriteText(path, R"({
  "schema_version": 1,
  "window": { "w": 10, "h": 10 },
  "host": { "event_queue_capacity": 1, "tick_hz": 1000 },
  "ui": { "theme": "neon" },
  "scan": { "recent": ["/a", "", "/b", "/a"] }
})");

    SessionState st;
    std::string err;
    ASSERT_TRUE(LoadSessionStateFrom(path, st, err)) << err;
    EXPECT_EQ(st.window_w, 320);
    EXPECT_EQ(st.window_h, 240);
    EXPECT_EQ(st.event_queue_capacity, kMinQueueCapacity);
    EXPECT_EQ(st.tick_hz, kMaxTickHz);
    EXPECT_EQ(st.ui_theme, "dirscope-dark");
    EXPECT_EQ(st.recent_paths, (std::vector<std::string>{"/a", "/b"}));
}

TEST(SessionState, UnknownSchemaVersionIsIgnored)
{
    ScopedTempDir tmp;
    const std::string path = (tmp.Path() / "session.json").string();
    dscope_test::WriteText(path, R"({ "schema_version": 99, "scan": { "path": "/x" } })");

    SessionState st;
    std::string err;
    EXPECT_TRUE(LoadSessionStateFrom(path, st, err));
    EXPECT_TRUE(st.scan_path.empty());
}

TEST(SessionState, MalformedJsonReportsError)
{
    ScopedTempDir tmp;
    const std::string path = (tmp.Path() / "session.json").string();
    dscope_test::WriteText(path, "{ not json");

    SessionState st;
    std::string err;
    EXPECT_FALSE(LoadSessionStateFrom(path, st, err));
    EXPECT_NE(err.find("parse"), std::string::npos);
}

TEST(SessionState, RecentPathsDedupeAndLimit)
{
    SessionState st;
    for (int i = 0; i < 15; ++i)
        PushRecentPath(st, "/p" + std::to_string(i));
    EXPECT_EQ(st.recent_paths.size(), kMaxRecentPaths);
    EXPECT_EQ(st.recent_paths.front(), "/p14");

    PushRecentPath(st, "/p10");
    EXPECT_EQ(st.recent_paths.front(), "/p10");
    EXPECT_EQ(st.recent_paths.size(), kMaxRecentPaths);
    EXPECT_EQ(std::count(st.recent_paths.begin(), st.recent_paths.end(), "/p10"), 1);

    PushRecentPath(st, "");
    EXPECT_EQ(st.recent_paths.front(), "/p10");
}
