#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/frame_context.h"
#include "core/key_bindings.h"
#include "test_util.h"

using dscope::Key;
using dscope::Modifiers;
using dscope_test::ScopedTempDir;

namespace
{
Modifiers Ctrl()
{
    Modifiers m;
    m.ctrl = true;
    return m;
}

// A frame holding a single key press.
struct KeyFrame
{
    explicit KeyFrame(Key key, Modifiers mods = {}, bool repeat = false) : ctx(caps)
    {
        dscope::KeyDown kd;
        kd.key = key;
        kd.mods = mods;
        kd.repeat = repeat;
        ctx.events.push_back(dscope::MakeEvent(kd));
    }

    dscope::HostCapabilities caps;
    dscope::FrameContext     ctx;
};

kb::EvalContext Linux(bool typing = false)
{
    kb::EvalContext ec;
    ec.platform = kb::Platform::Linux;
    ec.text_input_active = typing;
    return ec;
}
} // namespace

TEST(ParseChord, ModifiersAndKey)
{
    kb::ParsedChord c;
    std::string err;
    ASSERT_TRUE(kb::ParseChordString("Ctrl+Shift+Z", c, err)) << err;
    EXPECT_TRUE(c.mods.ctrl);
    EXPECT_TRUE(c.mods.shift);
    EXPECT_FALSE(c.mods.alt);
    EXPECT_EQ(c.key, Key::Z);

    ASSERT_TRUE(kb::ParseChordString(" cmd + q ", c, err)) << err;
    EXPECT_TRUE(c.mods.super);
    EXPECT_EQ(c.key, Key::Q);

    ASSERT_TRUE(kb::ParseChordString("Alt+Home", c, err)) << err;
    EXPECT_TRUE(c.mods.alt);
    EXPECT_EQ(c.key, Key::Home);
}

TEST(ParseChord, EnterMatchesBothEnterKeys)
{
    kb::ParsedChord c;
    std::string err;
    ASSERT_TRUE(kb::ParseChordString("Return", c, err));
    EXPECT_EQ(c.key, Key::Enter);
    EXPECT_TRUE(c.any_enter);
}

TEST(ParseChord, PlusImpliesShiftEqual)
{
    kb::ParsedChord c;
    std::string err;
    ASSERT_TRUE(kb::ParseChordString("Ctrl++", c, err)) << err;
    EXPECT_EQ(c.key, Key::Equal);
    EXPECT_TRUE(c.mods.ctrl);
    EXPECT_TRUE(c.mods.shift);
}

TEST(ParseChord, Errors)
{
    kb::ParsedChord c;
    std::string err;
    EXPECT_FALSE(kb::ParseChordString("   ", c, err));
    EXPECT_EQ(err, "empty chord");

    EXPECT_FALSE(kb::ParseChordString("Ctrl+Banana", c, err));
    EXPECT_NE(err.find("unknown key token"), std::string::npos);

    EXPECT_FALSE(kb::ParseChordString("A+B", c, err));
    EXPECT_NE(err.find("multiple keys"), std::string::npos);

    EXPECT_FALSE(kb::ParseChordString("Ctrl+Shift", c, err));
    EXPECT_EQ(err, "chord has no key");
}

TEST(KeyBindings, ExactModifierMatch)
{
    kb::KeyBindingsEngine engine;

    KeyFrame plain_c(Key::C, Ctrl());
    EXPECT_TRUE(engine.ActionPressed("edit.copy_results", Linux(), plain_c.ctx));

    Modifiers ctrl_shift = Ctrl();
    ctrl_shift.shift = true;
    KeyFrame shifted_c(Key::C, ctrl_shift);
    EXPECT_FALSE(engine.ActionPressed("edit.copy_results", Linux(), shifted_c.ctx));

    KeyFrame bare_c(Key::C);
    EXPECT_FALSE(engine.ActionPressed("edit.copy_results", Linux(), bare_c.ctx));
}

TEST(KeyBindings, GlobalBindingsYieldToTextFields)
{
    kb::KeyBindingsEngine engine;
    KeyFrame paste(Key::V, Ctrl());
    EXPECT_TRUE(engine.ActionPressed("edit.paste_path", Linux(false), paste.ctx));
    EXPECT_FALSE(engine.ActionPressed("edit.paste_path", Linux(true), paste.ctx));

    // Enter starts a scan even with the path field focused.
    KeyFrame enter(Key::Enter);
    EXPECT_TRUE(engine.ActionPressed("scan.start", Linux(true), enter.ctx));
}

TEST(KeyBindings, KeypadEnterStartsScan)
{
    kb::KeyBindingsEngine engine;
    KeyFrame keypad(Key::KeypadEnter);
    EXPECT_TRUE(engine.ActionPressed("scan.start", Linux(), keypad.ctx));
}

TEST(KeyBindings, RepeatsIgnoredUnlessAllowed)
{
    kb::KeyBindingsEngine engine;
    KeyFrame held(Key::Escape, {}, true);
    EXPECT_FALSE(engine.ActionPressed("scan.stop", Linux(), held.ctx));
}

TEST(KeyBindings, PlatformGating)
{
    kb::KeyBindingsEngine engine;

    Modifiers cmd;
    cmd.super = true;
    KeyFrame cmd_q(Key::Q, cmd);
    KeyFrame ctrl_q(Key::Q, Ctrl());

    kb::EvalContext mac;
    mac.platform = kb::Platform::MacOS;
    EXPECT_TRUE(engine.ActionPressed("app.quit", mac, cmd_q.ctx));
    EXPECT_FALSE(engine.ActionPressed("app.quit", mac, ctrl_q.ctx));
    EXPECT_TRUE(engine.ActionPressed("app.quit", Linux(), ctrl_q.ctx));

    // No quit binding in the browser.
    kb::EvalContext web;
    web.platform = kb::Platform::Web;
    EXPECT_FALSE(engine.ActionPressed("app.quit", web, ctrl_q.ctx));
}

TEST(KeyBindings, UnknownActionIsNeverPressed)
{
    kb::KeyBindingsEngine engine;
    KeyFrame any(Key::A);
    EXPECT_FALSE(engine.ActionPressed("does.not.exist", Linux(), any.ctx));
    EXPECT_TRUE(engine.ShortcutLabel("does.not.exist", kb::Platform::Linux).empty());
}

TEST(KeyBindings, ShortcutLabels)
{
    kb::KeyBindingsEngine engine;
    EXPECT_EQ(engine.ShortcutLabel("edit.copy_results", kb::Platform::Linux), "Ctrl+C");
    EXPECT_EQ(engine.ShortcutLabel("edit.copy_results", kb::Platform::MacOS), "Super+C");
    EXPECT_EQ(engine.ShortcutLabel("scan.home", kb::Platform::Web), "Alt+Home");
    EXPECT_TRUE(engine.ShortcutLabel("app.quit", kb::Platform::Web).empty());
}

TEST(KeyBindings, MissingFileFallsBackToDefaults)
{
    ScopedTempDir tmp;
    kb::KeyBindingsEngine engine;
    std::string err;
    EXPECT_FALSE(engine.LoadFromFile((tmp.Path() / "absent.json").string(), err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(engine.IsDirty());
    EXPECT_EQ(engine.LastError(), err);
    EXPECT_EQ(engine.Actions().size(), kb::DefaultActions().size());
}

TEST(KeyBindings, SaveThenLoadKeepsOverrides)
{
    ScopedTempDir tmp;
    const std::string path = (tmp.Path() / "key-bindings.json").string();

    const std::string custom = R"({
  "schema_version": 1,
  "actions": [
    { "id": "scan.start", "bindings": [ { "chord": "F5" } ] },
    { "id": "future.action", "title": "Later", "bindings": [ { "chord": "F9" } ] }
  ]
})";
    dscope_test::WriteText(path, custom);

    kb::KeyBindingsEngine engine;
    std::string err;
    ASSERT_TRUE(engine.LoadFromFile(path, err)) << err;
    EXPECT_FALSE(engine.IsDirty());

    KeyFrame f5(Key::F5);
    KeyFrame enter(Key::Enter);
    EXPECT_TRUE(engine.ActionPressed("scan.start", Linux(), f5.ctx));
    EXPECT_FALSE(engine.ActionPressed("scan.start", Linux(), enter.ctx));
    // Actions absent from the file keep their defaults.
    KeyFrame esc(Key::Escape);
    EXPECT_TRUE(engine.ActionPressed("scan.stop", Linux(), esc.ctx));

    ASSERT_TRUE(engine.SaveToFile(path, err)) << err;

    kb::KeyBindingsEngine reloaded;
    ASSERT_TRUE(reloaded.LoadFromFile(path, err)) << err;
    EXPECT_TRUE(reloaded.ActionPressed("scan.start", Linux(), f5.ctx));
    bool has_future = false;
    for (const kb::Action& a : reloaded.Actions())
        has_future = has_future || a.id == "future.action";
    EXPECT_TRUE(has_future);
}

TEST(KeyBindings, RejectsUnsupportedSchema)
{
    ScopedTempDir tmp;
    const std::string path = (tmp.Path() / "key-bindings.json").string();
    dscope_test::WriteText(path, R"({ "schema_version": 2, "actions": [] })");

    kb::KeyBindingsEngine engine;
    std::string err;
    EXPECT_FALSE(engine.LoadFromFile(path, err));
    EXPECT_NE(err.find("schema_version"), std::string::npos);
}
