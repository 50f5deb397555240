#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/input_event.h"

namespace dscope
{
struct FrameContext;
}

namespace kb
{
// Key binding schema + runtime evaluation engine.
//
// - Stores actions (id/title/category/description) each with 1+ bindings.
// - Loads/saves `key-bindings.json` (schema_version=1).
// - Evaluates chord presses against the KeyDown events of a FrameContext
//   (exact modifier match), so the same bindings work on every host.
// - Supports platform + context gating.

enum class Platform : std::uint8_t
{
    Any = 0,
    Windows,
    Linux,
    MacOS,
    Web,
};

enum class Context : std::uint8_t
{
    Global = 0, // only while no text field has keyboard focus
    Always,     // even while typing (Enter/Escape style actions)
};

struct KeyBinding
{
    bool        enabled  = true;
    std::string chord;    // e.g. "Ctrl+Shift+Z", "Alt+B", "Left", "F1"
    std::string context;  // "global", "always"
    std::string platform; // "any", "windows", "linux", "macos", "web"
    bool        repeat = false;
};

struct Action
{
    std::string             id;          // stable internal id, e.g. "scan.start"
    std::string             title;       // UI label
    std::string             category;    // grouping (Scan/Edit/App)
    std::string             description; // optional help text
    std::vector<KeyBinding> bindings;
};

struct ParsedChord
{
    dscope::Modifiers mods;
    dscope::Key       key = dscope::Key::None;
    bool              any_enter = false; // if true, match Enter OR KeypadEnter
};

// Parses a chord string like "Ctrl+Shift+Z" into a normalized chord.
// Returns false on parse error (err contains human-readable message).
bool ParseChordString(const std::string& chord, ParsedChord& out, std::string& err);

// Runtime platform (compile-time best effort).
Platform RuntimePlatform();

struct EvalContext
{
    bool     text_input_active = false;
    Platform platform = Platform::Any;
};

class KeyBindingsEngine
{
public:
    KeyBindingsEngine();

    void SetDefaults(std::vector<Action> defaults);

    bool LoadFromFile(const std::string& path, std::string& out_error);
    bool SaveToFile(const std::string& path, std::string& out_error) const;

    const std::vector<Action>& Actions() const { return actions_; }

    const std::string& Path() const { return path_; }
    void SetPath(std::string path) { path_ = std::move(path); }

    bool IsDirty() const { return dirty_; }
    const std::string& LastError() const { return last_error_; }

    // True if one of the action's bindings was pressed during `frame`.
    bool ActionPressed(std::string_view action_id, const EvalContext& ctx, const dscope::FrameContext& frame) const;

    // Display text of the first enabled binding for menus ("Ctrl+C"), or empty.
    std::string ShortcutLabel(std::string_view action_id, Platform platform) const;

private:
    struct RuntimeBinding
    {
        bool        enabled = true;
        Context     ctx = Context::Global;
        Platform    platform = Platform::Any;
        bool        repeat = false;
        ParsedChord chord;
        std::string chord_text;
    };

    struct RuntimeAction
    {
        std::string id;
        std::vector<RuntimeBinding> bindings;
    };

    static std::vector<Action> MergeDefaultsWithFile(const std::vector<Action>& defaults,
                                                     const std::vector<Action>& file_actions);
    void RebuildRuntime() const;
    const RuntimeAction* FindRuntime(std::string_view action_id) const;

private:
    std::string path_ = "key-bindings.json";
    bool        dirty_ = false;
    std::string last_error_;

    std::vector<Action> defaults_;
    std::vector<Action> actions_;

    mutable bool runtime_dirty_ = true;
    mutable std::unordered_map<std::string, size_t> action_index_by_id_;
    mutable std::vector<RuntimeAction> runtime_actions_;
};

// Built-in default actions.
std::vector<Action> DefaultActions();

} // namespace kb
