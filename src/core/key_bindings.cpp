#include "core/key_bindings.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <unordered_set>

#include "core/frame_context.h"

using json = nlohmann::json;
using dscope::Key;

namespace kb
{
namespace
{
static std::string ToLower(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string Trim(std::string s)
{
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_ws((unsigned char)s.front()))
        s.erase(s.begin());
    while (!s.empty() && is_ws((unsigned char)s.back()))
        s.pop_back();
    return s;
}

static Platform PlatformFromString(const std::string& p)
{
    const std::string pl = ToLower(p);
    if (pl == "windows") return Platform::Windows;
    if (pl == "linux") return Platform::Linux;
    if (pl == "macos") return Platform::MacOS;
    if (pl == "web") return Platform::Web;
    return Platform::Any;
}

static Context ContextFromString(const std::string& c)
{
    const std::string cl = ToLower(c);
    if (cl == "always") return Context::Always;
    return Context::Global;
}

static bool ContextAllowed(Context need, const EvalContext& have)
{
    switch (need)
    {
        case Context::Global: return !have.text_input_active;
        case Context::Always: return true;
        default: return false;
    }
}

static bool PlatformAllowed(Platform need, Platform have)
{
    return need == Platform::Any || need == have;
}

static Key KeyFromToken(const std::string& token_lower, bool& out_any_enter, bool& out_implied_shift)
{
    out_any_enter = false;
    out_implied_shift = false;

    const std::string t = token_lower;

    // Single-character alpha/digit
    if (t.size() == 1)
    {
        const char c = t[0];
        if (c >= 'a' && c <= 'z')
            return (Key)((int)Key::A + (c - 'a'));
        if (c >= '0' && c <= '9')
            return (Key)((int)Key::Num0 + (c - '0'));
    }

    // Function keys F1..F12
    if (t.size() >= 2 && t[0] == 'f')
    {
        const int n = std::atoi(t.c_str() + 1);
        if (n >= 1 && n <= 12)
            return (Key)((int)Key::F1 + (n - 1));
    }

    if (t == "left") return Key::Left;
    if (t == "right") return Key::Right;
    if (t == "up") return Key::Up;
    if (t == "down") return Key::Down;
    if (t == "home") return Key::Home;
    if (t == "end") return Key::End;
    if (t == "pageup") return Key::PageUp;
    if (t == "pagedown") return Key::PageDown;
    if (t == "insert") return Key::Insert;
    if (t == "delete") return Key::Delete;
    if (t == "backspace") return Key::Backspace;
    if (t == "escape" || t == "esc") return Key::Escape;
    if (t == "tab") return Key::Tab;
    if (t == "space") return Key::Space;

    if (t == "enter" || t == "return")
    {
        out_any_enter = true;
        return Key::Enter;
    }

    if (t == "," || t == "comma") return Key::Comma;
    if (t == "-" || t == "minus") return Key::Minus;
    if (t == "=" || t == "equal") return Key::Equal;
    if (t == "." || t == "period" || t == "dot") return Key::Period;
    if (t == "/" || t == "slash") return Key::Slash;
    if (t == ";" || t == "semicolon") return Key::Semicolon;
    if (t == "'" || t == "apostrophe" || t == "quote") return Key::Apostrophe;
    if (t == "[" || t == "leftbracket" || t == "lbracket") return Key::LeftBracket;
    if (t == "]" || t == "rightbracket" || t == "rbracket") return Key::RightBracket;
    if (t == "\\" || t == "backslash") return Key::Backslash;
    if (t == "`" || t == "grave" || t == "graveaccent") return Key::GraveAccent;

    // "Plus" is usually Shift+'=' on US layouts; represent as '=' with implied Shift.
    if (t == "+" || t == "plus")
    {
        out_implied_shift = true;
        return Key::Equal;
    }

    return Key::None;
}

static bool IsChordPressed(const ParsedChord& chord, bool repeat, const dscope::FrameContext& frame)
{
    if (chord.key == Key::None)
        return false;

    for (const dscope::InputEvent& ev : frame.events)
    {
        const dscope::KeyDown* kd = ev.As<dscope::KeyDown>();
        if (!kd)
            continue;
        if (kd->repeat && !repeat)
            continue;
        // Require exact modifier match: avoids Ctrl+Shift+Z also triggering Ctrl+Z, etc.
        if (kd->mods != chord.mods)
            continue;
        if (kd->key == chord.key)
            return true;
        if (chord.any_enter && kd->key == Key::KeypadEnter)
            return true;
    }
    return false;
}

static std::string ChordLabel(const ParsedChord& c)
{
    std::string out;
    if (c.mods.ctrl) out += "Ctrl+";
    if (c.mods.shift) out += "Shift+";
    if (c.mods.alt) out += "Alt+";
    if (c.mods.super) out += "Super+";
    out += dscope::KeyName(c.key);
    return out;
}

static json KeyBindingToJson(const KeyBinding& b)
{
    json out = json::object();
    out["enabled"] = b.enabled;
    out["chord"] = b.chord;
    out["context"] = b.context.empty() ? "global" : b.context;
    out["platform"] = b.platform.empty() ? "any" : b.platform;
    out["repeat"] = b.repeat;
    return out;
}

static bool KeyBindingFromJson(const json& jb, KeyBinding& out, std::string& err)
{
    err.clear();
    if (!jb.is_object())
    {
        err = "binding is not an object";
        return false;
    }
    out = KeyBinding{};
    if (jb.contains("enabled") && jb["enabled"].is_boolean())
        out.enabled = jb["enabled"].get<bool>();
    if (jb.contains("chord") && jb["chord"].is_string())
        out.chord = jb["chord"].get<std::string>();
    if (jb.contains("context") && jb["context"].is_string())
        out.context = jb["context"].get<std::string>();
    if (jb.contains("platform") && jb["platform"].is_string())
        out.platform = jb["platform"].get<std::string>();
    if (jb.contains("repeat") && jb["repeat"].is_boolean())
        out.repeat = jb["repeat"].get<bool>();

    if (out.context.empty()) out.context = "global";
    if (out.platform.empty()) out.platform = "any";

    if (out.enabled && out.chord.empty())
    {
        err = "binding chord is empty";
        return false;
    }
    return true;
}

static bool ActionFromJson(const json& ja, Action& out, std::string& err)
{
    err.clear();
    if (!ja.is_object())
    {
        err = "action is not an object";
        return false;
    }
    if (!ja.contains("id") || !ja["id"].is_string())
    {
        err = "action missing string 'id'";
        return false;
    }

    out = Action{};
    out.id = ja["id"].get<std::string>();
    if (ja.contains("title") && ja["title"].is_string())
        out.title = ja["title"].get<std::string>();
    if (ja.contains("category") && ja["category"].is_string())
        out.category = ja["category"].get<std::string>();
    if (ja.contains("description") && ja["description"].is_string())
        out.description = ja["description"].get<std::string>();

    if (out.title.empty()) out.title = out.id;
    if (out.category.empty()) out.category = "Other";

    if (ja.contains("bindings") && ja["bindings"].is_array())
    {
        for (const auto& jb : ja["bindings"])
        {
            KeyBinding b;
            std::string berr;
            if (!KeyBindingFromJson(jb, b, berr))
            {
                err = "action '" + out.id + "': " + berr;
                return false;
            }
            out.bindings.push_back(std::move(b));
        }
    }
    return true;
}

static json ActionToJson(const Action& a)
{
    json ja;
    ja["id"] = a.id;
    ja["title"] = a.title;
    ja["category"] = a.category;
    if (!a.description.empty())
        ja["description"] = a.description;
    json binds = json::array();
    for (const auto& b : a.bindings)
        binds.push_back(KeyBindingToJson(b));
    ja["bindings"] = std::move(binds);
    return ja;
}

static KeyBinding Bind(const char* chord, const char* context = "global", const char* platform = "any")
{
    KeyBinding b;
    b.chord = chord;
    b.context = context;
    b.platform = platform;
    return b;
}
} // namespace

bool ParseChordString(const std::string& chord, ParsedChord& out, std::string& err)
{
    err.clear();
    out = ParsedChord{};

    std::string s = Trim(chord);
    if (s.empty())
    {
        err = "empty chord";
        return false;
    }

    // Split on '+' but keep empty tokens (so "Ctrl++" yields a "+" key token).
    std::vector<std::string> parts;
    {
        std::string cur;
        for (char c : s)
        {
            if (c == '+')
            {
                parts.push_back(cur);
                cur.clear();
                continue;
            }
            cur.push_back(c);
        }
        parts.push_back(cur);
    }
    // Collapse consecutive empty tokens: "Ctrl++" -> ["Ctrl", ""] which maps to '+'.
    if (parts.size() >= 2)
    {
        std::vector<std::string> collapsed;
        collapsed.reserve(parts.size());
        for (size_t i = 0; i < parts.size(); ++i)
        {
            if (!collapsed.empty() && collapsed.back().empty() && parts[i].empty())
                continue;
            collapsed.push_back(std::move(parts[i]));
        }
        parts = std::move(collapsed);
    }

    dscope::Modifiers mods;
    std::optional<Key> key;
    bool any_enter = false;

    for (const std::string& part : parts)
    {
        std::string tok = Trim(part);
        if (tok.empty())
            tok = "+";
        const std::string tl = ToLower(tok);

        if (tl == "ctrl" || tl == "control")
        {
            mods.ctrl = true;
            continue;
        }
        if (tl == "shift")
        {
            mods.shift = true;
            continue;
        }
        if (tl == "alt" || tl == "option")
        {
            mods.alt = true;
            continue;
        }
        if (tl == "super" || tl == "meta" || tl == "win" || tl == "windows" || tl == "cmd" || tl == "command")
        {
            mods.super = true;
            continue;
        }

        bool token_any_enter = false;
        bool implied_shift = false;
        const Key k = KeyFromToken(tl, token_any_enter, implied_shift);
        if (k == Key::None)
        {
            err = "unknown key token '" + tok + "'";
            return false;
        }
        if (key.has_value())
        {
            err = "multiple keys in chord '" + chord + "'";
            return false;
        }
        key = k;
        any_enter = token_any_enter;
        if (implied_shift)
            mods.shift = true;
    }

    if (!key.has_value())
    {
        err = "chord has no key";
        return false;
    }

    out.mods = mods;
    out.key = key.value();
    out.any_enter = any_enter;
    return true;
}

Platform RuntimePlatform()
{
#if defined(__EMSCRIPTEN__)
    return Platform::Web;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

KeyBindingsEngine::KeyBindingsEngine()
{
    SetDefaults(DefaultActions());
}

void KeyBindingsEngine::SetDefaults(std::vector<Action> defaults)
{
    defaults_ = std::move(defaults);
    actions_ = defaults_;
    runtime_dirty_ = true;
}

std::vector<Action> KeyBindingsEngine::MergeDefaultsWithFile(const std::vector<Action>& defaults,
                                                             const std::vector<Action>& file_actions)
{
    // File entries override defaults by id; defaults missing from the file are kept
    // (new actions added by an update still get their default chord).
    std::vector<Action> merged;
    merged.reserve(defaults.size() + file_actions.size());

    std::unordered_map<std::string, const Action*> by_id;
    for (const Action& a : file_actions)
        by_id[a.id] = &a;

    std::unordered_set<std::string> emitted;
    for (const Action& d : defaults)
    {
        auto it = by_id.find(d.id);
        if (it != by_id.end())
        {
            Action a = *it->second;
            if (a.title.empty() || a.title == a.id) a.title = d.title;
            if (a.category.empty() || a.category == "Other") a.category = d.category;
            if (a.description.empty()) a.description = d.description;
            merged.push_back(std::move(a));
        }
        else
        {
            merged.push_back(d);
        }
        emitted.insert(d.id);
    }

    // Unknown ids are preserved so a newer file survives an older build.
    for (const Action& a : file_actions)
        if (emitted.insert(a.id).second)
            merged.push_back(a);

    return merged;
}

bool KeyBindingsEngine::LoadFromFile(const std::string& path, std::string& out_error)
{
    out_error.clear();
    path_ = path;

    std::ifstream f(path);
    if (!f)
    {
        // Missing file: fall back to defaults and mark dirty so they get written on exit.
        actions_ = defaults_;
        dirty_ = true;
        last_error_ = std::string("Could not open '") + path + "'. Using defaults (not saved yet).";
        out_error = last_error_;
        runtime_dirty_ = true;
        return false;
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        actions_ = defaults_;
        dirty_ = false;
        last_error_ = std::string("JSON parse error: ") + e.what();
        out_error = last_error_;
        runtime_dirty_ = true;
        return false;
    }

    if (!j.is_object())
    {
        out_error = "key-bindings.json root must be an object";
        last_error_ = out_error;
        return false;
    }
    if (!j.contains("schema_version") || !j["schema_version"].is_number_integer())
    {
        out_error = "key-bindings.json missing integer 'schema_version'";
        last_error_ = out_error;
        return false;
    }
    if (j["schema_version"].get<int>() != 1)
    {
        out_error = "Unsupported key-bindings schema_version (expected 1)";
        last_error_ = out_error;
        return false;
    }
    if (!j.contains("actions") || !j["actions"].is_array())
    {
        out_error = "key-bindings.json missing 'actions' array";
        last_error_ = out_error;
        return false;
    }

    std::vector<Action> file_actions;
    for (const auto& ja : j["actions"])
    {
        Action a;
        std::string err;
        if (!ActionFromJson(ja, a, err))
        {
            out_error = err;
            last_error_ = out_error;
            return false;
        }
        file_actions.push_back(std::move(a));
    }

    actions_ = MergeDefaultsWithFile(defaults_, file_actions);
    dirty_ = false;
    last_error_.clear();
    runtime_dirty_ = true;
    return true;
}

bool KeyBindingsEngine::SaveToFile(const std::string& path, std::string& out_error) const
{
    out_error.clear();

    json j;
    j["schema_version"] = 1;
    j["name"] = "Dirscope Key Bindings";
    j["description"] = "Action->key mapping for Dirscope. Chords are human-readable strings (e.g. Ctrl+C).";

    json actions = json::array();
    for (const auto& a : actions_)
        actions.push_back(ActionToJson(a));
    j["actions"] = std::move(actions);

    std::ofstream out(path);
    if (!out)
    {
        out_error = "Failed to open file for writing.";
        return false;
    }

    try
    {
        out << j.dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        out_error = std::string("Failed to write JSON: ") + e.what();
        return false;
    }

    return true;
}

void KeyBindingsEngine::RebuildRuntime() const
{
    runtime_dirty_ = false;
    action_index_by_id_.clear();
    runtime_actions_.clear();
    runtime_actions_.reserve(actions_.size());
    action_index_by_id_.reserve(actions_.size());

    for (size_t i = 0; i < actions_.size(); ++i)
    {
        const Action& a = actions_[i];
        action_index_by_id_[a.id] = i;

        RuntimeAction ra;
        ra.id = a.id;
        ra.bindings.reserve(a.bindings.size());

        for (const auto& b : a.bindings)
        {
            RuntimeBinding rb;
            rb.enabled = b.enabled;
            rb.ctx = ContextFromString(b.context);
            rb.platform = PlatformFromString(b.platform);
            rb.repeat = b.repeat;
            rb.chord_text = b.chord;

            std::string perr;
            if (!b.chord.empty() && ParseChordString(b.chord, rb.chord, perr))
                ra.bindings.push_back(std::move(rb));
            // Unparseable bindings are skipped at runtime; the file keeps them as written.
        }

        runtime_actions_.push_back(std::move(ra));
    }
}

const KeyBindingsEngine::RuntimeAction* KeyBindingsEngine::FindRuntime(std::string_view action_id) const
{
    if (runtime_dirty_)
        RebuildRuntime();

    const auto it = action_index_by_id_.find(std::string(action_id));
    if (it == action_index_by_id_.end() || it->second >= runtime_actions_.size())
        return nullptr;
    return &runtime_actions_[it->second];
}

bool KeyBindingsEngine::ActionPressed(std::string_view action_id,
                                      const EvalContext& ctx,
                                      const dscope::FrameContext& frame) const
{
    const RuntimeAction* ra = FindRuntime(action_id);
    if (!ra)
        return false;

    for (const auto& b : ra->bindings)
    {
        if (!b.enabled)
            continue;
        if (!PlatformAllowed(b.platform, ctx.platform))
            continue;
        if (!ContextAllowed(b.ctx, ctx))
            continue;
        if (IsChordPressed(b.chord, b.repeat, frame))
            return true;
    }
    return false;
}

std::string KeyBindingsEngine::ShortcutLabel(std::string_view action_id, Platform platform) const
{
    const RuntimeAction* ra = FindRuntime(action_id);
    if (!ra)
        return {};
    for (const auto& b : ra->bindings)
        if (b.enabled && PlatformAllowed(b.platform, platform))
            return ChordLabel(b.chord);
    return {};
}

std::vector<Action> DefaultActions()
{
    std::vector<Action> out;

    {
        Action a;
        a.id = "scan.start";
        a.title = "Calculate";
        a.category = "Scan";
        a.description = "Start scanning the directory in the path field.";
        a.bindings.push_back(Bind("Enter", "always"));
        out.push_back(std::move(a));
    }
    {
        Action a;
        a.id = "scan.stop";
        a.title = "Stop";
        a.category = "Scan";
        a.description = "Abort the running scan.";
        a.bindings.push_back(Bind("Escape", "always"));
        out.push_back(std::move(a));
    }
    {
        Action a;
        a.id = "scan.home";
        a.title = "Home";
        a.category = "Scan";
        a.description = "Put the user's home directory into the path field.";
        a.bindings.push_back(Bind("Alt+Home"));
        out.push_back(std::move(a));
    }
    {
        Action a;
        a.id = "edit.copy_results";
        a.title = "Copy results";
        a.category = "Edit";
        a.description = "Copy the result table to the clipboard as tab-separated text.";
        a.bindings.push_back(Bind("Ctrl+C", "global", "windows"));
        a.bindings.push_back(Bind("Ctrl+C", "global", "linux"));
        a.bindings.push_back(Bind("Cmd+C", "global", "macos"));
        a.bindings.push_back(Bind("Ctrl+C", "global", "web"));
        out.push_back(std::move(a));
    }
    {
        Action a;
        a.id = "edit.paste_path";
        a.title = "Paste path";
        a.category = "Edit";
        a.description = "Replace the path field with the clipboard text.";
        a.bindings.push_back(Bind("Ctrl+V", "global", "windows"));
        a.bindings.push_back(Bind("Ctrl+V", "global", "linux"));
        a.bindings.push_back(Bind("Cmd+V", "global", "macos"));
        a.bindings.push_back(Bind("Ctrl+V", "global", "web"));
        out.push_back(std::move(a));
    }
    {
        Action a;
        a.id = "app.quit";
        a.title = "Quit";
        a.category = "App";
        a.bindings.push_back(Bind("Ctrl+Q", "always", "windows"));
        a.bindings.push_back(Bind("Ctrl+Q", "always", "linux"));
        a.bindings.push_back(Bind("Cmd+Q", "always", "macos"));
        out.push_back(std::move(a));
    }

    return out;
}

} // namespace kb
