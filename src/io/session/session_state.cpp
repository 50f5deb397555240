#include "io/session/session_state.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

static constexpr int kSchemaVersion = 1;

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetDirscopeConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/dirscope";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/dirscope";

    // Last resort: current directory
    return ".";
}

std::string GetSessionStatePath()
{
    return (fs::path(GetDirscopeConfigDir()) / "session.json").string();
}

void PushRecentPath(SessionState& st, const std::string& path)
{
    if (path.empty())
        return;
    auto& v = st.recent_paths;
    v.erase(std::remove(v.begin(), v.end(), path), v.end());
    v.insert(v.begin(), path);
    if (v.size() > kMaxRecentPaths)
        v.resize(kMaxRecentPaths);
}

void ClampSessionState(SessionState& st)
{
    st.window_w = std::max(st.window_w, 320);
    st.window_h = std::max(st.window_h, 240);
    st.event_queue_capacity = std::clamp(st.event_queue_capacity, kMinQueueCapacity, kMaxQueueCapacity);
    st.tick_hz = std::clamp(st.tick_hz, kMinTickHz, kMaxTickHz);
    if (st.ui_theme != "dirscope-dark" && st.ui_theme != "dirscope-light")
        st.ui_theme = "dirscope-dark";

    // Drop empties/duplicates that a hand-edited file may contain.
    std::vector<std::string> recent;
    recent.swap(st.recent_paths);
    for (auto it = recent.rbegin(); it != recent.rend(); ++it)
        PushRecentPath(st, *it);
}

static void EnsureParentDirExists(const std::string& path, std::string& err)
{
    err.clear();
    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = e.what();
    }
}

static json ToJson(const SessionState& st)
{
    json j;
    j["schema_version"] = kSchemaVersion;

    json win;
    win["w"] = st.window_w;
    win["h"] = st.window_h;
    win["x"] = st.window_x;
    win["y"] = st.window_y;
    win["pos_valid"] = st.window_pos_valid;
    win["maximized"] = st.window_maximized;
    j["window"] = std::move(win);

    json scan;
    scan["path"] = st.scan_path;
    scan["recent"] = st.recent_paths;
    j["scan"] = std::move(scan);

    json host;
    host["event_queue_capacity"] = st.event_queue_capacity;
    host["tick_hz"] = st.tick_hz;
    j["host"] = std::move(host);

    json a11y;
    a11y["enabled"] = st.accessibility_enabled;
    a11y["announce_scan_complete"] = st.announce_scan_complete;
    j["accessibility"] = std::move(a11y);

    json ui;
    ui["theme"] = st.ui_theme;
    j["ui"] = std::move(ui);

    return j;
}

static void FromJson(const json& j, SessionState& out)
{
    // Defaults are already in out; only override what we recognize.
    if (j.contains("window") && j["window"].is_object())
    {
        const json& w = j["window"];
        if (w.contains("w") && w["w"].is_number_integer()) out.window_w = w["w"].get<int>();
        if (w.contains("h") && w["h"].is_number_integer()) out.window_h = w["h"].get<int>();
        if (w.contains("x") && w["x"].is_number_integer()) out.window_x = w["x"].get<int>();
        if (w.contains("y") && w["y"].is_number_integer()) out.window_y = w["y"].get<int>();
        if (w.contains("pos_valid") && w["pos_valid"].is_boolean()) out.window_pos_valid = w["pos_valid"].get<bool>();
        if (w.contains("maximized") && w["maximized"].is_boolean()) out.window_maximized = w["maximized"].get<bool>();
    }

    if (j.contains("scan") && j["scan"].is_object())
    {
        const json& s = j["scan"];
        if (s.contains("path") && s["path"].is_string())
            out.scan_path = s["path"].get<std::string>();
        if (s.contains("recent") && s["recent"].is_array())
        {
            out.recent_paths.clear();
            for (const auto& e : s["recent"])
                if (e.is_string())
                    out.recent_paths.push_back(e.get<std::string>());
        }
    }

    if (j.contains("host") && j["host"].is_object())
    {
        const json& h = j["host"];
        if (h.contains("event_queue_capacity") && h["event_queue_capacity"].is_number_unsigned())
            out.event_queue_capacity = h["event_queue_capacity"].get<size_t>();
        else if (h.contains("event_queue_capacity") && h["event_queue_capacity"].is_number_integer())
        {
            const int v = h["event_queue_capacity"].get<int>();
            out.event_queue_capacity = (v > 0) ? static_cast<size_t>(v) : 0;
        }
        if (h.contains("tick_hz") && h["tick_hz"].is_number_integer())
            out.tick_hz = h["tick_hz"].get<int>();
    }

    if (j.contains("accessibility") && j["accessibility"].is_object())
    {
        const json& a = j["accessibility"];
        if (a.contains("enabled") && a["enabled"].is_boolean())
            out.accessibility_enabled = a["enabled"].get<bool>();
        if (a.contains("announce_scan_complete") && a["announce_scan_complete"].is_boolean())
            out.announce_scan_complete = a["announce_scan_complete"].get<bool>();
    }

    if (j.contains("ui") && j["ui"].is_object())
    {
        const json& ui = j["ui"];
        if (ui.contains("theme") && ui["theme"].is_string())
            out.ui_theme = ui["theme"].get<std::string>();
    }

    ClampSessionState(out);
}

bool LoadSessionStateFrom(const std::string& path, SessionState& out, std::string& err)
{
    err.clear();

    std::ifstream f(path);
    if (!f)
    {
        std::error_code ec;
        const bool exists = fs::exists(path, ec);
        if (exists && !ec)
        {
            err = std::string("Failed to open session state file for reading: ") + path;
            return false;
        }
        return true; // first run; use hardcoded defaults
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse session state: ") + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = "Session state root must be an object.";
        return false;
    }

    // Basic schema check (but keep it forgiving).
    if (j.contains("schema_version") && j["schema_version"].is_number_integer())
    {
        if (j["schema_version"].get<int>() != kSchemaVersion)
        {
            // Unknown schema: ignore file rather than failing startup.
            return true;
        }
    }

    try
    {
        FromJson(j, out);
    }
    catch (const std::exception& e)
    {
        err = std::string("Invalid session state: ") + e.what();
        return false;
    }
    return true;
}

bool SaveSessionStateTo(const std::string& path, const SessionState& st, std::string& err)
{
    err.clear();

    std::string derr;
    EnsureParentDirExists(path, derr);
    if (!derr.empty())
    {
        err = std::string("Failed to create config directory: ") + derr;
        return false;
    }

    // Atomic write: write to a temp file in the same directory then rename over the original.
    const std::string tmp_path = path + ".tmp";

    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "Failed to open temp session state file for writing.";
        return false;
    }

    try
    {
        out << ToJson(st).dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to write session state: ") + e.what();
        return false;
    }

    out.close();
    if (!out)
    {
        err = "Failed to finalize session state temp file write.";
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        err = std::string("Failed to atomically replace session state file: ") + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return false;
    }

    return true;
}

bool LoadSessionState(SessionState& out, std::string& err)
{
    return LoadSessionStateFrom(GetSessionStatePath(), out, err);
}

bool SaveSessionState(const SessionState& st, std::string& err)
{
    return SaveSessionStateTo(GetSessionStatePath(), st, err);
}
