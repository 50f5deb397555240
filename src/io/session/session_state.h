#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Small persistent "session" state for the app:
// - native window geometry (size/position/maximized)
// - the last scanned path + a short recent list
// - runtime knobs (event queue capacity, native tick rate, accessibility)
struct SessionState
{
    // Main window geometry (native host only).
    int  window_w = 1280;
    int  window_h = 800;
    int  window_x = 0;
    int  window_y = 0;
    bool window_pos_valid = false;
    bool window_maximized = false;

    // Scan
    std::string scan_path;
    // Most recently scanned roots, newest first. Used by the path combo.
    std::vector<std::string> recent_paths;

    // Host runtime
    size_t event_queue_capacity = 256;
    int    tick_hz = 60;

    // Accessibility
    bool accessibility_enabled = true;
    bool announce_scan_complete = true;

    // UI theme id ("dirscope-dark", "dirscope-light").
    std::string ui_theme = "dirscope-dark";
};

constexpr size_t kMaxRecentPaths = 10;
constexpr size_t kMinQueueCapacity = 2;
constexpr size_t kMaxQueueCapacity = 65536;
constexpr int    kMinTickHz = 1;
constexpr int    kMaxTickHz = 240;

// Moves `path` to the front of recent_paths, dropping duplicates and trimming to kMaxRecentPaths.
void PushRecentPath(SessionState& st, const std::string& path);

// Brings out-of-range values back into their valid range.
void ClampSessionState(SessionState& st);

// Returns an absolute directory path intended for app config/state.
// On Linux prefers $XDG_CONFIG_HOME/dirscope, then $HOME/.config/dirscope.
std::string GetDirscopeConfigDir();

// Returns absolute paths for persisted state.
std::string GetSessionStatePath();

// Default location (GetSessionStatePath()).
bool LoadSessionState(SessionState& out, std::string& err);
bool SaveSessionState(const SessionState& st, std::string& err);

// Explicit location (tests, --settings).
// A missing file is not an error: `out` keeps its defaults.
bool LoadSessionStateFrom(const std::string& path, SessionState& out, std::string& err);
bool SaveSessionStateTo(const std::string& path, const SessionState& st, std::string& err);
