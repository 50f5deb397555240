#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/dir_scanner.h"

struct SessionState;

namespace kb { class KeyBindingsEngine; }

// AppState is an integration-level container used by `RunFrame()`.
// It owns the scan and the small amount of UI bookkeeping, and stores pointers
// to the services that are created in `main()`.
struct AppState
{
    struct Persistence
    {
        SessionState* session_state = nullptr;
    } persist;

    struct Services
    {
        kb::KeyBindingsEngine* keybinds = nullptr;
    } services;

    struct Scan
    {
        dscope::DirScanner scanner;
        dscope::ScanLimits limits;

        // Editable path field.
        std::string path_input;

        // Top entries of the running or finished scan, refreshed once per frame.
        std::vector<dscope::ScanEntry> shown;
        double started_s = 0.0;
        double finished_s = 0.0;
    } scan;

    struct Ui
    {
        float ui_scale = 1.0f;
        float clear_color[4] = {0.08f, 0.09f, 0.10f, 1.00f};
        // Set when the theme changed mid-frame; applied before the next NewFrame().
        bool theme_dirty = false;
        // One-line feedback for clipboard actions.
        std::string status;
    } ui;

    // Frame loop bookkeeping
    bool done = false;
    std::uint64_t frame_counter = 0;
};
