#include "imgui.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#else
#include <SDL3/SDL.h>
#endif

#include "app/app_state.h"
#include "app/run_frame.h"

#include "core/accessibility_bridge.h"
#include "core/clipboard_bridge.h"
#include "core/event_queue.h"
#include "core/frame_driver.h"
#include "core/host_adapter.h"
#include "core/key_bindings.h"
#include "core/paths.h"

#include "io/session/session_state.h"

#include "ui/skin.h"

#if defined(__EMSCRIPTEN__)
#include "platform/web/web_host_adapter.h"
using HostAdapterImpl = dscope::WebHostAdapter;
#else
#include "platform/native/sdl_host_adapter.h"
using HostAdapterImpl = dscope::SdlHostAdapter;
#endif

// Set when we receive SIGINT (Ctrl+C) so the main loop can exit cleanly.
static volatile std::sig_atomic_t g_InterruptRequested = 0;

static void HandleInterruptSignal(int signal)
{
    if (signal == SIGINT)
        g_InterruptRequested = 1;
}

namespace
{
struct Options
{
    std::string path;          // --path
    std::string settings_path; // --settings; empty = default session file
};

static void PrintUsage(const char* argv0)
{
    std::fprintf(stderr, "usage: %s [--path <dir>] [--settings <file>]\n", argv0);
}

static bool ParseArgs(int argc, char** argv, Options& out, std::string& err)
{
    for (int i = 1; i < argc; ++i)
    {
        const char* a = argv[i];
        auto take_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc)
            {
                err = std::string("missing value for ") + a;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (std::strcmp(a, "--path") == 0)
        {
            if (!take_value(out.path))
                return false;
        }
        else if (std::strcmp(a, "--settings") == 0)
        {
            if (!take_value(out.settings_path))
                return false;
        }
        else
        {
            err = std::string("unknown argument: ") + a;
            return false;
        }
    }
    return true;
}

// Everything the frame loop touches. Heap-allocated so the browser main loop can
// keep it after main() returns control to the page.
struct App
{
    Options       options;
    SessionState  session_state;
    kb::KeyBindingsEngine keybinds;

    std::unique_ptr<dscope::EventQueue>          queue;
    std::unique_ptr<HostAdapterImpl>             host;
    std::unique_ptr<dscope::ClipboardBridge>     clipboard;
    std::unique_ptr<dscope::AccessibilityBridge> a11y;
    std::unique_ptr<dscope::FrameDriver>         driver;

    AppState st;
};

static void LoadSettings(App& app)
{
#if defined(__EMSCRIPTEN__)
    // The browser build runs on defaults and persists nothing.
    (void)app;
#else
    std::string err;
    const bool ok = app.options.settings_path.empty()
                        ? LoadSessionState(app.session_state, err)
                        : LoadSessionStateFrom(app.options.settings_path, app.session_state, err);
    if (!ok && !err.empty())
        std::fprintf(stderr, "[settings] %s\n", err.c_str());

    app.keybinds.SetPath(DirscopeConfigPath("key-bindings.json"));
    std::string kerr;
    if (!app.keybinds.LoadFromFile(app.keybinds.Path(), kerr) && !kerr.empty())
        std::fprintf(stderr, "[settings] key bindings: %s (using defaults)\n", kerr.c_str());
#endif

    if (!app.options.path.empty())
        app.session_state.scan_path = app.options.path;
}

#if !defined(__EMSCRIPTEN__)
static void SaveSettingsOnExit(App& app)
{
    SessionState& ss = app.session_state;
    if (SDL_Window* window = app.host->Window())
    {
        const SDL_WindowFlags flags = SDL_GetWindowFlags(window);
        ss.window_maximized = (flags & SDL_WINDOW_MAXIMIZED) != 0;
        // Keep the restored geometry of a maximized window.
        if (!ss.window_maximized)
        {
            int w = 0, h = 0, x = 0, y = 0;
            if (SDL_GetWindowSize(window, &w, &h) && w > 0 && h > 0)
            {
                ss.window_w = w;
                ss.window_h = h;
            }
            if (SDL_GetWindowPosition(window, &x, &y))
            {
                ss.window_x = x;
                ss.window_y = y;
                ss.window_pos_valid = true;
            }
        }
    }
    if (!app.st.scan.path_input.empty())
        ss.scan_path = app.st.scan.path_input;

    std::string err;
    const bool ok = app.options.settings_path.empty()
                        ? SaveSessionState(ss, err)
                        : SaveSessionStateTo(app.options.settings_path, ss, err);
    if (!ok)
        std::fprintf(stderr, "[settings] %s\n", err.c_str());

    if (app.keybinds.IsDirty())
    {
        std::string kerr;
        if (!app.keybinds.SaveToFile(app.keybinds.Path(), kerr))
            std::fprintf(stderr, "[settings] key bindings: %s\n", kerr.c_str());
    }
}
#endif

static bool Startup(App& app, std::string& err)
{
    LoadSettings(app);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    // Window layout is fixed; nothing to persist in imgui.ini.
    io.IniFilename = nullptr;

    app.queue = std::make_unique<dscope::EventQueue>(app.session_state.event_queue_capacity);
    app.host = std::make_unique<HostAdapterImpl>(*app.queue);

    dscope::HostConfig cfg;
    cfg.window_w = app.session_state.window_w;
    cfg.window_h = app.session_state.window_h;
    cfg.window_x = app.session_state.window_x;
    cfg.window_y = app.session_state.window_y;
    cfg.window_pos_valid = app.session_state.window_pos_valid;
    cfg.window_maximized = app.session_state.window_maximized;
    cfg.accessibility_enabled = app.session_state.accessibility_enabled;
    if (!app.host->Initialize(cfg, err))
        return false;

    const dscope::HostCapabilities& caps = app.host->Capabilities();
    app.clipboard = std::make_unique<dscope::ClipboardBridge>(app.host->Clipboard(), caps.clipboard);
    app.a11y = std::make_unique<dscope::AccessibilityBridge>(app.host->Accessibility(), caps.accessibility);

    if (app.session_state.ui_theme.empty())
        app.session_state.ui_theme = ui::DefaultThemeId();

    AppState& st = app.st;
    st.persist.session_state = &app.session_state;
    st.services.keybinds = &app.keybinds;
    st.scan.path_input = app.session_state.scan_path;
    st.ui.ui_scale = app.host->UiScale();
    st.ui.theme_dirty = true; // applied before the first NewFrame()

    app.driver = std::make_unique<dscope::FrameDriver>(
        *app.host, *app.clipboard, *app.a11y,
        [&app](const dscope::FrameContext& ctx, dscope::FrameOutput& out) {
            if (g_InterruptRequested)
                app.st.done = true;
            app::RunFrame(app.st, ctx, out);
        });
    return true;
}

// Tears down in reverse order of creation: the bridges drop late clipboard
// results, then the host releases its renderer backend before the ImGui context.
static void Teardown(App& app)
{
    app.driver.reset();
    app.clipboard.reset();
    app.a11y.reset();
    if (app.host)
    {
        const dscope::TranslatorStats& input = app.host->InputStats();
        if (input.unrecognized > 0)
            std::fprintf(stderr, "[host] %s: %llu input records ignored\n",
                         dscope::HostErrorName(dscope::HostError::UnrecognizedInput),
                         (unsigned long long)input.unrecognized);
        app.host->Shutdown();
    }
    app.host.reset();
    if (ImGui::GetCurrentContext())
        ImGui::DestroyContext();
}

// 0 after a normal end of the session, 1 when the surface was lost.
static int ExitCode(const App& app)
{
    const dscope::FrameDriver& driver = *app.driver;
    if (driver.StopReason() == dscope::HostError::PresentationLost && !app.host->CloseRequested())
    {
        std::fprintf(stderr, "[host] stopped after %llu frames: %s (%s)\n",
                     (unsigned long long)driver.FramesPresented(),
                     dscope::HostErrorName(driver.StopReason()),
                     driver.StopMessage().c_str());
        return 1;
    }
    return 0;
}

#if defined(__EMSCRIPTEN__)
static void WebMainLoop(void* arg)
{
    App* app = static_cast<App*>(arg);
    if (app->driver->Tick() != dscope::FrameDriver::TickResult::Stopped)
        return;

    const int code = ExitCode(*app);
    emscripten_cancel_main_loop();
    Teardown(*app);
    delete app;
    if (code != 0)
        std::fprintf(stderr, "[host] reload the page to restart\n");
}
#endif
} // namespace

int main(int argc, char** argv)
{
    std::unique_ptr<App> app = std::make_unique<App>();

    {
        std::string err;
        if (!ParseArgs(argc, argv, app->options, err))
        {
            std::fprintf(stderr, "%s\n", err.c_str());
            PrintUsage(argv[0]);
            return 2;
        }
    }

    // Arrange for Ctrl+C in the terminal to request a graceful shutdown instead
    // of abruptly killing the process (which can upset Vulkan/SDL).
    std::signal(SIGINT, HandleInterruptSignal);

    {
        std::string err;
        if (!Startup(*app, err))
        {
            std::fprintf(stderr, "[host] initialization failed: %s\n", err.c_str());
            Teardown(*app);
            return 1;
        }
    }

#if defined(__EMSCRIPTEN__)
    // requestAnimationFrame pacing; the loop owns `app` from here on.
    emscripten_set_main_loop_arg(&WebMainLoop, app.release(), 0, true);
    return 0;
#else
    const int tick_hz = app->session_state.tick_hz > 0 ? app->session_state.tick_hz : 60;
    const double period_s = 1.0 / (double)tick_hz;
    for (;;)
    {
        const double start_s = app->host->NowSeconds();
        if (app->driver->Tick() == dscope::FrameDriver::TickResult::Stopped)
            break;
        const double spent_s = app->host->NowSeconds() - start_s;
        if (spent_s < period_s)
            SDL_Delay((Uint32)((period_s - spent_s) * 1000.0));
    }

    const int code = ExitCode(*app);
    SaveSettingsOnExit(*app);
    Teardown(*app);
    return code;
#endif
}
