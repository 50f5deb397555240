#include "app/run_frame.h"

#include <cfloat>
#include <cstdio>
#include <string>
#include <variant>

#include "imgui.h"
#include "misc/cpp/imgui_stdlib.h"

#include "app/app_state.h"
#include "app/clipboard_tags.h"
#include "app/imgui_input_feed.h"

#include "core/frame_context.h"
#include "core/host_error.h"
#include "core/human_size.h"
#include "core/key_bindings.h"
#include "core/paths.h"
#include "core/scan_report.h"

#include "io/session/session_state.h"

#include "ui/skin.h"

namespace app
{
namespace
{
constexpr size_t kShownEntries = 10;

// First line of `s` without surrounding whitespace.
static std::string FirstLineTrimmed(const std::string& s)
{
    size_t end = s.find_first_of("\r\n");
    if (end == std::string::npos)
        end = s.size();
    size_t b = 0;
    while (b < end && (s[b] == ' ' || s[b] == '\t'))
        ++b;
    size_t e = end;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t'))
        --e;
    return s.substr(b, e - b);
}

static std::string ShortcutSuffix(const AppState& st, const char* action_id)
{
    if (!st.services.keybinds)
        return {};
    return st.services.keybinds->ShortcutLabel(action_id, kb::RuntimePlatform());
}

static void StartScan(AppState& st, const dscope::FrameContext& ctx, dscope::FrameOutput& out)
{
    const std::string path = FirstLineTrimmed(st.scan.path_input);
    st.scan.path_input = path;
    st.scan.shown.clear();
    st.scan.started_s = ctx.time_s;

    if (!st.scan.scanner.Start(path))
    {
        out.Announce("Scan failed. " + st.scan.scanner.ErrorMessage(), dscope::AnnouncePriority::Assertive);
        return;
    }
    if (SessionState* ss = st.persist.session_state)
    {
        ss->scan_path = path;
        PushRecentPath(*ss, path);
    }
}

static void StopScan(AppState& st)
{
    st.scan.scanner.Stop();
    st.scan.shown.clear();
}

static void GoHome(AppState& st)
{
    const std::string home = GetHomeDir();
    if (!home.empty())
        st.scan.path_input = home;
}

static bool HasResults(const AppState& st)
{
    const dscope::DirScanner::State s = st.scan.scanner.GetState();
    return !st.scan.shown.empty() &&
           (s == dscope::DirScanner::State::Scanning || s == dscope::DirScanner::State::Done);
}

static void CopyResults(AppState& st, dscope::FrameOutput& out)
{
    if (!HasResults(st))
        return;
    const std::string tsv = dscope::FormatResultsTsv(st.scan.scanner.Root(), st.scan.shown);
    out.WriteClipboard(kClipboard_CopyResults, dscope::ClipboardText{tsv});
    st.ui.status = "Copying results...";
}

static void PastePath(AppState& st, dscope::FrameOutput& out)
{
    out.ReadClipboard(kClipboard_PastePath);
    st.ui.status = "Reading clipboard...";
}

static void HandleClipboardResults(AppState& st, const dscope::FrameContext& ctx, dscope::FrameOutput& out)
{
    for (const dscope::ClipboardNotification& n : ctx.clipboard)
    {
        if (n.outcome != dscope::ClipboardOutcome::Ok)
        {
            const char* what = (n.tag == kClipboard_CopyResults) ? "Copy" : "Paste";
            const dscope::HostError err = dscope::HostErrorFromOutcome(n.outcome);
            st.ui.status = std::string(what) + " failed: " + dscope::HostErrorName(err);
            if (!n.detail.empty())
                st.ui.status += " (" + n.detail + ")";
            out.Announce(std::string(what) + " failed: clipboard " +
                             (err == dscope::HostError::PermissionDenied ? "permission denied" : "unavailable"),
                         dscope::AnnouncePriority::Polite);
            continue;
        }

        switch (n.tag)
        {
            case kClipboard_CopyResults:
                st.ui.status = "Results copied to the clipboard.";
                break;
            case kClipboard_PastePath:
            {
                const dscope::ClipboardText* text =
                    n.payload ? std::get_if<dscope::ClipboardText>(&*n.payload) : nullptr;
                const std::string path = text ? FirstLineTrimmed(text->utf8) : std::string();
                if (path.empty())
                {
                    st.ui.status = "Clipboard holds no text.";
                    break;
                }
                st.scan.path_input = path;
                st.ui.status = "Path pasted.";
                break;
            }
            default:
                std::fprintf(stderr, "[clipboard] result with unknown tag %d ignored\n", n.tag);
                break;
        }
    }
}

static void HandleKeybindings(AppState& st, const dscope::FrameContext& ctx, dscope::FrameOutput& out)
{
    const kb::KeyBindingsEngine* keybinds = st.services.keybinds;
    if (!keybinds)
        return;

    kb::EvalContext ec;
    ec.text_input_active = ImGui::GetIO().WantTextInput;
    ec.platform = kb::RuntimePlatform();

    const bool scanning = st.scan.scanner.IsScanning();

    if (!scanning && keybinds->ActionPressed("scan.start", ec, ctx))
        StartScan(st, ctx, out);
    if (scanning && keybinds->ActionPressed("scan.stop", ec, ctx))
        StopScan(st);
    if (ctx.caps.filesystem_home && keybinds->ActionPressed("scan.home", ec, ctx))
        GoHome(st);
    if (ctx.caps.clipboard && keybinds->ActionPressed("edit.copy_results", ec, ctx))
        CopyResults(st, out);
    if (ctx.caps.clipboard && keybinds->ActionPressed("edit.paste_path", ec, ctx))
        PastePath(st, out);
    if (ctx.caps.quit_menu && keybinds->ActionPressed("app.quit", ec, ctx))
        st.done = true;
}

static void AdvanceScan(AppState& st, const dscope::FrameContext& ctx, dscope::FrameOutput& out)
{
    dscope::DirScanner& scanner = st.scan.scanner;
    if (!scanner.IsScanning())
        return;

    const bool finished = scanner.Step(st.scan.limits);
    st.scan.shown = scanner.Top(kShownEntries);
    if (!finished)
        return;

    st.scan.finished_s = ctx.time_s;
    std::fprintf(stderr, "[scan] %s: %zu entries, %llu files in %.2fs\n",
                 scanner.Root().c_str(),
                 scanner.ChildCount(),
                 (unsigned long long)scanner.FilesCounted(),
                 st.scan.finished_s - st.scan.started_s);

    const SessionState* ss = st.persist.session_state;
    if (!ss || ss->announce_scan_complete)
    {
        const std::string total = dscope::FormatBytes(dscope::TotalBytes(st.scan.shown));
        out.Announce("Scan complete. " + std::to_string(scanner.ChildCount()) + " entries, total " + total + ".",
                     dscope::AnnouncePriority::Polite);
    }
}

static void RenderMenuBar(AppState& st, const dscope::FrameContext& ctx)
{
    if (!ImGui::BeginMenuBar())
        return;

    // No File->Quit on web pages.
    if (ctx.caps.quit_menu && ImGui::BeginMenu("File"))
    {
        const std::string quit_shortcut = ShortcutSuffix(st, "app.quit");
        if (ImGui::MenuItem("Quit", quit_shortcut.empty() ? nullptr : quit_shortcut.c_str()))
            st.done = true;
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("View"))
    {
        SessionState* ss = st.persist.session_state;
        const char* current = ss ? ss->ui_theme.c_str() : ui::DefaultThemeId();
        for (int i = 0; i < ui::ThemeCount(); ++i)
        {
            const char* id = ui::ThemeIdByIndex(i);
            const bool selected = std::string(current) == id;
            if (ImGui::MenuItem(ui::ThemeDisplayName(id), nullptr, selected) && !selected && ss)
            {
                ss->ui_theme = id;
                st.ui.theme_dirty = true;
            }
        }
        if (ss)
        {
            ImGui::Separator();
            ImGui::MenuItem("Announce scan completion", nullptr, &ss->announce_scan_complete);
        }
        ImGui::EndMenu();
    }

    ImGui::EndMenuBar();
}

static void RenderControls(AppState& st, const dscope::FrameContext& ctx, dscope::FrameOutput& out)
{
    const bool scanning = st.scan.scanner.IsScanning();

    ImGui::BeginDisabled(!ctx.caps.filesystem_home);
    if (ImGui::Button("Home"))
        GoHome(st);
    ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::SetNextItemWidth(ImGui::GetFontSize() * 28.0f);
    ImGui::InputTextWithHint("##path", "Directory to scan", &st.scan.path_input);

    // Recent roots, newest first.
    const SessionState* ss = st.persist.session_state;
    if (ss && !ss->recent_paths.empty())
    {
        ImGui::SameLine();
        if (ImGui::BeginCombo("##recent", nullptr, ImGuiComboFlags_NoPreview))
        {
            for (const std::string& p : ss->recent_paths)
                if (ImGui::Selectable(p.c_str(), p == st.scan.path_input))
                    st.scan.path_input = p;
            ImGui::EndCombo();
        }
    }

    ImGui::SameLine();
    if (ImGui::Button("Stop"))
        StopScan(st);

    if (!scanning)
    {
        ImGui::SameLine();
        if (ImGui::Button("Calculate"))
            StartScan(st, ctx, out);
    }

    ImGui::BeginDisabled(!ctx.caps.clipboard || !HasResults(st));
    ImGui::SameLine();
    if (ImGui::Button("Copy results"))
        CopyResults(st, out);
    ImGui::EndDisabled();

    ImGui::BeginDisabled(!ctx.caps.clipboard);
    ImGui::SameLine();
    if (ImGui::Button("Paste path"))
        PastePath(st, out);
    ImGui::EndDisabled();
}

static void RenderResults(const AppState& st)
{
    const std::vector<dscope::ScanEntry>& entries = st.scan.shown;
    const std::uint64_t total = dscope::TotalBytes(entries);

    const ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_SizingFixedFit | ImGuiTableFlags_BordersInnerV;
    if (!ImGui::BeginTable("results", 3, flags))
        return;

    ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_WidthStretch);
    ImGui::TableSetupColumn("Share", ImGuiTableColumnFlags_WidthFixed, ImGui::GetFontSize() * 14.0f);
    ImGui::TableSetupColumn("Size", ImGuiTableColumnFlags_WidthFixed, ImGui::GetFontSize() * 7.0f);

    for (const dscope::ScanEntry& e : entries)
    {
        const float share = dscope::ShareOf(e.bytes, total);
        char overlay[32];
        std::snprintf(overlay, sizeof(overlay), "%.0f%%", share * 100.0f);

        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted(e.name.c_str());
        ImGui::TableSetColumnIndex(1);
        ImGui::ProgressBar(share, ImVec2(-FLT_MIN, 0.0f), overlay);
        ImGui::TableSetColumnIndex(2);
        ImGui::TextUnformatted(dscope::FormatBytes(e.bytes).c_str());
    }

    ImGui::TableNextRow();
    ImGui::TableSetColumnIndex(0);
    ImGui::Text("Total: %s", dscope::FormatBytes(total).c_str());
    ImGui::EndTable();
}

static void RenderStatus(const AppState& st)
{
    const dscope::DirScanner& scanner = st.scan.scanner;
    switch (scanner.GetState())
    {
        case dscope::DirScanner::State::Idle:
            break;
        case dscope::DirScanner::State::Scanning:
            ImGui::Text("Scanning in progress... (%llu files)", (unsigned long long)scanner.FilesCounted());
            RenderResults(st);
            break;
        case dscope::DirScanner::State::Done:
            ImGui::TextUnformatted("Done");
            RenderResults(st);
            break;
        case dscope::DirScanner::State::Error:
            ImGui::Text("Error: %s", scanner.ErrorMessage().c_str());
            break;
    }
}
} // namespace

void RunFrame(AppState& st, const dscope::FrameContext& ctx, dscope::FrameOutput& out)
{
    st.frame_counter++;

    if (st.ui.theme_dirty)
    {
        const char* theme = st.persist.session_state ? st.persist.session_state->ui_theme.c_str() : nullptr;
        ui::ApplyTheme(theme, st.ui.ui_scale);
        ui::ThemeClearColor(theme, st.ui.clear_color);
        st.ui.theme_dirty = false;
    }

    FeedImGuiInput(ctx);
    ImGui::NewFrame();

    HandleClipboardResults(st, ctx, out);
    HandleKeybindings(st, ctx, out);
    AdvanceScan(st, ctx, out);

    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(vp->WorkPos);
    ImGui::SetNextWindowSize(vp->WorkSize);
    const ImGuiWindowFlags wflags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_MenuBar |
                                    ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoMove |
                                    ImGuiWindowFlags_NoBringToFrontOnFocus;
    if (ImGui::Begin("Dirscope", nullptr, wflags))
    {
        RenderMenuBar(st, ctx);

        ImGui::TextUnformatted("Dir scan");
        ImGui::Separator();
        RenderControls(st, ctx, out);
        if (!st.ui.status.empty())
            ImGui::TextDisabled("%s", st.ui.status.c_str());
        RenderStatus(st);
    }
    ImGui::End();

    ImGui::Render();
    out.draw.draw_data = ImGui::GetDrawData();
    for (int i = 0; i < 4; ++i)
        out.draw.clear_color[i] = st.ui.clear_color[i];

    if (st.done)
        out.RequestStop();
}
} // namespace app
