#include "ui/skin.h"

#include "imgui.h"

#include <cstring>

namespace ui
{
static bool IsNullOrEmpty(const char* s)
{
    return !s || !*s;
}

const char* DefaultThemeId()
{
    return kThemeDark;
}

int ThemeCount()
{
    return 2;
}

const char* ThemeIdByIndex(int idx)
{
    switch (idx)
    {
        case 0: return kThemeDark;
        case 1: return kThemeLight;
        default: return DefaultThemeId();
    }
}

static bool IsKnownThemeId(const char* theme_id)
{
    if (IsNullOrEmpty(theme_id))
        return false;
    return std::strcmp(theme_id, kThemeDark) == 0 || std::strcmp(theme_id, kThemeLight) == 0;
}

static const char* ResolveThemeId(const char* theme_id)
{
    return IsKnownThemeId(theme_id) ? theme_id : DefaultThemeId();
}

const char* ThemeDisplayName(const char* theme_id)
{
    const char* id = ResolveThemeId(theme_id);
    if (std::strcmp(id, kThemeLight) == 0) return "Light";
    return "Dark";
}

// Shared geometry: compact rows, square-ish frames, visible bar borders.
static void SetupStyle_Common(ImGuiStyle& style)
{
    style.Alpha = 1.0f;
    style.DisabledAlpha = 0.5f;
    style.WindowPadding = ImVec2(10.0f, 8.0f);
    style.WindowRounding = 0.0f;
    style.WindowBorderSize = 0.0f;
    style.WindowMinSize = ImVec2(32.0f, 32.0f);
    style.WindowTitleAlign = ImVec2(0.0f, 0.5f);
    style.ChildRounding = 2.0f;
    style.PopupRounding = 2.0f;
    style.PopupBorderSize = 1.0f;
    style.FramePadding = ImVec2(6.0f, 3.0f);
    style.FrameRounding = 2.0f;
    style.FrameBorderSize = 1.0f;
    style.ItemSpacing = ImVec2(8.0f, 5.0f);
    style.ItemInnerSpacing = ImVec2(4.0f, 4.0f);
    style.CellPadding = ImVec2(6.0f, 3.0f);
    style.IndentSpacing = 16.0f;
    style.ScrollbarSize = 12.0f;
    style.ScrollbarRounding = 2.0f;
    style.GrabMinSize = 8.0f;
    style.GrabRounding = 2.0f;
    style.TabRounding = 0.0f;
    style.ButtonTextAlign = ImVec2(0.5f, 0.5f);
    style.SelectableTextAlign = ImVec2(0.0f, 0.0f);
}

static void SetupStyle_Dark(ImGuiStyle& style)
{
    ImGui::StyleColorsDark(&style);
    SetupStyle_Common(style);

    ImVec4* c = style.Colors;
    c[ImGuiCol_Text] = ImVec4(0.90f, 0.91f, 0.93f, 1.00f);
    c[ImGuiCol_TextDisabled] = ImVec4(0.50f, 0.52f, 0.56f, 1.00f);
    c[ImGuiCol_WindowBg] = ImVec4(0.11f, 0.12f, 0.14f, 1.00f);
    c[ImGuiCol_PopupBg] = ImVec4(0.14f, 0.15f, 0.18f, 0.98f);
    c[ImGuiCol_Border] = ImVec4(0.26f, 0.28f, 0.32f, 1.00f);
    c[ImGuiCol_FrameBg] = ImVec4(0.17f, 0.18f, 0.21f, 1.00f);
    c[ImGuiCol_FrameBgHovered] = ImVec4(0.22f, 0.24f, 0.28f, 1.00f);
    c[ImGuiCol_FrameBgActive] = ImVec4(0.26f, 0.29f, 0.34f, 1.00f);
    c[ImGuiCol_MenuBarBg] = ImVec4(0.14f, 0.15f, 0.17f, 1.00f);
    c[ImGuiCol_Button] = ImVec4(0.20f, 0.36f, 0.52f, 0.80f);
    c[ImGuiCol_ButtonHovered] = ImVec4(0.25f, 0.45f, 0.64f, 1.00f);
    c[ImGuiCol_ButtonActive] = ImVec4(0.18f, 0.32f, 0.47f, 1.00f);
    c[ImGuiCol_Header] = ImVec4(0.20f, 0.36f, 0.52f, 0.55f);
    c[ImGuiCol_HeaderHovered] = ImVec4(0.25f, 0.45f, 0.64f, 0.80f);
    c[ImGuiCol_HeaderActive] = ImVec4(0.25f, 0.45f, 0.64f, 1.00f);
    c[ImGuiCol_PlotHistogram] = ImVec4(0.33f, 0.66f, 0.44f, 1.00f);
    c[ImGuiCol_PlotHistogramHovered] = ImVec4(0.40f, 0.78f, 0.52f, 1.00f);
    c[ImGuiCol_TableHeaderBg] = ImVec4(0.16f, 0.17f, 0.20f, 1.00f);
    c[ImGuiCol_TableRowBgAlt] = ImVec4(1.00f, 1.00f, 1.00f, 0.04f);
    c[ImGuiCol_TextSelectedBg] = ImVec4(0.25f, 0.45f, 0.64f, 0.45f);
}

static void SetupStyle_Light(ImGuiStyle& style)
{
    ImGui::StyleColorsLight(&style);
    SetupStyle_Common(style);

    ImVec4* c = style.Colors;
    c[ImGuiCol_Text] = ImVec4(0.10f, 0.11f, 0.13f, 1.00f);
    c[ImGuiCol_TextDisabled] = ImVec4(0.55f, 0.56f, 0.58f, 1.00f);
    c[ImGuiCol_WindowBg] = ImVec4(0.96f, 0.96f, 0.95f, 1.00f);
    c[ImGuiCol_PopupBg] = ImVec4(1.00f, 1.00f, 1.00f, 0.98f);
    c[ImGuiCol_Border] = ImVec4(0.75f, 0.76f, 0.78f, 1.00f);
    c[ImGuiCol_FrameBg] = ImVec4(1.00f, 1.00f, 1.00f, 1.00f);
    c[ImGuiCol_FrameBgHovered] = ImVec4(0.90f, 0.93f, 0.97f, 1.00f);
    c[ImGuiCol_FrameBgActive] = ImVec4(0.84f, 0.89f, 0.96f, 1.00f);
    c[ImGuiCol_MenuBarBg] = ImVec4(0.91f, 0.91f, 0.90f, 1.00f);
    c[ImGuiCol_Button] = ImVec4(0.78f, 0.85f, 0.94f, 1.00f);
    c[ImGuiCol_ButtonHovered] = ImVec4(0.68f, 0.79f, 0.93f, 1.00f);
    c[ImGuiCol_ButtonActive] = ImVec4(0.58f, 0.71f, 0.89f, 1.00f);
    c[ImGuiCol_PlotHistogram] = ImVec4(0.20f, 0.55f, 0.32f, 1.00f);
    c[ImGuiCol_PlotHistogramHovered] = ImVec4(0.16f, 0.46f, 0.26f, 1.00f);
    c[ImGuiCol_TableRowBgAlt] = ImVec4(0.00f, 0.00f, 0.00f, 0.04f);
}

void ThemeClearColor(const char* theme_id, float out_rgba[4])
{
    const bool light = std::strcmp(ResolveThemeId(theme_id), kThemeLight) == 0;
    const float dark_rgba[4] = {0.08f, 0.09f, 0.10f, 1.00f};
    const float light_rgba[4] = {0.90f, 0.90f, 0.89f, 1.00f};
    const float* src = light ? light_rgba : dark_rgba;
    for (int i = 0; i < 4; ++i)
        out_rgba[i] = src[i];
}

void ApplyTheme(const char* theme_id, float ui_scale)
{
    const char* id = ResolveThemeId(theme_id);

    // Reset to a clean base so switching themes doesn't leak old values.
    ImGuiStyle& style = ImGui::GetStyle();
    style = ImGuiStyle();

    if (std::strcmp(id, kThemeLight) == 0)
        SetupStyle_Light(style);
    else
        SetupStyle_Dark(style);

    // Apply current UI scale (HiDPI).
    if (ui_scale <= 0.0f)
        ui_scale = 1.0f;
    style.ScaleAllSizes(ui_scale);
    style.FontScaleDpi = ui_scale;
}
} // namespace ui
