#pragma once

namespace ui
{
// Theme ids (persisted in session.json)
inline constexpr const char* kThemeDark  = "dirscope-dark";
inline constexpr const char* kThemeLight = "dirscope-light";

// Returns the default theme id.
const char* DefaultThemeId();

// Applies the named theme to ImGui::GetStyle() and then scales style sizes for HiDPI.
// If theme_id is null/empty/unknown, falls back to DefaultThemeId().
void ApplyTheme(const char* theme_id, float ui_scale);

// Clear color of the presentation surface behind the UI for the theme (RGBA).
void ThemeClearColor(const char* theme_id, float out_rgba[4]);

// Helpers for UI.
int         ThemeCount();
const char* ThemeIdByIndex(int idx);
const char* ThemeDisplayName(const char* theme_id);
} // namespace ui
