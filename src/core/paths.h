#pragma once

#include <string>

// Joins the config dir (GetDirscopeConfigDir()) and a relative path within it.
// Example: DirscopeConfigPath("key-bindings.json") -> "<config_dir>/key-bindings.json"
std::string DirscopeConfigPath(const std::string& relative);

// The user's home directory, or empty when the host has none (browser sandbox).
std::string GetHomeDir();
