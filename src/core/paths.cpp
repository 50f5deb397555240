#include "core/paths.h"

#include "io/session/session_state.h"

#include <cstdlib>
#include <filesystem>

std::string DirscopeConfigPath(const std::string& relative)
{
    namespace fs = std::filesystem;
    if (relative.empty())
        return GetDirscopeConfigDir();
    return (fs::path(GetDirscopeConfigDir()) / relative).string();
}

std::string GetHomeDir()
{
#if defined(__EMSCRIPTEN__)
    return {};
#else
#if defined(_WIN32)
    const char* v = std::getenv("USERPROFILE");
#else
    const char* v = std::getenv("HOME");
#endif
    return (v && *v) ? std::string(v) : std::string();
#endif
}
