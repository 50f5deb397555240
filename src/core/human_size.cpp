#include "core/human_size.h"

#include <cstdio>

namespace dscope
{
std::string FormatBytes(std::uint64_t bytes)
{
    static const char* kUnits[] = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    constexpr std::uint64_t kUnit = 1024;

    char buf[32];
    if (bytes < kUnit)
    {
        std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
        return buf;
    }

    double value = (double)bytes / (double)kUnit;
    int unit = 0;
    while (value >= (double)kUnit && unit < 5)
    {
        value /= (double)kUnit;
        ++unit;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
    return buf;
}
} // namespace dscope
