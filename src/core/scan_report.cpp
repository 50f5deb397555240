#include "core/scan_report.h"

#include <cinttypes>
#include <cstdio>

#include "core/human_size.h"

namespace dscope
{
std::uint64_t TotalBytes(const std::vector<ScanEntry>& entries)
{
    std::uint64_t total = 0;
    for (const ScanEntry& e : entries)
        total += e.bytes;
    return total;
}

float ShareOf(std::uint64_t bytes, std::uint64_t total)
{
    if (total == 0)
        return 0.0f;
    const double f = (double)bytes / (double)total;
    if (f < 0.0)
        return 0.0f;
    if (f > 1.0)
        return 1.0f;
    return (float)f;
}

static void AppendRow(std::string& out, const std::string& name, std::uint64_t bytes, float share)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "\t%" PRIu64 "\t", bytes);
    out += name;
    out += buf;
    out += FormatBytes(bytes);
    std::snprintf(buf, sizeof(buf), "\t%.1f%%\n", (double)share * 100.0);
    out += buf;
}

std::string FormatResultsTsv(const std::string& root, const std::vector<ScanEntry>& entries)
{
    const std::uint64_t total = TotalBytes(entries);

    std::string out;
    out += root;
    out += "\n";
    out += "name\tbytes\tsize\tshare\n";
    for (const ScanEntry& e : entries)
        AppendRow(out, e.name, e.bytes, ShareOf(e.bytes, total));
    AppendRow(out, "Total:", total, total > 0 ? 1.0f : 0.0f);
    return out;
}
} // namespace dscope
