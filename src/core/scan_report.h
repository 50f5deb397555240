#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/dir_scanner.h"

namespace dscope
{
// Sum of the shown entries; the "Total:" row and the bar fractions use it.
std::uint64_t TotalBytes(const std::vector<ScanEntry>& entries);

// Fraction of `total` taken by `bytes`, in [0, 1]. 0 when total is 0.
float ShareOf(std::uint64_t bytes, std::uint64_t total);

// Tab-separated table for the clipboard:
//
//   <root>
//   name<TAB>bytes<TAB>size<TAB>percent
//   ...
//   Total:<TAB>bytes<TAB>size<TAB>100.0%
//
// Lines end with '\n'. Empty `entries` still produce the header and the total.
std::string FormatResultsTsv(const std::string& root, const std::vector<ScanEntry>& entries);
} // namespace dscope
