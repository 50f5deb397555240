#pragma once

#include <cstdint>
#include <string>

namespace dscope
{
// Binary-unit size label: "512 B", "1.5 KiB", "3.0 GiB".
std::string FormatBytes(std::uint64_t bytes);
} // namespace dscope
