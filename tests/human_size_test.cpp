#include <gtest/gtest.h>

#include "core/human_size.h"

using dscope::FormatBytes;

TEST(HumanSize, BytesBelowOneKibi)
{
    EXPECT_EQ(FormatBytes(0), "0 B");
    EXPECT_EQ(FormatBytes(1), "1 B");
    EXPECT_EQ(FormatBytes(1023), "1023 B");
}

TEST(HumanSize, BinaryUnits)
{
    EXPECT_EQ(FormatBytes(1024), "1.0 KiB");
    EXPECT_EQ(FormatBytes(1536), "1.5 KiB");
    EXPECT_EQ(FormatBytes(1024ull * 1024), "1.0 MiB");
    EXPECT_EQ(FormatBytes(3ull * 1024 * 1024 * 1024), "3.0 GiB");
    EXPECT_EQ(FormatBytes(1024ull * 1024 * 1024 * 1024), "1.0 TiB");
}

TEST(HumanSize, LargestValueStaysInExbibytes)
{
    EXPECT_EQ(FormatBytes(~0ull), "16.0 EiB");
}
