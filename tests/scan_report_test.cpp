#include <gtest/gtest.h>

#include "core/scan_report.h"

using namespace dscope;

TEST(ScanReport, TotalAndShare)
{
    const std::vector<ScanEntry> entries = {{"a", 300}, {"b", 100}};
    EXPECT_EQ(TotalBytes(entries), 400u);
    EXPECT_FLOAT_EQ(ShareOf(300, 400), 0.75f);
    EXPECT_FLOAT_EQ(ShareOf(100, 0), 0.0f);
    EXPECT_FLOAT_EQ(ShareOf(500, 400), 1.0f);
}

TEST(ScanReport, TsvLayout)
{
    const std::vector<ScanEntry> entries = {{"videos", 3072}, {"notes.txt", 1024}};
    const std::string tsv = FormatResultsTsv("/home/user", entries);
    EXPECT_EQ(tsv,
              "/home/user\n"
              "name\tbytes\tsize\tshare\n"
              "videos\t3072\t3.0 KiB\t75.0%\n"
              "notes.txt\t1024\t1.0 KiB\t25.0%\n"
              "Total:\t4096\t4.0 KiB\t100.0%\n");
}

TEST(ScanReport, EmptyResultsKeepHeaderAndTotal)
{
    EXPECT_EQ(FormatResultsTsv("/tmp", {}),
              "/tmp\n"
              "name\tbytes\tsize\tshare\n"
              "Total:\t0\t0 B\t0.0%\n");
}
