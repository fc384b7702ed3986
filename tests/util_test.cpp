/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "util.h"
#include "progressbar.h"

#include <gtest/gtest.h>

TEST(Util, ChecksumTypeOption)
{
    EXPECT_EQ(Util::getOptionValue("sha1", GlobalConstants::CHECKSUM_TYPES, false), GlobalConstants::CHECKSUM_SHA1);
    EXPECT_EQ(Util::getOptionValue("SHA-256", GlobalConstants::CHECKSUM_TYPES, false), GlobalConstants::CHECKSUM_SHA256);
    EXPECT_EQ(Util::getOptionValue("MD5", GlobalConstants::CHECKSUM_TYPES, false), GlobalConstants::CHECKSUM_MD5);
    EXPECT_EQ(Util::getOptionValue("crc32", GlobalConstants::CHECKSUM_TYPES, false), 0u);
    EXPECT_EQ(Util::getOptionNameString(GlobalConstants::CHECKSUM_SHA256, GlobalConstants::CHECKSUM_TYPES), "SHA-256");
}

TEST(Util, SizeAndRateStrings)
{
    EXPECT_EQ(Util::makeSizeString(512), "512.00 B");
    EXPECT_EQ(Util::makeSizeString(1024), "1.00 kB");
    EXPECT_EQ(Util::makeSizeString(3 * 1048576ULL), "3.00 MB");
    EXPECT_EQ(Util::makeRateString(2048), "2.00kB/s");
    EXPECT_EQ(Util::makeRateString(2 * 1048576.0 + 1), "2.00MB/s");
}

TEST(Util, EtaString)
{
    EXPECT_EQ(Util::makeEtaString(1000, 0), "-");
    EXPECT_EQ(Util::makeEtaString(100, 10), "10s");
    EXPECT_EQ(Util::makeEtaString(boost::posix_time::seconds(3725)), "1h 02m 05s");
}

TEST(ProgressBar, SimpleBar)
{
    ProgressBar bar(false, false);
    EXPECT_EQ(bar.createBarString(10, 0.5), "[=====     ]");
    EXPECT_EQ(bar.createBarString(4, 1.0), "[====]");
    EXPECT_EQ(bar.createBarString(4, 0.0), "[    ]");
}

TEST(ProgressBar, ProgressTextFitsTerminal)
{
    ProgressBar bar(false, false);
    ProgressSnapshot snapshot;
    snapshot.files_completed = 1;
    snapshot.files_total = 4;
    snapshot.bytes_completed = 512;
    snapshot.bytes_total = 1024;

    std::string text = bar.createProgressText(snapshot, 200);
    EXPECT_EQ(text.compare(0, 4, " 50%"), 0);
    EXPECT_NE(text.find("Files: 1/4"), std::string::npos);
    EXPECT_NE(text.find("["), std::string::npos);

    // Bar is dropped when there is no room for it
    text = bar.createProgressText(snapshot, 20);
    EXPECT_EQ(text.find("["), std::string::npos);
}

TEST(ProgressBar, RateFromSnapshots)
{
    ProgressBar bar(false, false);
    ProgressSnapshot snapshot;
    auto start = std::chrono::steady_clock::now();

    bar.update(snapshot, start);
    EXPECT_EQ(bar.getRate(), 0);

    snapshot.bytes_completed = 2048;
    bar.update(snapshot, start + std::chrono::seconds(2));
    EXPECT_DOUBLE_EQ(bar.getRate(), 1024.0);
}
