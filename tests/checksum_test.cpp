/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "checksum.h"
#include "util.h"
#include "testutil.h"

#include <gtest/gtest.h>

namespace
{
    std::string digestOf(const unsigned int& hash_id, const std::string& data)
    {
        StreamingDigest digest(hash_id);
        digest.update(data.data(), data.size());
        return digest.finalHex();
    }
}

TEST(Checksum, NormalizesExpectedHash)
{
    Checksum checksum(GlobalConstants::CHECKSUM_SHA1, "  A9993E364706816ABA3E25717850C26C9CD0D89D\n");
    EXPECT_EQ(checksum.getHash(), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_TRUE(checksum.matches("a9993e364706816aba3e25717850c26c9cd0d89d"));
    EXPECT_FALSE(checksum.matches("A9993E364706816ABA3E25717850C26C9CD0D89D"));
}

TEST(Checksum, TypeString)
{
    EXPECT_EQ(Checksum(GlobalConstants::CHECKSUM_SHA1, "x").getTypeString(), "sha1");
    EXPECT_EQ(Checksum(GlobalConstants::CHECKSUM_SHA256, "x").getTypeString(), "sha256");
    EXPECT_EQ(Checksum(GlobalConstants::CHECKSUM_MD5, "x").getTypeString(), "md5");
}

TEST(StreamingDigest, KnownDigests)
{
    EXPECT_EQ(digestOf(GlobalConstants::CHECKSUM_SHA1, "abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(digestOf(GlobalConstants::CHECKSUM_SHA256, "abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(digestOf(GlobalConstants::CHECKSUM_MD5, "abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(digestOf(GlobalConstants::CHECKSUM_SHA1, ""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(StreamingDigest, ChunkedUpdateMatchesWhole)
{
    std::string data = "hello world";
    StreamingDigest digest(GlobalConstants::CHECKSUM_SHA256);
    digest.update(data.data(), 3);
    digest.update(data.data() + 3, 5);
    digest.update(data.data() + 8, data.size() - 8);
    EXPECT_EQ(digest.finalHex(), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(StreamingDigest, ResetStartsOver)
{
    StreamingDigest digest(GlobalConstants::CHECKSUM_MD5);
    digest.update("garbage", 7);
    digest.reset();
    digest.update("hello world", 11);
    EXPECT_EQ(digest.finalHex(), "5eb63bbbe01eeed093cb22bb8f5acdc3");
}

TEST(StreamingDigest, UpdateAfterFinalThrows)
{
    StreamingDigest digest(GlobalConstants::CHECKSUM_SHA1);
    digest.finalHex();
    EXPECT_THROW(digest.update("a", 1), std::logic_error);
}

TEST(Util, FileHash)
{
    TempDir dir;
    writeFile(dir / "file.txt", "hello world");
    EXPECT_EQ(Util::getFileHash((dir / "file.txt").string(), GlobalConstants::CHECKSUM_SHA1), "2aae6c35c94fcfb415dbe95f408b9ce91ee846ed");
    EXPECT_EQ(Util::getFileHash((dir / "missing.txt").string(), GlobalConstants::CHECKSUM_SHA1), "");
}
