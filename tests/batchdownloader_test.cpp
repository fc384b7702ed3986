/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "batchdownloader.h"
#include "fakehttpclient.h"
#include "testutil.h"

#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <thread>

namespace
{
    BatchConfig fastBatchConfig(const unsigned int& iCheckThreads = 2)
    {
        BatchConfig conf;
        conf.iCheckThreads = iCheckThreads;
        conf.retryConf.iRetries = 2;
        conf.retryConf.iInitialDelay = 1;
        conf.retryConf.iMaxDelay = 5;
        return conf;
    }

    std::string urlFor(const int& i)
    {
        return "http://example.com/file" + std::to_string(i);
    }
}

class BatchDownloaderTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            client = std::make_shared<FakeHttpClient>();
            progress = std::make_shared<ProgressAggregator>();
        }

        void serve(const std::string& url, const std::string& body, const size_t& chunk_size = 256, const std::chrono::milliseconds& delay = std::chrono::milliseconds(0))
        {
            FakeResponse response;
            response.body = body;
            response.chunk_size = chunk_size;
            response.chunk_delay = delay;
            client->setResponse(url, response);
        }

        TempDir dir;
        std::shared_ptr<FakeHttpClient> client;
        std::shared_ptr<ProgressAggregator> progress;
};

TEST_F(BatchDownloaderTest, DownloadsSingleFile)
{
    serve(urlFor(1), std::string(1024, 'a'));
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a.bin", boost::none, uintmax_t(1024)) };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_TRUE(downloader.download(descriptors, 1, false, false, progress));
    EXPECT_EQ(boost::filesystem::file_size(dir / "a.bin"), 1024u);

    ProgressSnapshot snapshot = progress->getSnapshot();
    EXPECT_EQ(snapshot.files_completed, 1u);
    EXPECT_EQ(snapshot.files_total, 1u);
    EXPECT_EQ(snapshot.bytes_completed, 1024u);
    EXPECT_EQ(snapshot.bytes_total, 1024u);
}

TEST_F(BatchDownloaderTest, ShortPayloadIsSizeMismatch)
{
    serve(urlFor(1), std::string(900, 'a'));
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a.bin", boost::none, uintmax_t(1024)) };

    BatchDownloader downloader(client, fastBatchConfig());
    try
    {
        downloader.download(descriptors, 1, false, false, progress);
        FAIL() << "expected SizeMismatch";
    }
    catch (const DownloadError& e)
    {
        EXPECT_EQ(e.getKind(), DLERROR_SIZE_MISMATCH);
        EXPECT_EQ(e.getExpectedSize(), 1024u);
        EXPECT_EQ(e.getActualSize(), 900u);
    }
}

TEST_F(BatchDownloaderTest, FreshFilesSkipNetwork)
{
    writeFile(dir / "a", "0123456789");
    writeFile(dir / "b", "abc");
    std::vector<Descriptor> descriptors = {
        Descriptor(urlFor(1), dir / "a", boost::none, uintmax_t(10)),
        Descriptor(urlFor(2), dir / "b", Checksum(GlobalConstants::CHECKSUM_SHA1, "da39a3ee5e6b4b0d3255bfef95601890afd80709"), uintmax_t(3))
    };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_FALSE(downloader.download(descriptors, 2, false, false, progress));
    EXPECT_EQ(client->getRequestCount(), 0u);

    ProgressSnapshot snapshot = progress->getSnapshot();
    EXPECT_EQ(snapshot.files_completed, 2u);
    EXPECT_EQ(snapshot.bytes_completed, 13u);
    EXPECT_EQ(snapshot.bytes_total, 13u);
}

TEST_F(BatchDownloaderTest, DryRunDoesNotTransfer)
{
    serve(urlFor(1), "payload");
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "missing.bin", boost::none, uintmax_t(7)) };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_TRUE(downloader.download(descriptors, 1, false, true, progress));
    EXPECT_FALSE(boost::filesystem::exists(dir / "missing.bin"));
    EXPECT_EQ(client->getRequestCount(), 0u);

    bool bListed = false;
    Message msg;
    while (downloader.getMessageQueue()->try_pop(msg))
    {
        if (msg.getMessage().find("Needs download: " + urlFor(1)) != std::string::npos)
            bListed = true;
    }
    EXPECT_TRUE(bListed);
}

TEST_F(BatchDownloaderTest, SecondRunIsIdempotent)
{
    std::vector<Descriptor> descriptors;
    for (int i = 0; i < 5; ++i)
    {
        serve(urlFor(i), std::string(100 + i, 'q'));
        descriptors.push_back(Descriptor(urlFor(i), dir / ("f" + std::to_string(i)), boost::none, uintmax_t(100 + i)));
    }

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_TRUE(downloader.download(descriptors, 2, false, false, progress));
    unsigned int iRequests = client->getRequestCount();
    EXPECT_EQ(iRequests, 5u);

    EXPECT_FALSE(downloader.download(descriptors, 2, false, false, progress));
    EXPECT_EQ(client->getRequestCount(), iRequests);
}

TEST_F(BatchDownloaderTest, ConcurrencyIsBounded)
{
    std::vector<Descriptor> descriptors;
    for (int i = 0; i < 8; ++i)
    {
        serve(urlFor(i), std::string(1000, 'c'), 100, std::chrono::milliseconds(3));
        descriptors.push_back(Descriptor(urlFor(i), dir / ("f" + std::to_string(i)), boost::none, uintmax_t(1000)));
    }

    BatchDownloader downloader(client, fastBatchConfig(4));
    EXPECT_TRUE(downloader.download(descriptors, 3, false, false, progress));
    EXPECT_LE(client->getMaxInFlight(), 3u);
    EXPECT_EQ(client->getRequestCount(), 8u);
    EXPECT_EQ(progress->getSnapshot().files_completed, 8u);
}

TEST_F(BatchDownloaderTest, HugeLimitStillStartsWorkerPerFile)
{
    std::vector<Descriptor> descriptors;
    for (int i = 0; i < 3; ++i)
    {
        serve(urlFor(i), std::string(1000, 'h'), 100, std::chrono::milliseconds(20));
        descriptors.push_back(Descriptor(urlFor(i), dir / ("f" + std::to_string(i)), boost::none, uintmax_t(1000)));
    }

    BatchDownloader downloader(client, fastBatchConfig(2));
    EXPECT_TRUE(downloader.download(descriptors, std::numeric_limits<unsigned int>::max(), false, false, progress));
    EXPECT_GE(client->getMaxInFlight(), 2u);
    EXPECT_EQ(progress->getSnapshot().files_completed, 3u);
}

TEST_F(BatchDownloaderTest, MessagesWaitUntilDrained)
{
    std::vector<Descriptor> descriptors;
    for (int i = 0; i < 3; ++i)
    {
        writeFile(dir / ("f" + std::to_string(i)), "abc");
        descriptors.push_back(Descriptor(urlFor(i), dir / ("f" + std::to_string(i)), boost::none, uintmax_t(3)));
    }

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_FALSE(downloader.download(descriptors, 1, false, false, progress));

    unsigned int iSkipped = 0;
    Message msg;
    while (downloader.getMessageQueue()->try_pop(msg))
    {
        if (msg.getMessage().find("Skipping complete file") != std::string::npos)
            ++iSkipped;
    }
    EXPECT_EQ(iSkipped, 3u);
    EXPECT_TRUE(downloader.getMessageQueue()->empty());
}

TEST_F(BatchDownloaderTest, DeepCheckMismatchRedownloads)
{
    writeFile(dir / "a", "xyz");
    serve(urlFor(1), "abc");
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a", Checksum(GlobalConstants::CHECKSUM_SHA1, "a9993e364706816aba3e25717850c26c9cd0d89d"), uintmax_t(3)) };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_FALSE(downloader.download(descriptors, 1, false, false, progress));
    EXPECT_EQ(client->getRequestCount(), 0u);

    EXPECT_TRUE(downloader.download(descriptors, 1, true, false, progress));
    EXPECT_EQ(client->getRequestCount(), 1u);
    EXPECT_EQ(readFile(dir / "a"), "abc");

    EXPECT_FALSE(downloader.download(descriptors, 1, true, false, progress));
    EXPECT_EQ(client->getRequestCount(), 1u);
}

TEST_F(BatchDownloaderTest, DeepCheckMismatchInDryRunNeedsDownload)
{
    writeFile(dir / "a", "xyz");
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a", Checksum(GlobalConstants::CHECKSUM_SHA1, "a9993e364706816aba3e25717850c26c9cd0d89d"), uintmax_t(3)) };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_TRUE(downloader.download(descriptors, 1, true, true, progress));
    EXPECT_EQ(client->getRequestCount(), 0u);
    EXPECT_EQ(readFile(dir / "a"), "xyz");
}

TEST_F(BatchDownloaderTest, DeepCheckWithoutChecksumRedownloads)
{
    writeFile(dir / "a", "stale");
    serve(urlFor(1), "fresh payload");
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a") };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_FALSE(downloader.download(descriptors, 1, false, false, progress));
    EXPECT_EQ(client->getRequestCount(), 0u);

    EXPECT_TRUE(downloader.download(descriptors, 1, true, true, progress));
    EXPECT_EQ(client->getRequestCount(), 0u);
    EXPECT_EQ(readFile(dir / "a"), "stale");

    EXPECT_TRUE(downloader.download(descriptors, 1, true, false, progress));
    EXPECT_EQ(client->getRequestCount(), 1u);
    EXPECT_EQ(readFile(dir / "a"), "fresh payload");
}

TEST_F(BatchDownloaderTest, ZeroSizeDoesNotMatchNonEmptyFile)
{
    writeFile(dir / "a", std::string(500, 'z'));
    serve(urlFor(1), "new");
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a", boost::none, uintmax_t(0)) };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_TRUE(downloader.download(descriptors, 1, false, false, progress));
    EXPECT_EQ(client->getRequestCount(), 1u);
    EXPECT_EQ(readFile(dir / "a"), "new");

    ProgressSnapshot snapshot = progress->getSnapshot();
    EXPECT_EQ(snapshot.bytes_completed, 3u);
    EXPECT_EQ(snapshot.bytes_total, 3u);
    EXPECT_EQ(snapshot.files_completed, 1u);
}

TEST_F(BatchDownloaderTest, UnknownSizesGrowTotal)
{
    serve(urlFor(1), std::string(5000, 'k'), 512);
    serve(urlFor(2), std::string(3000, 'k'), 512);
    std::vector<Descriptor> descriptors = {
        Descriptor(urlFor(1), dir / "a"),
        Descriptor(urlFor(2), dir / "b", boost::none, uintmax_t(0))
    };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_TRUE(downloader.download(descriptors, 2, false, false, progress));

    ProgressSnapshot snapshot = progress->getSnapshot();
    EXPECT_GE(snapshot.bytes_total, 8000u);
    EXPECT_EQ(snapshot.bytes_completed, 8000u);
    EXPECT_EQ(snapshot.files_completed, 2u);
}

TEST_F(BatchDownloaderTest, FreshFileWithoutSizeCountsLocalSize)
{
    writeFile(dir / "a", "12345");
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a") };

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_FALSE(downloader.download(descriptors, 1, false, false, progress));

    ProgressSnapshot snapshot = progress->getSnapshot();
    EXPECT_EQ(snapshot.bytes_completed, 5u);
    EXPECT_EQ(snapshot.bytes_total, 5u);
    EXPECT_EQ(snapshot.files_completed, 1u);
}

TEST_F(BatchDownloaderTest, ObserverNeverSeesCompletedAboveTotal)
{
    std::vector<Descriptor> descriptors;
    for (int i = 0; i < 6; ++i)
    {
        serve(urlFor(i), std::string(4096, 'o'), 64);
        // Half the descriptors declare no size so the total has to grow
        if (i % 2)
            descriptors.push_back(Descriptor(urlFor(i), dir / ("f" + std::to_string(i))));
        else
            descriptors.push_back(Descriptor(urlFor(i), dir / ("f" + std::to_string(i)), boost::none, uintmax_t(4096)));
    }

    std::atomic<bool> bDone(false);
    std::atomic<bool> bViolation(false);
    std::thread observer([&]()
    {
        unsigned long long sequence = 0;
        ProgressSnapshot snapshot;
        while (!bDone)
        {
            if (progress->waitForUpdate(sequence, snapshot, std::chrono::milliseconds(5)) && snapshot.bytes_completed > snapshot.bytes_total)
                bViolation = true;
        }
    });

    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_TRUE(downloader.download(descriptors, 3, false, false, progress));
    bDone = true;
    observer.join();

    EXPECT_FALSE(bViolation.load());
    ProgressSnapshot snapshot = progress->getSnapshot();
    EXPECT_EQ(snapshot.bytes_completed, 6u * 4096u);
    EXPECT_EQ(snapshot.bytes_total, 6u * 4096u);
}

TEST_F(BatchDownloaderTest, FirstFailureCancelsRemainingWork)
{
    // file0 fails right away, the others are slow
    FakeResponse notFound;
    notFound.response_code = 404;
    client->setResponse(urlFor(0), notFound);

    std::vector<Descriptor> descriptors = { Descriptor(urlFor(0), dir / "f0") };
    for (int i = 1; i < 6; ++i)
    {
        serve(urlFor(i), std::string(2000, 's'), 100, std::chrono::milliseconds(20));
        descriptors.push_back(Descriptor(urlFor(i), dir / ("f" + std::to_string(i)), boost::none, uintmax_t(2000)));
    }

    BatchDownloader downloader(client, fastBatchConfig(0));
    auto start = std::chrono::steady_clock::now();
    try
    {
        downloader.download(descriptors, 2, false, false, progress);
        FAIL() << "expected Non200StatusCode";
    }
    catch (const DownloadError& e)
    {
        EXPECT_EQ(e.getKind(), DLERROR_NON200_STATUS);
        EXPECT_EQ(e.getStatusCode(), 404);
    }

    // Every worker has been joined and queued descriptors were dropped
    EXPECT_EQ(client->getInFlight(), 0u);
    EXPECT_LE(client->getRequestCount(), 2u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(progress->getSnapshot().files_completed, 0u);
}

TEST_F(BatchDownloaderTest, ZeroConcurrencyIsRejected)
{
    std::vector<Descriptor> descriptors = { Descriptor(urlFor(1), dir / "a") };
    BatchDownloader downloader(client, fastBatchConfig());
    try
    {
        downloader.download(descriptors, 0, false, false, progress);
        FAIL() << "expected GenericDownload";
    }
    catch (const DownloadError& e)
    {
        EXPECT_EQ(e.getKind(), DLERROR_GENERIC);
    }
    EXPECT_EQ(client->getRequestCount(), 0u);
}

TEST_F(BatchDownloaderTest, EmptyBatch)
{
    BatchDownloader downloader(client, fastBatchConfig());
    EXPECT_FALSE(downloader.download(std::vector<Descriptor>(), 4, false, false, progress));

    EXPECT_GE(progress->getSequence(), 1u);
    ProgressSnapshot snapshot = progress->getSnapshot();
    EXPECT_EQ(snapshot.files_completed, 0u);
    EXPECT_EQ(snapshot.files_total, 0u);
    EXPECT_EQ(snapshot.bytes_completed, 0u);
    EXPECT_EQ(snapshot.bytes_total, 0u);
}
