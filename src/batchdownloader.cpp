/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "batchdownloader.h"
#include "admissiongate.h"
#include "cancellation.h"
#include "freshness.h"
#include "transferexecutor.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>

struct BatchState
{
    BatchState(const std::vector<Descriptor>& descriptors, const unsigned int& concurrency_limit)
        : descriptors(descriptors), gate(concurrency_limit), bDownloadRequired(false) {};

    const std::vector<Descriptor>& descriptors;
    ThreadSafeQueue<size_t> queue; // indexes into descriptors
    AdmissionGate gate;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<ProgressAggregator> progress;
    std::unique_ptr<TransferExecutor> executor;
    bool bDeepCheck;
    bool bSkipDownload;
    std::atomic<bool> bDownloadRequired;

    std::mutex mtx_failure;
    std::unique_ptr<DownloadError> firstError;
};

BatchDownloader::BatchDownloader(std::shared_ptr<HttpClient> client, const BatchConfig& conf)
    : client(client), batchConf(conf), msgQueue(std::make_shared<ThreadSafeQueue<Message>>())
{
}

BatchDownloader::~BatchDownloader()
{
}

bool BatchDownloader::download(const std::vector<Descriptor>& descriptors, const unsigned int& concurrency_limit,
                               const bool& bDeepCheck, const bool& bSkipDownload,
                               std::shared_ptr<ProgressAggregator> progress)
{
    if (concurrency_limit == 0)
        throw DownloadError::GenericDownload("Concurrency limit must be at least 1");

    if (!progress)
        progress = std::make_shared<ProgressAggregator>();

    uintmax_t iTotalBytes = 0;
    for (const auto& descriptor : descriptors)
    {
        if (descriptor.getSize())
            iTotalBytes += *descriptor.getSize();
    }
    progress->start(descriptors.size(), iTotalBytes);

    if (descriptors.empty())
        return false;

    BatchState state(descriptors, concurrency_limit);
    state.token = std::make_shared<CancellationToken>();
    state.progress = progress;
    state.bDeepCheck = bDeepCheck;
    state.bSkipDownload = bSkipDownload;
    state.executor.reset(new TransferExecutor(client, batchConf.retryConf, progress, state.token, msgQueue));

    for (size_t i = 0; i < descriptors.size(); ++i)
        state.queue.push(i);

    // Transfer slots plus workers for freshness checks, limited to number of items in queue
    uintmax_t iWorkers = static_cast<uintmax_t>(concurrency_limit) + batchConf.iCheckThreads;
    unsigned int iThreads = static_cast<unsigned int>(std::min(iWorkers, static_cast<uintmax_t>(descriptors.size())));

    std::vector<std::thread> vThreads;
    try
    {
        for (unsigned int i = 0; i < iThreads; ++i)
            vThreads.push_back(std::thread(&BatchDownloader::processQueue, this, std::ref(state), i));
    }
    catch (const std::system_error& e)
    {
        this->recordFailure(state, DownloadError::GenericDownload(std::string("Failed to create download thread: ") + e.what()), "");
    }

    // Join threads
    for (unsigned int i = 0; i < vThreads.size(); ++i)
        vThreads[i].join();

    if (state.firstError)
        throw *state.firstError;

    return state.bDownloadRequired.load();
}

void BatchDownloader::processQueue(BatchState& state, const unsigned int& tid)
{
    std::string msg_prefix = "[Thread #" + std::to_string(tid) + "]";

    size_t index;
    while (!state.token->isCancelled() && state.queue.try_pop(index))
    {
        const Descriptor& descriptor = state.descriptors[index];
        try
        {
            unsigned int outcome = this->processDescriptor(state, descriptor, msg_prefix);
            if (outcome & (OUTCOME_DOWNLOADED | OUTCOME_DRYRUN))
                state.bDownloadRequired.store(true);
        }
        catch (const DownloadError& e)
        {
            this->recordFailure(state, e, msg_prefix);
        }
        catch (const std::exception& e)
        {
            this->recordFailure(state, DownloadError::GenericDownload(descriptor.toString() + ": " + e.what()), msg_prefix);
        }
    }

    msgQueue->push(Message("Finished all tasks", MSGTYPE_INFO, msg_prefix, MSGLEVEL_DEBUG));
}

unsigned int BatchDownloader::processDescriptor(BatchState& state, const Descriptor& descriptor, const std::string& msg_prefix)
{
    std::string filename = descriptor.getPath().filename().string();

    if (Freshness::quickCheck(descriptor) == FRESHNESS_LOOKS_FRESH)
    {
        bool bFresh = true;
        if (state.bDeepCheck)
        {
            std::string local_hash;
            bFresh = Freshness::deepVerify(descriptor, &local_hash);
            if (!descriptor.getChecksum())
            {
                msgQueue->push(Message("No checksum to verify, redownloading: " + filename, MSGTYPE_INFO, msg_prefix, MSGLEVEL_VERBOSE));
            }
            else if (!bFresh)
            {
                const Checksum& checksum = *descriptor.getChecksum();
                msgQueue->push(Message("Hash mismatch (" + checksum.getTypeString() + ") for file: " + descriptor.getPath().string() + " - expected: " + checksum.getHash() + " - got: " + local_hash, MSGTYPE_WARNING, msg_prefix, MSGLEVEL_VERBOSE));
            }
        }

        if (bFresh)
        {
            // Files without declared size add their local size to the total
            uintmax_t filesize = descriptor.hasKnownSize() ? *descriptor.getSize() : Freshness::localSize(descriptor);
            uintmax_t growth = descriptor.hasKnownSize() ? 0 : filesize;
            state.progress->completeFile(filesize, growth);
            msgQueue->push(Message("Skipping complete file: " + filename, MSGTYPE_INFO, msg_prefix, MSGLEVEL_VERBOSE));
            return OUTCOME_FRESH;
        }
    }

    if (state.bSkipDownload)
    {
        msgQueue->push(Message("Needs download: " + descriptor.toString(), MSGTYPE_INFO, msg_prefix, MSGLEVEL_DEFAULT));
        return OUTCOME_DRYRUN;
    }

    AdmissionPermit permit(state.gate, *state.token);
    if (!permit.isAcquired())
        throw DownloadError::Cancelled(descriptor.getUrl());

    state.executor->transfer(descriptor, msg_prefix);
    return OUTCOME_DOWNLOADED;
}

// First real failure wins and stops the rest of the batch
void BatchDownloader::recordFailure(BatchState& state, const DownloadError& error, const std::string& msg_prefix)
{
    std::unique_lock<std::mutex> lock(state.mtx_failure);
    if (state.firstError || error.getKind() == DLERROR_CANCELLED)
    {
        lock.unlock();
        msgQueue->push(Message(std::string("Discarded result: ") + error.what(), MSGTYPE_INFO, msg_prefix, MSGLEVEL_VERBOSE));
        return;
    }

    state.firstError.reset(new DownloadError(error));
    lock.unlock();

    msgQueue->push(Message(std::string("Stopping batch: ") + error.what(), MSGTYPE_ERROR, msg_prefix, MSGLEVEL_VERBOSE));

    state.token->cancel();
    size_t dropped = state.queue.clear();
    state.gate.wake();
    if (dropped > 0)
        msgQueue->push(Message("Cancelled " + std::to_string(dropped) + " queued files", MSGTYPE_WARNING, msg_prefix, MSGLEVEL_VERBOSE));
}
