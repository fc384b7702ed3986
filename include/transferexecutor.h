/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef TRANSFEREXECUTOR_H
#define TRANSFEREXECUTOR_H

#include "cancellation.h"
#include "descriptor.h"
#include "downloaderror.h"
#include "httpclient.h"
#include "message.h"
#include "progressaggregator.h"
#include "retrypolicy.h"
#include "threadsafequeue.h"

#include <memory>
#include <string>

/*
    Downloads one descriptor end to end.

    The body is streamed to the destination while it is hashed and credited
    to the progress aggregator. A retried attempt takes back the bytes it
    credited and starts the file and the digest over. bytes_total is grown
    whenever more bytes arrive than were credited for the descriptor.

    Failures are thrown as DownloadError. Files that fail size or checksum
    verification are left on disk.
*/
class TransferExecutor
{
    public:
        TransferExecutor(std::shared_ptr<HttpClient> client, const RetryConfig& retryConf,
                         std::shared_ptr<ProgressAggregator> progress,
                         std::shared_ptr<CancellationToken> token = nullptr,
                         std::shared_ptr<ThreadSafeQueue<Message>> msgQueue = nullptr);

        // Returns the number of bytes written
        uintmax_t transfer(const Descriptor& descriptor, const std::string& msg_prefix = std::string()) const;
    private:
        void pushMessage(const Message& msg) const;

        std::shared_ptr<HttpClient> client;
        RetryPolicy retryPolicy;
        std::shared_ptr<ProgressAggregator> progress;
        std::shared_ptr<CancellationToken> token;
        std::shared_ptr<ThreadSafeQueue<Message>> msgQueue;
};

// Download a single file with its own one-file progress
void downloadFile(const Descriptor& descriptor, std::shared_ptr<HttpClient> client, const RetryConfig& retryConf,
                  std::shared_ptr<ProgressAggregator> progress = nullptr);

#endif // TRANSFEREXECUTOR_H
