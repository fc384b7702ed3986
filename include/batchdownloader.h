/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef BATCHDOWNLOADER_H
#define BATCHDOWNLOADER_H

#include "config.h"
#include "descriptor.h"
#include "downloaderror.h"
#include "httpclient.h"
#include "message.h"
#include "progressaggregator.h"
#include "threadsafequeue.h"

#include <memory>
#include <vector>

const unsigned int OUTCOME_FRESH      = 1 << 0;
const unsigned int OUTCOME_DOWNLOADED = 1 << 1;
const unsigned int OUTCOME_DRYRUN     = 1 << 2; // download required but not performed

struct BatchState;

class BatchDownloader
{
    public:
        BatchDownloader(std::shared_ptr<HttpClient> client, const BatchConfig& conf);
        virtual ~BatchDownloader();

        /*
            Download every descriptor that isn't already present on disk.

            At most concurrency_limit transfers run at once. With bDeepCheck
            files that look complete are hashed before being skipped. With
            bSkipDownload nothing is transferred and the return value only
            tells whether something would have been.

            Returns true if any descriptor needed a download. Throws the first
            DownloadError of the batch, after every worker has stopped.
        */
        bool download(const std::vector<Descriptor>& descriptors, const unsigned int& concurrency_limit,
                      const bool& bDeepCheck, const bool& bSkipDownload,
                      std::shared_ptr<ProgressAggregator> progress = nullptr);

        // Workers push several messages per descriptor and nothing is dropped.
        // Callers must drain the queue, during or after each batch.
        std::shared_ptr<ThreadSafeQueue<Message>> getMessageQueue() const { return msgQueue; };
    private:
        void processQueue(BatchState& state, const unsigned int& tid);
        unsigned int processDescriptor(BatchState& state, const Descriptor& descriptor, const std::string& msg_prefix);
        void recordFailure(BatchState& state, const DownloadError& error, const std::string& msg_prefix);

        std::shared_ptr<HttpClient> client;
        BatchConfig batchConf;
        std::shared_ptr<ThreadSafeQueue<Message>> msgQueue;
};

#endif // BATCHDOWNLOADER_H
