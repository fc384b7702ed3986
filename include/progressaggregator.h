/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef PROGRESSAGGREGATOR_H
#define PROGRESSAGGREGATOR_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

struct ProgressSnapshot
{
    uintmax_t files_completed = 0;
    uintmax_t files_total = 0;
    uintmax_t bytes_completed = 0;
    uintmax_t bytes_total = 0;
};

/*
    Shared progress counters of one batch.

    Every counter update is a single atomic operation. After each update the
    counters are published as the latest snapshot. Only the latest snapshot
    is kept so publishing never waits for readers.

    bytes_total only grows. Growth is applied before the bytes it covers are
    credited to bytes_completed.
*/
class ProgressAggregator
{
    public:
        ProgressAggregator();

        void start(const uintmax_t& files_total, const uintmax_t& bytes_total);
        // Credit written bytes, growing the total first by growth bytes
        void addBytes(const uintmax_t& bytes, const uintmax_t& growth = 0);
        // Take back bytes of an attempt that was discarded
        void subtractBytes(const uintmax_t& bytes);
        // Count a finished file, crediting bytes in the same update
        void completeFile(const uintmax_t& bytes = 0, const uintmax_t& growth = 0);

        ProgressSnapshot getSnapshot() const;
        unsigned long long getSequence() const;
        // Wait until a snapshot newer than sequence is published.
        // Returns false on timeout, otherwise updates sequence and snapshot.
        bool waitForUpdate(unsigned long long& sequence, ProgressSnapshot& snapshot, const std::chrono::milliseconds& timeout) const;

        ProgressAggregator(const ProgressAggregator&) = delete;
        ProgressAggregator& operator= (const ProgressAggregator&) = delete;
    private:
        void publish();

        std::atomic<uintmax_t> iFilesCompleted;
        std::atomic<uintmax_t> iFilesTotal;
        std::atomic<uintmax_t> iBytesCompleted;
        std::atomic<uintmax_t> iBytesTotal;

        ProgressSnapshot latest;
        unsigned long long iSequence;
        mutable std::mutex m;
        mutable std::condition_variable cvar;
};

#endif // PROGRESSAGGREGATOR_H
