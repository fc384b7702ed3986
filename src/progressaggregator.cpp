/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "progressaggregator.h"

ProgressAggregator::ProgressAggregator()
    : iFilesCompleted(0), iFilesTotal(0), iBytesCompleted(0), iBytesTotal(0), iSequence(0)
{
}

void ProgressAggregator::start(const uintmax_t& files_total, const uintmax_t& bytes_total)
{
    iFilesCompleted.store(0);
    iBytesCompleted.store(0);
    iFilesTotal.store(files_total);
    iBytesTotal.store(bytes_total);
    this->publish();
}

void ProgressAggregator::addBytes(const uintmax_t& bytes, const uintmax_t& growth)
{
    if (growth > 0)
        iBytesTotal.fetch_add(growth);
    iBytesCompleted.fetch_add(bytes);
    this->publish();
}

void ProgressAggregator::subtractBytes(const uintmax_t& bytes)
{
    if (bytes == 0)
        return;
    iBytesCompleted.fetch_sub(bytes);
    this->publish();
}

void ProgressAggregator::completeFile(const uintmax_t& bytes, const uintmax_t& growth)
{
    if (growth > 0)
        iBytesTotal.fetch_add(growth);
    if (bytes > 0)
        iBytesCompleted.fetch_add(bytes);
    iFilesCompleted.fetch_add(1);
    this->publish();
}

void ProgressAggregator::publish()
{
    std::unique_lock<std::mutex> lock(m);
    // Read completed before total. Total only grows and is grown before
    // bytes are credited, so this order never shows completed > total.
    latest.files_completed = iFilesCompleted.load();
    latest.bytes_completed = iBytesCompleted.load();
    latest.files_total = iFilesTotal.load();
    latest.bytes_total = iBytesTotal.load();
    ++iSequence;
    lock.unlock();
    cvar.notify_all();
}

ProgressSnapshot ProgressAggregator::getSnapshot() const
{
    std::lock_guard<std::mutex> lock(m);
    return latest;
}

unsigned long long ProgressAggregator::getSequence() const
{
    std::lock_guard<std::mutex> lock(m);
    return iSequence;
}

bool ProgressAggregator::waitForUpdate(unsigned long long& sequence, ProgressSnapshot& snapshot, const std::chrono::milliseconds& timeout) const
{
    std::unique_lock<std::mutex> lock(m);
    unsigned long long last = sequence;
    if (!cvar.wait_for(lock, timeout, [this, last]{ return iSequence != last; }))
        return false;

    sequence = iSequence;
    snapshot = latest;
    return true;
}
