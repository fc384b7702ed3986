/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef CANCELLATION_H
#define CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Stop signal shared by every task of one batch
class CancellationToken
{
    public:
        CancellationToken() : bCancelled(false) {};

        void cancel()
        {
            std::unique_lock<std::mutex> lock(m);
            bCancelled.store(true);
            lock.unlock();
            cvar.notify_all();
        }

        bool isCancelled() const
        {
            return bCancelled.load();
        }

        // Sleep for duration or until cancelled. Returns true if cancelled.
        bool waitFor(const std::chrono::milliseconds& duration)
        {
            std::unique_lock<std::mutex> lock(m);
            return cvar.wait_for(lock, duration, [this]{ return bCancelled.load(); });
        }

        CancellationToken(const CancellationToken&) = delete;
        CancellationToken& operator= (const CancellationToken&) = delete;
    private:
        std::atomic<bool> bCancelled;
        std::mutex m;
        std::condition_variable cvar;
};

#endif // CANCELLATION_H
