/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef ADMISSIONGATE_H
#define ADMISSIONGATE_H

#include "cancellation.h"

#include <condition_variable>
#include <mutex>

// Counting semaphore that bounds the number of transfers in flight
class AdmissionGate
{
    public:
        explicit AdmissionGate(const unsigned int& permits);

        // Blocks until a permit is free. Returns false without a permit if
        // the token is cancelled while waiting.
        bool acquire(const CancellationToken& token);
        void release();
        // Make waiters re-check their cancellation token
        void wake();
        unsigned int available() const;

        AdmissionGate(const AdmissionGate&) = delete;
        AdmissionGate& operator= (const AdmissionGate&) = delete;
    private:
        unsigned int iPermits;
        mutable std::mutex m;
        std::condition_variable cvar;
};

// Holds one permit for the lifetime of the object
class AdmissionPermit
{
    public:
        AdmissionPermit(AdmissionGate& gate, const CancellationToken& token)
            : gate_(gate), bAcquired_(gate.acquire(token)) {};
        ~AdmissionPermit()
        {
            if (bAcquired_)
                gate_.release();
        }
        bool isAcquired() const { return bAcquired_; };

        AdmissionPermit(const AdmissionPermit&) = delete;
        AdmissionPermit& operator= (const AdmissionPermit&) = delete;
    private:
        AdmissionGate& gate_;
        bool bAcquired_;
};

#endif // ADMISSIONGATE_H
