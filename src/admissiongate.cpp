/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "admissiongate.h"

AdmissionGate::AdmissionGate(const unsigned int& permits)
{
    iPermits = permits;
}

bool AdmissionGate::acquire(const CancellationToken& token)
{
    std::unique_lock<std::mutex> lock(m);
    while (iPermits == 0 && !token.isCancelled())
        cvar.wait(lock);

    if (token.isCancelled())
        return false;

    --iPermits;
    return true;
}

void AdmissionGate::release()
{
    std::unique_lock<std::mutex> lock(m);
    ++iPermits;
    lock.unlock();
    cvar.notify_one();
}

void AdmissionGate::wake()
{
    // Lock so a waiter can't miss the notification between its check and wait
    std::unique_lock<std::mutex> lock(m);
    lock.unlock();
    cvar.notify_all();
}

unsigned int AdmissionGate::available() const
{
    std::lock_guard<std::mutex> lock(m);
    return iPermits;
}
