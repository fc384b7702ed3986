/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include "config.h"
#include "httpclient.h"

#include <chrono>

// Bounded exponential backoff for transient failures
class RetryPolicy
{
    public:
        explicit RetryPolicy(const RetryConfig& conf);
        bool isRetryable(const HttpResult& result) const;
        bool shouldRetry(const HttpResult& result, const int& iRetryCount) const;
        // Delay before retry number iRetry (1 based)
        std::chrono::milliseconds getDelay(const int& iRetry) const;
        int getMaxRetries() const { return retryConf.iRetries; };
    private:
        RetryConfig retryConf;
};

#endif // RETRYPOLICY_H
