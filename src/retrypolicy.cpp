/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "retrypolicy.h"

#include <algorithm>
#include <cmath>

RetryPolicy::RetryPolicy(const RetryConfig& conf)
{
    retryConf = conf;
}

bool RetryPolicy::isRetryable(const HttpResult& result) const
{
    bool bRetryable = false;
    switch (result.result)
    {
        // Retry on these errors
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_PARTIAL_FILE:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
            bRetryable = true;
            break;
        // Only server errors, "408 Request Timeout" and "429 Too Many Requests" are transient
        case CURLE_HTTP_RETURNED_ERROR:
            bRetryable = (result.response_code >= 500 || result.response_code == 408 || result.response_code == 429);
            break;
        case CURLE_OK:
            bRetryable = (result.response_code >= 500 || result.response_code == 408 || result.response_code == 429);
            break;
        default:
            bRetryable = false;
            break;
    }
    return bRetryable;
}

bool RetryPolicy::shouldRetry(const HttpResult& result, const int& iRetryCount) const
{
    return iRetryCount < retryConf.iRetries && this->isRetryable(result);
}

std::chrono::milliseconds RetryPolicy::getDelay(const int& iRetry) const
{
    if (iRetry <= 0 || retryConf.iInitialDelay <= 0)
        return std::chrono::milliseconds(0);

    double delay = static_cast<double>(retryConf.iInitialDelay) * std::pow(retryConf.dBackoffFactor, iRetry - 1);
    delay = std::min(delay, static_cast<double>(retryConf.iMaxDelay));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}
