/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "downloaderror.h"

DownloadError::DownloadError(const unsigned int& kind, const std::string& what)
    : std::runtime_error(what), kind_(kind)
{
}

DownloadError DownloadError::Non200StatusCode(const std::string& url, const long int& status)
{
    DownloadError error(DLERROR_NON200_STATUS, "Received non-success status code " + std::to_string(status) + " for " + url);
    error.status_ = status;
    error.url_ = url;
    return error;
}

DownloadError DownloadError::SizeMismatch(const uintmax_t& expected, const uintmax_t& actual)
{
    DownloadError error(DLERROR_SIZE_MISMATCH, "Size mismatch: expected " + std::to_string(expected) + " bytes, got " + std::to_string(actual) + " bytes");
    error.expected_size_ = expected;
    error.actual_size_ = actual;
    return error;
}

DownloadError DownloadError::ChecksumMismatch(const std::string& expected, const std::string& actual, const std::string& url, const std::string& path)
{
    DownloadError error(DLERROR_CHECKSUM_MISMATCH, "Checksum mismatch for " + path + " (" + url + "): expected " + expected + ", got " + actual);
    error.expected_hash_ = expected;
    error.actual_hash_ = actual;
    error.url_ = url;
    error.path_ = path;
    return error;
}

DownloadError DownloadError::GenericDownload(const std::string& message)
{
    return DownloadError(DLERROR_GENERIC, message);
}

DownloadError DownloadError::Transport(const CURLcode& code, const std::string& url, const std::string& detail)
{
    std::string msg = std::string(curl_easy_strerror(code)) + " (" + std::to_string(static_cast<int>(code)) + ")";
    if (!detail.empty())
        msg += ": " + detail;
    msg += " - " + url;

    DownloadError error(DLERROR_TRANSPORT, msg);
    error.curl_code_ = code;
    error.url_ = url;
    return error;
}

DownloadError DownloadError::Cancelled(const std::string& url)
{
    DownloadError error(DLERROR_CANCELLED, "Transfer cancelled: " + url);
    error.url_ = url;
    return error;
}
