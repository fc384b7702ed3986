/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef DOWNLOADERROR_H
#define DOWNLOADERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <curl/curl.h>

const unsigned int DLERROR_NON200_STATUS     = 1 << 0;
const unsigned int DLERROR_SIZE_MISMATCH     = 1 << 1;
const unsigned int DLERROR_CHECKSUM_MISMATCH = 1 << 2;
const unsigned int DLERROR_GENERIC           = 1 << 3;
const unsigned int DLERROR_TRANSPORT         = 1 << 4;
const unsigned int DLERROR_CANCELLED         = 1 << 5;

class DownloadError : public std::runtime_error
{
    public:
        static DownloadError Non200StatusCode(const std::string& url, const long int& status);
        static DownloadError SizeMismatch(const uintmax_t& expected, const uintmax_t& actual);
        static DownloadError ChecksumMismatch(const std::string& expected, const std::string& actual, const std::string& url, const std::string& path);
        static DownloadError GenericDownload(const std::string& message);
        static DownloadError Transport(const CURLcode& code, const std::string& url, const std::string& detail = std::string());
        static DownloadError Cancelled(const std::string& url);

        unsigned int getKind() const { return kind_; };
        long int getStatusCode() const { return status_; };
        uintmax_t getExpectedSize() const { return expected_size_; };
        uintmax_t getActualSize() const { return actual_size_; };
        const std::string& getExpectedHash() const { return expected_hash_; };
        const std::string& getActualHash() const { return actual_hash_; };
        const std::string& getUrl() const { return url_; };
        const std::string& getPath() const { return path_; };
        CURLcode getCurlCode() const { return curl_code_; };
    private:
        DownloadError(const unsigned int& kind, const std::string& what);

        unsigned int kind_;
        long int status_ = 0;
        uintmax_t expected_size_ = 0;
        uintmax_t actual_size_ = 0;
        std::string expected_hash_;
        std::string actual_hash_;
        std::string url_;
        std::string path_;
        CURLcode curl_code_ = CURLE_OK;
};

#endif // DOWNLOADERROR_H
