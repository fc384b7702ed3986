/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include "config.h"

#include <functional>
#include <string>
#include <curl/curl.h>

struct HttpResult
{
    CURLcode result = CURLE_OK;
    long int response_code = 0; // 0 for protocols without status codes (file://)
    std::string error;          // libcurl error buffer contents
};

inline bool isSuccessStatus(const long int& response_code)
{
    return response_code == 0 || (response_code >= 200 && response_code < 300);
}

/*
    Single attempt GET. Retrying is up to the caller.

    write receives the response body chunk by chunk, only for successful
    (2xx or status-less) responses. Returning false from write aborts the
    transfer with CURLE_WRITE_ERROR.
    abort is polled while the transfer runs. Returning true aborts the
    transfer with CURLE_ABORTED_BY_CALLBACK.
*/
class HttpClient
{
    public:
        typedef std::function<bool(const char* data, size_t size)> WriteCallback;
        typedef std::function<bool()> AbortCallback;

        virtual ~HttpClient() {};
        virtual HttpResult get(const std::string& url, const WriteCallback& write, const AbortCallback& abort) = 0;
};

class CurlHttpClient : public HttpClient
{
    public:
        explicit CurlHttpClient(const CurlConfig& conf);
        virtual ~CurlHttpClient();
        HttpResult get(const std::string& url, const WriteCallback& write, const AbortCallback& abort) override;
    private:
        static size_t writeData(char* ptr, size_t size, size_t nmemb, void* userp);
        static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

        CurlConfig curlConf;
};

#endif // HTTPCLIENT_H
