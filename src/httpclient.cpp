/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "httpclient.h"
#include "util.h"

namespace
{
    struct xferInfo
    {
        CURL* curlhandle;
        const HttpClient::WriteCallback* write;
        const HttpClient::AbortCallback* abort;
    };
}

CurlHttpClient::CurlHttpClient(const CurlConfig& conf)
{
    curlConf = conf;
}

CurlHttpClient::~CurlHttpClient()
{
}

HttpResult CurlHttpClient::get(const std::string& url, const WriteCallback& write, const AbortCallback& abort)
{
    HttpResult result;
    char errorbuffer[CURL_ERROR_SIZE];
    errorbuffer[0] = '\0';

    CURL* curlhandle = curl_easy_init();
    if (!curlhandle)
    {
        result.result = CURLE_FAILED_INIT;
        return result;
    }

    xferInfo xferinfo;
    xferinfo.curlhandle = curlhandle;
    xferinfo.write = &write;
    xferinfo.abort = &abort;

    Util::CurlHandleSetDefaultOptions(curlhandle, curlConf);
    curl_easy_setopt(curlhandle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curlhandle, CURLOPT_ERRORBUFFER, errorbuffer);
    curl_easy_setopt(curlhandle, CURLOPT_WRITEFUNCTION, CurlHttpClient::writeData);
    curl_easy_setopt(curlhandle, CURLOPT_WRITEDATA, &xferinfo);
    curl_easy_setopt(curlhandle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curlhandle, CURLOPT_XFERINFOFUNCTION, CurlHttpClient::progressCallback);
    curl_easy_setopt(curlhandle, CURLOPT_XFERINFODATA, &xferinfo);

    result.result = curl_easy_perform(curlhandle);
    curl_easy_getinfo(curlhandle, CURLINFO_RESPONSE_CODE, &result.response_code);
    result.error = errorbuffer;

    curl_easy_cleanup(curlhandle);

    return result;
}

size_t CurlHttpClient::writeData(char* ptr, size_t size, size_t nmemb, void* userp)
{
    xferInfo* xferinfo = static_cast<xferInfo*>(userp);
    size_t realsize = size * nmemb;

    // Body of a non-success response never reaches the caller
    long int response_code = 0;
    curl_easy_getinfo(xferinfo->curlhandle, CURLINFO_RESPONSE_CODE, &response_code);
    if (!isSuccessStatus(response_code))
        return realsize;

    if (!(*xferinfo->write)(ptr, realsize))
        return 0;

    return realsize;
}

int CurlHttpClient::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
{
    // unused so lets prevent warnings and be more pedantic
    (void) dltotal;
    (void) dlnow;
    (void) ultotal;
    (void) ulnow;

    xferInfo* xferinfo = static_cast<xferInfo*>(clientp);
    if (*xferinfo->abort && (*xferinfo->abort)())
        return 1;

    return 0;
}
