/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef CONFIG_H__
#define CONFIG_H__

#include <string>
#include <curl/curl.h>

#include "globalconstants.h"

struct CurlConfig
{
    bool bVerifyPeer = true;
    bool bVerbose = false;
    std::string sCACertPath;
    std::string sUserAgent;
    long int iTimeout = 10;
    curl_off_t iDownloadRate = 0;
    long int iLowSpeedTimeout = 30;
    long int iLowSpeedTimeoutRate = 200;
};

struct RetryConfig
{
    int iRetries = GlobalConstants::DEFAULT_RETRIES;
    long int iInitialDelay = GlobalConstants::DEFAULT_RETRY_DELAY;
    long int iMaxDelay = GlobalConstants::DEFAULT_RETRY_MAX_DELAY;
    double dBackoffFactor = GlobalConstants::DEFAULT_BACKOFF_FACTOR;
};

struct BatchConfig
{
    // Workers in addition to the transfer slots, used for freshness checks
    unsigned int iCheckThreads = GlobalConstants::DEFAULT_CHECK_THREADS;
    RetryConfig retryConf;
};

class Config
{
    public:
        Config() {};
        virtual ~Config() {};

        // Booleans
        bool bDeepCheck;
        bool bDryRun;
        bool bFreeSpaceCheck;
        bool bUnicode; // use Unicode in console output
        bool bColor;   // use colors
        bool bReport;

        // Curl
        CurlConfig curlConf;

        // Retry
        RetryConfig retryConf;

        // File paths
        std::string sManifestFile;
        std::string sDirectory;
        std::string sConfigDirectory;
        std::string sConfigFilePath;
        std::string sReportFilePath;

        // General strings
        std::string sVersionString;
        std::string sVersionNumber;

        // Integers
        unsigned int iThreads;
        unsigned int iCheckThreads;
        int iProgressInterval;
        int iMsgLevel;
};

#endif // CONFIG_H__
