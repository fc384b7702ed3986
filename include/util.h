/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef UTIL_H
#define UTIL_H

#include "globalconstants.h"
#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <json/json.h>
#include <curl/curl.h>

namespace Util
{
    std::string getFileHash(const std::string& filepath, unsigned hash_id);
    std::string getHomeDir();
    std::string getConfigHome();
    unsigned int getOptionValue(const std::string& str, const std::vector<GlobalConstants::optionsStruct>& options, const bool& bAllowStringToIntConversion = true);
    std::string getOptionNameString(const unsigned int& value, const std::vector<GlobalConstants::optionsStruct>& options);
    int getTerminalWidth();
    std::string makeEtaString(const unsigned long long& iBytesRemaining, const double& dlRate);
    std::string makeEtaString(const boost::posix_time::time_duration& duration);
    std::string makeSizeString(const unsigned long long& iSizeInBytes);
    std::string makeRateString(double dlRate);
    void CurlHandleSetDefaultOptions(CURL* curlhandle, const CurlConfig& conf);
    Json::Value readJsonFile(const std::string& path);
    uintmax_t getAvailableSpace(boost::filesystem::path path);

    template<typename ... Args> std::string formattedString(const std::string& format, Args ... args)
    {
        std::size_t sz = std::snprintf(nullptr, 0, format.c_str(), args ...) + 1; // +1 for null terminator
        std::unique_ptr<char[]> buf(new char[sz]);
        std::snprintf(buf.get(), sz, format.c_str(), args ...);
        return std::string(buf.get(), buf.get() + sz - 1); // -1 because we don't want the null terminator
    }
}

#endif // UTIL_H
