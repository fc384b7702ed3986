/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "util.h"
#include "checksum.h"

#include <boost/regex.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/ioctl.h>
#include <unistd.h>

/*
    Hash a local file in chunks
    Returns empty string if the file can't be read
*/
std::string Util::getFileHash(const std::string& filepath, unsigned hash_id)
{
    std::ifstream ifs(filepath, std::ifstream::binary);
    if (!ifs)
        return std::string();

    StreamingDigest digest(hash_id);
    std::vector<char> chunk(GlobalConstants::HASH_READ_BUFFER_SIZE);
    while (ifs)
    {
        ifs.read(chunk.data(), chunk.size());
        std::streamsize size = ifs.gcount();
        if (size > 0)
            digest.update(chunk.data(), static_cast<size_t>(size));
    }

    if (ifs.bad())
        return std::string();

    return digest.finalHex();
}

std::string Util::getHomeDir()
{
    char *home = getenv("HOME");
    return home ? std::string(home) : std::string();
}

std::string Util::getConfigHome()
{
    std::string configHome;
    char *xdgconfig = getenv("XDG_CONFIG_HOME");
    if (xdgconfig)
        configHome = (std::string)xdgconfig;
    else
        configHome = Util::getHomeDir() + "/.config";
    return configHome;
}

unsigned int Util::getOptionValue(const std::string& str, const std::vector<GlobalConstants::optionsStruct>& options, const bool& bAllowStringToIntConversion)
{
    unsigned int value = 0;
    boost::regex expression("^[+-]?\\d+$", boost::regex::perl);
    boost::match_results<std::string::const_iterator> what;
    if (boost::regex_search(str, what, expression) && bAllowStringToIntConversion)
    {
        value = std::stoi(str);
    }
    else
    {
        for (unsigned int i = 0; i < options.size(); ++i)
        {
            if (!options[i].regexp.empty())
            {
                boost::regex expr("^(" + options[i].regexp + ")$", boost::regex::perl | boost::regex::icase);
                if (boost::regex_search(str, what, expr))
                {
                    value = options[i].id;
                    break;
                }
            }

            if (str == options[i].code)
            {
                value = options[i].id;
                break;
            }
        }
    }
    return value;
}

std::string Util::getOptionNameString(const unsigned int& value, const std::vector<GlobalConstants::optionsStruct>& options)
{
    std::string str;
    for (unsigned int i = 0; i < options.size(); ++i)
    {
        if ((value & options[i].id) == options[i].id)
            str += (str.empty() ? "" : ", ")+options[i].str;
    }
    return str;
}

int Util::getTerminalWidth()
{
    int width;
    if(isatty(STDOUT_FILENO))
    {
        struct winsize w;
        ioctl(STDOUT_FILENO, TIOCGWINSZ, &w);
        width = static_cast<int>(w.ws_col);
    }
    else
        width = 10000;//Something sufficiently big
    return width;
}

std::string Util::makeEtaString(const unsigned long long& iBytesRemaining, const double& dlRate)
{
    if (!(dlRate > 0))
        return "-";

    boost::posix_time::time_duration duration(boost::posix_time::seconds((long)(iBytesRemaining / dlRate)));

    return Util::makeEtaString(duration);
}

std::string Util::makeEtaString(const boost::posix_time::time_duration& duration)
{
    std::string etastr;
    std::stringstream eta_ss;

    if (duration.hours() > 23)
    {
       eta_ss << duration.hours() / 24 << "d " <<
                 std::setfill('0') << std::setw(2) << duration.hours() % 24 << "h " <<
                 std::setfill('0') << std::setw(2) << duration.minutes() << "m " <<
                 std::setfill('0') << std::setw(2) << duration.seconds() << "s";
    }
    else if (duration.hours() > 0)
    {
       eta_ss << duration.hours() << "h " <<
                 std::setfill('0') << std::setw(2) << duration.minutes() << "m " <<
                 std::setfill('0') << std::setw(2) << duration.seconds() << "s";
    }
    else if (duration.minutes() > 0)
    {
       eta_ss << duration.minutes() << "m " <<
                 std::setfill('0') << std::setw(2) << duration.seconds() << "s";
    }
    else
    {
       eta_ss << duration.seconds() << "s";
    }
    etastr = eta_ss.str();

    return etastr;
}

std::string Util::makeSizeString(const unsigned long long& iSizeInBytes)
{
    auto units = { "B", "kB", "MB", "GB", "TB", "PB" };
    std::string size_unit = "B";
    double iSize = static_cast<double>(iSizeInBytes);
    for (auto unit : units)
    {
        size_unit = unit;
        if (iSize < 1024)
            break;

        iSize /= 1024;
    }
    return formattedString("%0.2f %s", iSize, size_unit.c_str());
}

std::string Util::makeRateString(double dlRate)
{
    std::string rate_unit;
    if (dlRate > 1048576) // 1 MB
    {
        dlRate /= 1048576;
        rate_unit = "MB/s";
    }
    else
    {
        dlRate /= 1024;
        rate_unit = "kB/s";
    }
    return formattedString("%0.2f%s", dlRate, rate_unit.c_str());
}

void Util::CurlHandleSetDefaultOptions(CURL* curlhandle, const CurlConfig& conf)
{
    curl_easy_setopt(curlhandle, CURLOPT_USERAGENT, conf.sUserAgent.c_str());
    curl_easy_setopt(curlhandle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curlhandle, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curlhandle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curlhandle, CURLOPT_CONNECTTIMEOUT, conf.iTimeout);
    curl_easy_setopt(curlhandle, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curlhandle, CURLOPT_SSL_VERIFYPEER, conf.bVerifyPeer ? 1L : 0L);
    curl_easy_setopt(curlhandle, CURLOPT_VERBOSE, conf.bVerbose ? 1L : 0L);
    curl_easy_setopt(curlhandle, CURLOPT_MAX_RECV_SPEED_LARGE, conf.iDownloadRate);

    // Assume that we have connection error and abort transfer with CURLE_OPERATION_TIMEDOUT if download speed is less than iLowSpeedTimeoutRate B/s for iLowSpeedTimeout seconds
    curl_easy_setopt(curlhandle, CURLOPT_LOW_SPEED_TIME, conf.iLowSpeedTimeout);
    curl_easy_setopt(curlhandle, CURLOPT_LOW_SPEED_LIMIT, conf.iLowSpeedTimeoutRate);

    if (!conf.sCACertPath.empty())
        curl_easy_setopt(curlhandle, CURLOPT_CAINFO, conf.sCACertPath.c_str());
}

Json::Value Util::readJsonFile(const std::string& path)
{
    Json::Value json;
    std::ifstream ifs(path, std::ifstream::binary);

    if (!ifs)
        throw std::runtime_error("Failed to open " + path);

    try
    {
        ifs >> json;
    }
    catch (const Json::Exception& exc)
    {
        throw std::runtime_error("Failed to parse " + path + ": " + exc.what());
    }

    return json;
}

// Free space of the filesystem path is on, or would be on once created
uintmax_t Util::getAvailableSpace(boost::filesystem::path path)
{
    path = boost::filesystem::absolute(path);
    while (!boost::filesystem::exists(path) && !path.empty())
        path = path.parent_path();

    if (path.empty())
        return 0;

    boost::filesystem::space_info space = boost::filesystem::space(path);
    return space.available;
}
