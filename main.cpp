/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "batchdownloader.h"
#include "config.h"
#include "util.h"
#include "globalconstants.h"
#include "globals.h"
#include "manifest.h"
#include "progressbar.h"

#include <atomic>
#include <fstream>
#include <thread>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <signal.h>

namespace bpo = boost::program_options;
Config Globals::globalConfig;

template<typename T> void set_vm_value(std::map<std::string, bpo::variable_value>& vm, const std::string& option, const T& value)
{
    vm[option].value() = boost::any(value);
}

void printMessages(ThreadSafeQueue<Message>& msgQueue, std::ofstream& report_ofs)
{
    Message msg;
    while (msgQueue.try_pop(msg))
    {
        if (msg.getLevel() <= Globals::globalConfig.iMsgLevel)
            std::cout << msg.getFormattedString(Globals::globalConfig.bColor, true) << std::endl;

        if (Globals::globalConfig.bReport && report_ofs)
        {
            report_ofs << msg.getTimestampString() << ": " << msg.getMessage() << std::endl;
        }
    }
}

int main(int argc, char *argv[])
{
    struct sigaction act;
    act.sa_handler = SIG_IGN;
    act.sa_flags = SA_RESTART;
    sigemptyset(&act.sa_mask);
    if (sigaction(SIGPIPE, &act, NULL) < 0)
        return 1;

    rhash_library_init();

    Globals::globalConfig.sVersionString = VERSION_STRING;
    Globals::globalConfig.sVersionNumber = VERSION_NUMBER;
    Globals::globalConfig.curlConf.sUserAgent = DEFAULT_USER_AGENT;

    Globals::globalConfig.sConfigDirectory = Util::getConfigHome() + "/assetfetch";
    Globals::globalConfig.sConfigFilePath = Globals::globalConfig.sConfigDirectory + "/config.cfg";

    std::string checksum_text = "Checksum types accepted in manifest\n";
    for (unsigned int i = 0; i < GlobalConstants::CHECKSUM_TYPES.size(); ++i)
    {
        checksum_text += GlobalConstants::CHECKSUM_TYPES[i].str + " = " + GlobalConstants::CHECKSUM_TYPES[i].regexp + "\n";
    }

    std::string manifest_text = "JSON manifest of files to download\n\n"
        "Array of file entries or object with \"files\" array\n"
        "Entry members: url, path, size, sha1/sha256/md5 or checksum {type, hash}\n\n" + checksum_text;

    bpo::variables_map vm;
    bpo::options_description options_cli_all("Options");
    bpo::options_description options_cli_no_cfg;
    bpo::options_description options_cli_cfg;
    bpo::options_description options_cfg_all("Configuration");
    try
    {
        bool bInsecure = false;
        bool bNoColor = false;
        bool bNoUnicode = false;
        Globals::globalConfig.bReport = false;
        // Commandline options (no config file)
        options_cli_no_cfg.add_options()
            ("help,h", "Print help message")
            ("version", "Print version information")
            ("manifest,m", bpo::value<std::string>(&Globals::globalConfig.sManifestFile)->default_value(""), manifest_text.c_str())
            ("config-file", bpo::value<std::string>(&Globals::globalConfig.sConfigFilePath)->default_value(Globals::globalConfig.sConfigFilePath), "Path to config file")
            ("deep-check", bpo::value<bool>(&Globals::globalConfig.bDeepCheck)->zero_tokens()->default_value(false), "Calculate hash of existing files instead of trusting matching size")
            ("dry-run", bpo::value<bool>(&Globals::globalConfig.bDryRun)->zero_tokens()->default_value(false), "List files that need downloading without downloading them")
            ("report", bpo::value<std::string>(&Globals::globalConfig.sReportFilePath)->implicit_value("assetfetch-report.log"), "Save report of downloaded files to specified file\nDefault filename: assetfetch-report.log")
            ("check-free-space", bpo::value<bool>(&Globals::globalConfig.bFreeSpaceCheck)->zero_tokens()->default_value(false), "Don't start if declared size of files exceeds free space in download directory")
        ;
        // Commandline options (config file)
        options_cli_cfg.add_options()
            ("directory,d", bpo::value<std::string>(&Globals::globalConfig.sDirectory)->default_value("."), "Set download directory\nRelative paths in manifest are relative to this")
            ("threads", bpo::value<unsigned int>(&Globals::globalConfig.iThreads)->default_value(GlobalConstants::DEFAULT_THREADS), "Number of simultaneous downloads")
            ("check-threads", bpo::value<unsigned int>(&Globals::globalConfig.iCheckThreads)->default_value(GlobalConstants::DEFAULT_CHECK_THREADS), "Number of extra threads for checking existing files")
            ("retries", bpo::value<int>(&Globals::globalConfig.retryConf.iRetries)->default_value(GlobalConstants::DEFAULT_RETRIES), "Set maximum number of retries on failed download")
            ("retry-delay", bpo::value<long int>(&Globals::globalConfig.retryConf.iInitialDelay)->default_value(GlobalConstants::DEFAULT_RETRY_DELAY), "Delay before first retry (milliseconds)\nDoubles on every retry")
            ("retry-max-delay", bpo::value<long int>(&Globals::globalConfig.retryConf.iMaxDelay)->default_value(GlobalConstants::DEFAULT_RETRY_MAX_DELAY), "Maximum delay between retries (milliseconds)")
            ("limit-rate", bpo::value<curl_off_t>(&Globals::globalConfig.curlConf.iDownloadRate)->default_value(0), "Limit download rate to value in kB\n0 = unlimited")
            ("no-unicode", bpo::value<bool>(&bNoUnicode)->zero_tokens()->default_value(false), "Don't use Unicode in the progress bar")
            ("no-color", bpo::value<bool>(&bNoColor)->zero_tokens()->default_value(false), "Don't use coloring in the progress bar or status messages")
            ("curl-verbose", bpo::value<bool>(&Globals::globalConfig.curlConf.bVerbose)->zero_tokens()->default_value(false), "Set libcurl to verbose mode")
            ("no-verify-peer", bpo::value<bool>(&bInsecure)->zero_tokens()->default_value(false), "Don't verify authenticity of SSL certificates")
            ("cacert", bpo::value<std::string>(&Globals::globalConfig.curlConf.sCACertPath)->default_value(""), "Path to CA certificate bundle in PEM format")
            ("user-agent", bpo::value<std::string>(&Globals::globalConfig.curlConf.sUserAgent)->default_value(DEFAULT_USER_AGENT), "Set user agent")
            ("timeout", bpo::value<long int>(&Globals::globalConfig.curlConf.iTimeout)->default_value(10), "Set timeout for connection\nMaximum time in seconds that connection phase is allowed to take")
            ("lowspeed-timeout", bpo::value<long int>(&Globals::globalConfig.curlConf.iLowSpeedTimeout)->default_value(30), "Set time in number seconds that the transfer speed should be below the rate set with --lowspeed-rate for it to considered too slow and aborted")
            ("lowspeed-rate", bpo::value<long int>(&Globals::globalConfig.curlConf.iLowSpeedTimeoutRate)->default_value(200), "Set average transfer speed in bytes per second that the transfer should be below during time specified with --lowspeed-timeout for it to be considered too slow and aborted")
            ("progress-interval", bpo::value<int>(&Globals::globalConfig.iProgressInterval)->default_value(100), "Set interval for progress bar update (milliseconds)\nValue must be between 1 and 10000")
            ("verbosity", bpo::value<int>(&Globals::globalConfig.iMsgLevel)->default_value(0), "Set message verbosity level\n -1 = Less verbose\n 0 = Default\n 1 = Verbose\n 2 = Debug")
        ;

        options_cli_all.add(options_cli_no_cfg).add(options_cli_cfg);
        options_cfg_all.add(options_cli_cfg);

        bpo::store(bpo::parse_command_line(argc, argv, options_cli_all), vm);
        bpo::notify(vm);

        if (vm.count("help"))
        {
            std::cout   << Globals::globalConfig.sVersionString << std::endl
                        << options_cli_all << std::endl;
            return 0;
        }

        if (vm.count("version"))
        {
            std::cout << VERSION_STRING << std::endl;
            return 0;
        }

        if (boost::filesystem::exists(Globals::globalConfig.sConfigFilePath))
        {
            std::ifstream ifs(Globals::globalConfig.sConfigFilePath.c_str());
            if (!ifs)
            {
                std::cerr << "Could not open config file: " << Globals::globalConfig.sConfigFilePath << std::endl;
                return 1;
            }
            else
            {
                bpo::parsed_options parsed = bpo::parse_config_file(ifs, options_cfg_all, true);
                bpo::store(parsed, vm);
                bpo::notify(vm);
                ifs.close();
                std::vector<std::string> unrecognized_options_cfg = bpo::collect_unrecognized(parsed.options, bpo::include_positional);
                if (!unrecognized_options_cfg.empty())
                {
                    std::cerr << "Unrecognized options in " << Globals::globalConfig.sConfigFilePath << std::endl;
                    for (unsigned int i = 0; i < unrecognized_options_cfg.size(); ++i)
                        std::cerr << unrecognized_options_cfg[i] << std::endl;
                    std::cerr << std::endl;
                }
            }
        }
        else if (!vm["config-file"].defaulted())
        {
            std::cerr << "Config file doesn't exist: " << Globals::globalConfig.sConfigFilePath << std::endl;
            return 1;
        }

        if (vm.count("limit-rate"))
            Globals::globalConfig.curlConf.iDownloadRate <<= 10; // Convert download rate from bytes to kilobytes

        if (vm.count("report"))
            Globals::globalConfig.bReport = true;

        if (Globals::globalConfig.iProgressInterval < 1)
            Globals::globalConfig.iProgressInterval = 1;
        else if (Globals::globalConfig.iProgressInterval > 10000)
            Globals::globalConfig.iProgressInterval = 10000;

        if (Globals::globalConfig.iThreads < 1)
        {
            Globals::globalConfig.iThreads = 1;
            set_vm_value(vm, "threads", Globals::globalConfig.iThreads);
        }

        if (Globals::globalConfig.retryConf.iRetries < 0)
        {
            Globals::globalConfig.retryConf.iRetries = 0;
            set_vm_value(vm, "retries", Globals::globalConfig.retryConf.iRetries);
        }

        if (Globals::globalConfig.iMsgLevel < -1)
        {
            Globals::globalConfig.iMsgLevel = -1;
            set_vm_value(vm, "verbosity", Globals::globalConfig.iMsgLevel);
        }

        Globals::globalConfig.curlConf.bVerifyPeer = !bInsecure;
        Globals::globalConfig.bColor = !bNoColor;
        Globals::globalConfig.bUnicode = !bNoUnicode;
    }
    catch (std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (Globals::globalConfig.sManifestFile.empty())
    {
        std::cerr << "No manifest specified. Use --manifest" << std::endl;
        return 1;
    }

    // CA certificate bundle
    if (Globals::globalConfig.curlConf.sCACertPath.empty())
    {
        // Use CURL_CA_BUNDLE environment variable for CA certificate path if it is set
        char *ca_bundle = getenv("CURL_CA_BUNDLE");
        if (ca_bundle)
            Globals::globalConfig.curlConf.sCACertPath = (std::string)ca_bundle;
    }

    std::vector<Descriptor> descriptors;
    try
    {
        descriptors = Manifest::load(Globals::globalConfig.sManifestFile, Globals::globalConfig.sDirectory);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (Globals::globalConfig.bFreeSpaceCheck && !Globals::globalConfig.bDryRun)
    {
        uintmax_t iTotalSize = 0;
        for (const auto& descriptor : descriptors)
        {
            if (descriptor.getSize())
                iTotalSize += *descriptor.getSize();
        }

        try
        {
            uintmax_t iAvailable = Util::getAvailableSpace(Globals::globalConfig.sDirectory);
            if (iTotalSize > iAvailable)
            {
                std::cerr << "Not enough free space in " << Globals::globalConfig.sDirectory << ": "
                          << Util::makeSizeString(iTotalSize) << " needed, "
                          << Util::makeSizeString(iAvailable) << " available" << std::endl;
                return 1;
            }
        }
        catch (const boost::filesystem::filesystem_error& e)
        {
            std::cerr << "Failed to get free space: " << e.what() << std::endl;
            return 1;
        }
    }

    std::ofstream report_ofs;
    if (Globals::globalConfig.bReport)
    {
        report_ofs.open(Globals::globalConfig.sReportFilePath, std::ofstream::out | std::ofstream::app);
        if (!report_ofs)
        {
            std::cerr << "Failed to create " << Globals::globalConfig.sReportFilePath << std::endl;
            return 1;
        }
    }

    // Init curl globally
    curl_global_init(CURL_GLOBAL_ALL);
    struct CurlCleanup { ~CurlCleanup() { curl_global_cleanup(); } };
    CurlCleanup _curl_cleanup;

    BatchConfig batchConf;
    batchConf.iCheckThreads = Globals::globalConfig.iCheckThreads;
    batchConf.retryConf = Globals::globalConfig.retryConf;

    std::shared_ptr<HttpClient> client = std::make_shared<CurlHttpClient>(Globals::globalConfig.curlConf);
    std::shared_ptr<ProgressAggregator> progress = std::make_shared<ProgressAggregator>();
    BatchDownloader downloader(client, batchConf);
    std::shared_ptr<ThreadSafeQueue<Message>> msgQueue = downloader.getMessageQueue();

    bool bDownloadRequired = false;
    std::unique_ptr<DownloadError> batchError;
    std::string sFailure;
    std::atomic<bool> bFinished(false);

    std::thread batchThread([&]()
    {
        try
        {
            bDownloadRequired = downloader.download(descriptors, Globals::globalConfig.iThreads, Globals::globalConfig.bDeepCheck, Globals::globalConfig.bDryRun, progress);
        }
        catch (const DownloadError& e)
        {
            batchError.reset(new DownloadError(e));
        }
        catch (const std::exception& e)
        {
            sFailure = e.what();
        }
        bFinished = true;
    });

    // Print progress information until the batch has finished
    ProgressBar bar(Globals::globalConfig.bUnicode, Globals::globalConfig.bColor);
    bool bDrawProgress = !Globals::globalConfig.bDryRun;
    bool bDone = false;
    while (!bDone)
    {
        bDone = bFinished.load();
        if (!bDone)
            std::this_thread::sleep_for(std::chrono::milliseconds(Globals::globalConfig.iProgressInterval));

        std::cout << "\033[J\r" << std::flush; // Clear screen from the current line down to the bottom of the screen

        // Print messages from message queue first
        printMessages(*msgQueue, report_ofs);

        if (bDrawProgress)
        {
            ProgressSnapshot snapshot = progress->getSnapshot();
            bar.update(snapshot);
            std::cout << bar.createProgressText(snapshot, Util::getTerminalWidth()) << std::endl;

            // Move cursor up by one row
            if (!bDone)
                std::cout << "\033[1A\r" << std::flush;
        }
    }
    batchThread.join();
    printMessages(*msgQueue, report_ofs);

    if (batchError)
    {
        std::cerr << "Download failed: " << batchError->what() << std::endl;
        if (Globals::globalConfig.bReport)
            report_ofs << "Download failed: " << batchError->what() << std::endl;
        return 1;
    }

    if (!sFailure.empty())
    {
        std::cerr << "Error: " << sFailure << std::endl;
        return 1;
    }

    if (Globals::globalConfig.bDryRun)
        std::cout << (bDownloadRequired ? "Some files need downloading" : "All files are up to date") << std::endl;
    else if (!bDownloadRequired)
        std::cout << "All files are up to date" << std::endl;

    return 0;
}
