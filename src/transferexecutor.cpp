/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "transferexecutor.h"
#include "util.h"

#include <fstream>
#include <mutex>

namespace
{
    std::mutex mtx_create_directories; // Mutex for creating directories in openDestination

    struct attemptState
    {
        std::ofstream ofs;
        uintmax_t iBytesWritten = 0;
        bool bWriteFailed = false;
        std::string sError;
    };

    bool openDestination(const boost::filesystem::path& filepath, std::ofstream& ofs, std::string& error)
    {
        boost::filesystem::path directory = filepath.parent_path();
        if (!directory.empty())
        {
            std::lock_guard<std::mutex> lock(mtx_create_directories); // Use mutex to avoid possible race conditions
            boost::system::error_code ec;
            if (boost::filesystem::exists(directory, ec))
            {
                if (!boost::filesystem::is_directory(directory, ec))
                {
                    error = directory.string() + " is not directory";
                    return false;
                }
            }
            else
            {
                boost::filesystem::create_directories(directory, ec);
                if (ec)
                {
                    error = "Failed to create directory (" + directory.string() + "): " + ec.message();
                    return false;
                }
            }
        }

        ofs.open(filepath.string(), std::ofstream::binary | std::ofstream::trunc);
        if (!ofs)
        {
            error = "Failed to create " + filepath.string();
            return false;
        }
        return true;
    }
}

TransferExecutor::TransferExecutor(std::shared_ptr<HttpClient> client, const RetryConfig& retryConf,
                                   std::shared_ptr<ProgressAggregator> progress,
                                   std::shared_ptr<CancellationToken> token,
                                   std::shared_ptr<ThreadSafeQueue<Message>> msgQueue)
    : client(client), retryPolicy(retryConf), progress(progress), token(token), msgQueue(msgQueue)
{
    if (!this->token)
        this->token = std::make_shared<CancellationToken>();
    if (!this->progress)
        this->progress = std::make_shared<ProgressAggregator>();
}

void TransferExecutor::pushMessage(const Message& msg) const
{
    if (msgQueue)
        msgQueue->push(msg);
}

uintmax_t TransferExecutor::transfer(const Descriptor& descriptor, const std::string& msg_prefix) const
{
    const boost::filesystem::path& filepath = descriptor.getPath();
    const std::string& url = descriptor.getUrl();
    const std::string filename = filepath.filename().string();

    // Bytes already counted in bytes_total for this descriptor
    uintmax_t iReportedSize = descriptor.getSize() ? *descriptor.getSize() : 0;

    std::unique_ptr<StreamingDigest> digest;
    try
    {
        if (descriptor.getChecksum())
            digest.reset(new StreamingDigest(descriptor.getChecksum()->getType()));
    }
    catch (const std::exception& e)
    {
        throw DownloadError::GenericDownload(e.what());
    }

    attemptState attempt;

    HttpClient::WriteCallback write = [&](const char* data, size_t size) -> bool
    {
        if (token->isCancelled())
            return false;

        try
        {
            if (!attempt.ofs.is_open())
            {
                if (!openDestination(filepath, attempt.ofs, attempt.sError))
                {
                    attempt.bWriteFailed = true;
                    return false;
                }
            }

            if (digest)
                digest->update(data, size);

            attempt.ofs.write(data, size);
            if (!attempt.ofs)
            {
                attempt.sError = "Failed to write " + filepath.string();
                attempt.bWriteFailed = true;
                return false;
            }
        }
        catch (const std::exception& e)
        {
            attempt.sError = e.what();
            attempt.bWriteFailed = true;
            return false;
        }

        attempt.iBytesWritten += size;
        uintmax_t growth = 0;
        if (attempt.iBytesWritten > iReportedSize)
        {
            growth = attempt.iBytesWritten - iReportedSize;
            iReportedSize = attempt.iBytesWritten;
        }
        progress->addBytes(size, growth);
        return true;
    };

    HttpClient::AbortCallback abort = [this]() -> bool
    {
        return token->isCancelled();
    };

    pushMessage(Message("Begin download: " + filename, MSGTYPE_INFO, msg_prefix, MSGLEVEL_VERBOSE));

    HttpResult result;
    int iRetryCount = 0;
    std::string retry_reason;
    while (true)
    {
        if (iRetryCount != 0)
        {
            std::string retry_msg = "Retry " + std::to_string(iRetryCount) + "/" + std::to_string(retryPolicy.getMaxRetries()) + ": " + filename;
            if (!retry_reason.empty())
                retry_msg += " (" + retry_reason + ")";
            pushMessage(Message(retry_msg, MSGTYPE_INFO, msg_prefix, MSGLEVEL_VERBOSE));

            if (token->waitFor(retryPolicy.getDelay(iRetryCount)))
                throw DownloadError::Cancelled(url);
        }

        if (token->isCancelled())
            throw DownloadError::Cancelled(url);

        // Every attempt starts the file and the digest over
        if (attempt.ofs.is_open())
            attempt.ofs.close();
        attempt.ofs.clear();
        attempt.iBytesWritten = 0;
        attempt.bWriteFailed = false;
        attempt.sError.clear();
        if (digest)
            digest->reset();

        result = client->get(url, write, abort);

        if (attempt.ofs.is_open())
            attempt.ofs.close();

        if (attempt.bWriteFailed)
        {
            progress->subtractBytes(attempt.iBytesWritten);
            pushMessage(Message(attempt.sError + ", skipping file (" + filename + ")", MSGTYPE_ERROR, msg_prefix, MSGLEVEL_ALWAYS));
            throw DownloadError::GenericDownload(attempt.sError);
        }

        if (token->isCancelled())
        {
            progress->subtractBytes(attempt.iBytesWritten);
            throw DownloadError::Cancelled(url);
        }

        if (result.result == CURLE_OK && isSuccessStatus(result.response_code))
            break;

        progress->subtractBytes(attempt.iBytesWritten);

        if (!retryPolicy.shouldRetry(result, iRetryCount))
            break;

        iRetryCount++;
        retry_reason = curl_easy_strerror(result.result);
        if (result.response_code > 0)
            retry_reason += " (" + std::to_string(result.response_code) + ")";
    }

    if (result.result != CURLE_OK || !isSuccessStatus(result.response_code))
    {
        std::string msg = "Download failed (" + static_cast<std::string>(curl_easy_strerror(result.result));
        if (result.response_code > 0)
            msg += " (" + std::to_string(result.response_code) + ")";
        msg += "): " + filename;
        pushMessage(Message(msg, MSGTYPE_WARNING, msg_prefix, MSGLEVEL_DEFAULT));

        if (result.result == CURLE_HTTP_RETURNED_ERROR || (result.result == CURLE_OK && !isSuccessStatus(result.response_code)))
            throw DownloadError::Non200StatusCode(url, result.response_code);
        throw DownloadError::Transport(result.result, url, result.error);
    }

    // Empty body still creates the file
    if (attempt.iBytesWritten == 0)
    {
        std::string error;
        if (!openDestination(filepath, attempt.ofs, error))
            throw DownloadError::GenericDownload(error);
        attempt.ofs.close();
    }

    if (attempt.ofs.fail())
    {
        progress->subtractBytes(attempt.iBytesWritten);
        throw DownloadError::GenericDownload("Failed to close " + filepath.string());
    }

    uintmax_t iBytesWritten = attempt.iBytesWritten;

    if (descriptor.hasKnownSize() && *descriptor.getSize() != iBytesWritten)
    {
        progress->subtractBytes(iBytesWritten);
        pushMessage(Message("Size mismatch for " + filename + ": expected " + std::to_string(*descriptor.getSize()) + ", got " + std::to_string(iBytesWritten), MSGTYPE_ERROR, msg_prefix, MSGLEVEL_ALWAYS));
        throw DownloadError::SizeMismatch(*descriptor.getSize(), iBytesWritten);
    }

    if (digest)
    {
        const Checksum& checksum = *descriptor.getChecksum();
        std::string actual_hash = digest->finalHex();
        if (!checksum.matches(actual_hash))
        {
            progress->subtractBytes(iBytesWritten);
            pushMessage(Message("Checksum mismatch (" + Util::getOptionNameString(checksum.getType(), GlobalConstants::CHECKSUM_TYPES) + ") for " + filepath.string() + " - expected: " + checksum.getHash() + " - got: " + actual_hash, MSGTYPE_ERROR, msg_prefix, MSGLEVEL_ALWAYS));
            throw DownloadError::ChecksumMismatch(checksum.getHash(), actual_hash, url, filepath.string());
        }
    }

    progress->completeFile();
    pushMessage(Message("Download complete: " + filename + " (" + Util::makeSizeString(iBytesWritten) + ")", MSGTYPE_SUCCESS, msg_prefix, MSGLEVEL_DEFAULT));

    return iBytesWritten;
}

void downloadFile(const Descriptor& descriptor, std::shared_ptr<HttpClient> client, const RetryConfig& retryConf,
                  std::shared_ptr<ProgressAggregator> progress)
{
    if (!progress)
        progress = std::make_shared<ProgressAggregator>();
    progress->start(1, descriptor.getSize() ? *descriptor.getSize() : 0);

    TransferExecutor executor(client, retryConf, progress);
    executor.transfer(descriptor);
}
