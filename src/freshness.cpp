/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "freshness.h"
#include "util.h"

unsigned int Freshness::quickCheck(const Descriptor& descriptor)
{
    boost::system::error_code ec;
    const boost::filesystem::path& filepath = descriptor.getPath();

    if (!boost::filesystem::is_regular_file(filepath, ec) || ec)
        return FRESHNESS_NEEDS_DOWNLOAD;

    // Existence is enough when size isn't known
    if (!descriptor.getSize())
        return FRESHNESS_LOOKS_FRESH;

    uintmax_t filesize = boost::filesystem::file_size(filepath, ec);
    if (ec)
        return FRESHNESS_NEEDS_DOWNLOAD;

    return (filesize == *descriptor.getSize()) ? FRESHNESS_LOOKS_FRESH : FRESHNESS_NEEDS_DOWNLOAD;
}

bool Freshness::deepVerify(const Descriptor& descriptor, std::string* actual_hash)
{
    // Nothing to verify against
    if (!descriptor.getChecksum())
        return false;

    const Checksum& checksum = *descriptor.getChecksum();
    std::string localHash;
    try
    {
        localHash = Util::getFileHash(descriptor.getPath().string(), checksum.getType());
    }
    catch (const std::exception&)
    {
        // Unreadable file or hash failure counts as a mismatch
        localHash.clear();
    }

    if (actual_hash)
        *actual_hash = localHash;

    return !localHash.empty() && checksum.matches(localHash);
}

uintmax_t Freshness::localSize(const Descriptor& descriptor)
{
    boost::system::error_code ec;
    uintmax_t filesize = boost::filesystem::file_size(descriptor.getPath(), ec);
    return ec ? 0 : filesize;
}
