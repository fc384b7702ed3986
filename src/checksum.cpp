/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "checksum.h"

#include <stdexcept>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

Checksum::Checksum(const unsigned int& type, const std::string& hash)
{
    type_ = type;
    // Digests are printed as lowercase hex so compare against lowercase
    hash_ = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(hash));
}

std::string Checksum::getTypeString() const
{
    for (unsigned int i = 0; i < GlobalConstants::CHECKSUM_TYPES.size(); ++i)
    {
        if (GlobalConstants::CHECKSUM_TYPES[i].id == type_)
            return GlobalConstants::CHECKSUM_TYPES[i].code;
    }
    return std::string();
}

bool Checksum::matches(const std::string& actual_hash) const
{
    return hash_ == actual_hash;
}

StreamingDigest::StreamingDigest(const unsigned int& hash_id)
{
    hash_id_ = hash_id;
    bFinalized_ = false;
    context_ = rhash_init(hash_id);
    if (!context_)
        throw std::runtime_error("LibRHash error: failed to initialize hash id " + std::to_string(hash_id));
}

StreamingDigest::~StreamingDigest()
{
    rhash_free(context_);
}

void StreamingDigest::update(const void* data, size_t size)
{
    if (bFinalized_)
        throw std::logic_error("StreamingDigest::update called after finalHex");

    if (rhash_update(context_, data, size) < 0)
        throw std::runtime_error("LibRHash error: update failed");
}

std::string StreamingDigest::finalHex()
{
    if (!bFinalized_)
    {
        rhash_final(context_, NULL);
        bFinalized_ = true;
    }

    std::vector<char> result(rhash_get_hash_length(hash_id_) + 1, '\0');
    size_t length = rhash_print(result.data(), context_, hash_id_, RHPR_HEX);
    return std::string(result.data(), length);
}

void StreamingDigest::reset()
{
    rhash_reset(context_);
    bFinalized_ = false;
}
