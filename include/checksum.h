/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef CHECKSUM_H
#define CHECKSUM_H

#include "globalconstants.h"

#include <string>
#include <rhash.h>

// Expected digest of a file.
// type is one of GlobalConstants::CHECKSUM_* (librhash hash ids)
class Checksum
{
    public:
        Checksum(const unsigned int& type, const std::string& hash);
        unsigned int getType() const { return type_; };
        std::string getHash() const { return hash_; };
        std::string getTypeString() const;
        bool matches(const std::string& actual_hash) const;
    private:
        unsigned int type_;
        std::string hash_;
};

/*
    Incremental digest over one of the checksum types.
    Lifetime is one transfer or one local file check.
*/
class StreamingDigest
{
    public:
        explicit StreamingDigest(const unsigned int& hash_id);
        virtual ~StreamingDigest();
        void update(const void* data, size_t size);
        std::string finalHex();
        void reset();
    private:
        StreamingDigest(const StreamingDigest&) = delete;
        StreamingDigest& operator= (const StreamingDigest&) = delete;

        rhash context_;
        unsigned int hash_id_;
        bool bFinalized_;
};

#endif // CHECKSUM_H
