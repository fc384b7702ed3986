/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef GLOBALCONSTANTS_H_INCLUDED
#define GLOBALCONSTANTS_H_INCLUDED

#include <iostream>
#include <vector>
#include <rhash.h>

namespace GlobalConstants
{
    struct optionsStruct {const unsigned int id; const std::string code; const std::string str; const std::string regexp;};

    // Checksum types use librhash hash ids directly
    const unsigned int CHECKSUM_SHA1   = RHASH_SHA1;
    const unsigned int CHECKSUM_SHA256 = RHASH_SHA256;
    const unsigned int CHECKSUM_MD5    = RHASH_MD5;

    const std::vector<optionsStruct> CHECKSUM_TYPES =
    {
        { CHECKSUM_SHA1,   "sha1",   "SHA-1",   "sha1|sha-1"     },
        { CHECKSUM_SHA256, "sha256", "SHA-256", "sha256|sha-256" },
        { CHECKSUM_MD5,    "md5",    "MD5",     "md5"            }
    };

    // Read buffer for hashing local files
    const size_t HASH_READ_BUFFER_SIZE = 1 << 20; // 1MB

    const unsigned int DEFAULT_THREADS = 4;
    const unsigned int DEFAULT_CHECK_THREADS = 2;
    const int DEFAULT_RETRIES = 3;
    const long int DEFAULT_RETRY_DELAY = 500;       // milliseconds
    const long int DEFAULT_RETRY_MAX_DELAY = 30000; // milliseconds
    const double DEFAULT_BACKOFF_FACTOR = 2.0;
}

#endif // GLOBALCONSTANTS_H_INCLUDED
