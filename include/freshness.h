/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef FRESHNESS_H
#define FRESHNESS_H

#include "descriptor.h"

#include <string>

const unsigned int FRESHNESS_NEEDS_DOWNLOAD = 0;
const unsigned int FRESHNESS_LOOKS_FRESH    = 1;

// Local checks done before touching the network. None of these throw.
namespace Freshness
{
    unsigned int quickCheck(const Descriptor& descriptor);
    // Hash the local file and compare it to the descriptor's checksum.
    // Descriptors without a checksum fail. actual_hash receives the local hash.
    bool deepVerify(const Descriptor& descriptor, std::string* actual_hash = nullptr);
    // Length of the local file, 0 if it can't be read
    uintmax_t localSize(const Descriptor& descriptor);
}

#endif // FRESHNESS_H
