/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "descriptor.h"

Descriptor::Descriptor(const std::string& url, const boost::filesystem::path& path, const boost::optional<Checksum>& checksum, const boost::optional<uintmax_t>& size)
    : url_(url), path_(path), checksum_(checksum), size_(size)
{
}

Descriptor Descriptor::withChecksum(const Checksum& checksum) const
{
    return Descriptor(url_, path_, checksum, size_);
}

Descriptor Descriptor::withSize(const uintmax_t& size) const
{
    return Descriptor(url_, path_, checksum_, size);
}

std::string Descriptor::toString() const
{
    return url_ + " -> " + path_.string();
}
