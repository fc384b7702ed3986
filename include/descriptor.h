/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef DESCRIPTOR_H
#define DESCRIPTOR_H

#include "checksum.h"

#include <cstdint>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

// One remote file and where it goes on disk
class Descriptor
{
    public:
        Descriptor(const std::string& url, const boost::filesystem::path& path,
                   const boost::optional<Checksum>& checksum = boost::none,
                   const boost::optional<uintmax_t>& size = boost::none);

        const std::string& getUrl() const { return url_; };
        const boost::filesystem::path& getPath() const { return path_; };
        const boost::optional<Checksum>& getChecksum() const { return checksum_; };
        const boost::optional<uintmax_t>& getSize() const { return size_; };
        // Declared size of 0 is not verified after a transfer
        bool hasKnownSize() const { return size_ && *size_ > 0; };

        Descriptor withChecksum(const Checksum& checksum) const;
        Descriptor withSize(const uintmax_t& size) const;

        std::string toString() const;
    private:
        std::string url_;
        boost::filesystem::path path_;
        boost::optional<Checksum> checksum_;
        boost::optional<uintmax_t> size_;
};

#endif // DESCRIPTOR_H
