/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef MANIFEST_H
#define MANIFEST_H

#include "descriptor.h"

#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <json/json.h>

/*
    Descriptor lists stored as JSON

    The root is either an array of file entries or an object with a "files"
    array. Entry members:
        url      string, required
        path     string, required, relative paths resolve against base_dir
        size     unsigned integer or numeric string
        sha1, sha256, md5 or checksum: { "type": ..., "hash": ... }
                 at most one

    Errors are thrown as std::runtime_error naming the entry index.
*/
namespace Manifest
{
    std::vector<Descriptor> parse(const Json::Value& json, const boost::filesystem::path& base_dir, const std::string& source = "manifest");
    std::vector<Descriptor> load(const std::string& filepath, const boost::filesystem::path& base_dir);
}

#endif // MANIFEST_H
