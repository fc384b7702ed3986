/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "manifest.h"
#include "util.h"

#include <stdexcept>
#include <boost/algorithm/string.hpp>

namespace
{
    std::string entryError(const std::string& source, const Json::ArrayIndex& index, const std::string& msg)
    {
        return source + ": entry " + std::to_string(index) + ": " + msg;
    }

    std::string getStringMember(const Json::Value& entry, const std::string& name, const std::string& source, const Json::ArrayIndex& index)
    {
        if (!entry.isMember(name))
            throw std::runtime_error(entryError(source, index, "missing \"" + name + "\""));
        if (!entry[name].isString())
            throw std::runtime_error(entryError(source, index, "\"" + name + "\" is not a string"));

        std::string value = entry[name].asString();
        if (value.empty())
            throw std::runtime_error(entryError(source, index, "\"" + name + "\" is empty"));
        return value;
    }

    boost::optional<uintmax_t> parseSize(const Json::Value& entry, const std::string& source, const Json::ArrayIndex& index)
    {
        if (!entry.isMember("size") || entry["size"].isNull())
            return boost::none;

        const Json::Value& size = entry["size"];
        if (size.isUInt64())
            return static_cast<uintmax_t>(size.asUInt64());

        if (size.isString())
        {
            std::string str = size.asString();
            if (!str.empty() && str.find_first_not_of("0123456789") == std::string::npos)
            {
                try
                {
                    return static_cast<uintmax_t>(std::stoull(str));
                }
                catch (const std::out_of_range&)
                {
                    throw std::runtime_error(entryError(source, index, "size out of range: " + str));
                }
            }
        }

        throw std::runtime_error(entryError(source, index, "invalid size: " + size.toStyledString()));
    }

    unsigned int parseChecksumType(const std::string& type, const std::string& source, const Json::ArrayIndex& index)
    {
        unsigned int id = Util::getOptionValue(boost::algorithm::trim_copy(type), GlobalConstants::CHECKSUM_TYPES, false);
        if (id == 0)
            throw std::runtime_error(entryError(source, index, "unknown checksum type: " + type));
        return id;
    }

    boost::optional<Checksum> parseChecksum(const Json::Value& entry, const std::string& source, const Json::ArrayIndex& index)
    {
        boost::optional<Checksum> checksum;
        unsigned int iChecksumCount = 0;

        for (const auto& type : GlobalConstants::CHECKSUM_TYPES)
        {
            if (!entry.isMember(type.code))
                continue;
            if (!entry[type.code].isString() || entry[type.code].asString().empty())
                throw std::runtime_error(entryError(source, index, "\"" + type.code + "\" is not a hash string"));

            checksum = Checksum(type.id, entry[type.code].asString());
            iChecksumCount++;
        }

        if (entry.isMember("checksum"))
        {
            const Json::Value& value = entry["checksum"];
            if (!value.isObject() || !value["type"].isString() || !value["hash"].isString() || value["hash"].asString().empty())
                throw std::runtime_error(entryError(source, index, "\"checksum\" needs \"type\" and \"hash\" strings"));

            checksum = Checksum(parseChecksumType(value["type"].asString(), source, index), value["hash"].asString());
            iChecksumCount++;
        }

        if (iChecksumCount > 1)
            throw std::runtime_error(entryError(source, index, "more than one checksum"));

        return checksum;
    }
}

std::vector<Descriptor> Manifest::parse(const Json::Value& json, const boost::filesystem::path& base_dir, const std::string& source)
{
    const Json::Value* files = &json;
    if (json.isObject())
    {
        if (!json.isMember("files"))
            throw std::runtime_error(source + ": missing \"files\" array");
        files = &json["files"];
    }

    if (!files->isArray())
        throw std::runtime_error(source + ": expected an array of files");

    std::vector<Descriptor> descriptors;
    for (Json::ArrayIndex i = 0; i < files->size(); ++i)
    {
        const Json::Value& entry = (*files)[i];
        if (!entry.isObject())
            throw std::runtime_error(entryError(source, i, "not an object"));

        std::string url = getStringMember(entry, "url", source, i);
        boost::filesystem::path filepath(getStringMember(entry, "path", source, i));
        if (filepath.is_relative() && !base_dir.empty())
            filepath = base_dir / filepath;

        descriptors.push_back(Descriptor(url, filepath, parseChecksum(entry, source, i), parseSize(entry, source, i)));
    }

    return descriptors;
}

std::vector<Descriptor> Manifest::load(const std::string& filepath, const boost::filesystem::path& base_dir)
{
    Json::Value json = Util::readJsonFile(filepath);
    return Manifest::parse(json, base_dir, filepath);
}
