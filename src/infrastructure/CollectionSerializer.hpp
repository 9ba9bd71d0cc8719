/**
 * @file CollectionSerializer.hpp
 * @brief JSON reading and writing of collection records.
 */

#pragma once
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include "domain/CollectionRecord.hpp"

namespace iconforge::infrastructure {

/**
 * @class CollectionFormatError
 * @brief The text is not JSON or does not have the shape of a collection record.
 */
class CollectionFormatError : public std::runtime_error {
public:
    explicit CollectionFormatError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class CollectionSerializer
 * @brief Maps CollectionRecord to the icon set interchange JSON and back.
 *
 * Output keeps a fixed key order (prefix, icons, aliases, lastModified, width, height),
 * omits absent optional fields and writes whole numbers as JSON integers. Bytes that are not
 * valid UTF-8 are written as U+FFFD.
 */
class CollectionSerializer {
public:
    static std::string ToJson(const domain::CollectionRecord& record, int indent = 2);

    /** @brief One JSON object holding every record under its collection key. */
    static std::string ToJson(const std::map<std::string, domain::CollectionRecord>& records, int indent = 2);

    /** @throws CollectionFormatError on malformed input. */
    static domain::CollectionRecord FromJson(const std::string& text);

    /** @throws CollectionFormatError when the file cannot be read or parsed. */
    static domain::CollectionRecord LoadFile(const std::filesystem::path& path);
};

} // namespace iconforge::infrastructure
