/**
 * @file IconDirectoryLoader.hpp
 * @brief Reads icon files into an IconSet.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "domain/Diagnostic.hpp"
#include "domain/IconSet.hpp"

namespace iconforge::infrastructure {

/**
 * @class IconDirectoryLoader
 * @brief Infrastructure adapter that turns files on disk into icon documents.
 *
 * Each icon is named after its file stem. Files that cannot be read or parsed are
 * reported and left out; a name already taken by an earlier file is reported too.
 */
class IconDirectoryLoader {
public:
    explicit IconDirectoryLoader(domain::DiagnosticSink sink = nullptr);

    /**
     * @brief Loads the files, in the given order, into a new set.
     * Files with a duplicate stem, a name or content that is not UTF-8, or unparseable
     * markup are skipped with a warning.
     */
    domain::IconSet load(const std::vector<std::filesystem::path>& files,
                         const std::string& prefix,
                         double defaultSize) const;

    /** @brief Modification time of a file in Unix epoch seconds. */
    static std::int64_t LastModifiedSeconds(const std::filesystem::path& path);

private:
    void warn(const std::filesystem::path& path, const std::string& reason) const;

    domain::DiagnosticSink m_sink;
};

} // namespace iconforge::infrastructure
