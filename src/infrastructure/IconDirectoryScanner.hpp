/**
 * @file IconDirectoryScanner.hpp
 * @brief Finds the directories that hold icon files and lists their icons.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "domain/Diagnostic.hpp"

namespace iconforge::infrastructure {

/**
 * @struct IconDirectory
 * @brief A directory that directly contains at least one icon file.
 */
struct IconDirectory {
    std::filesystem::path path;
    std::vector<std::string> relativeSegments; ///< Path from the scan root, empty for the root itself.
};

/**
 * @class IconDirectoryScanner
 * @brief Depth-first, name-ordered walk over an icon tree.
 *
 * Every directory that directly contains a `.svg` file is reported, whatever its depth or
 * whether an ancestor was reported too. Symbolic links to directories are not followed.
 * A directory that cannot be read is reported to the sink and its branch skipped.
 */
class IconDirectoryScanner {
public:
    /**
     * @param rootPath Directory to scan.
     * @throws std::invalid_argument when rootPath is not an existing directory.
     */
    explicit IconDirectoryScanner(const std::string& rootPath, domain::DiagnosticSink sink = nullptr);

    /** @brief Every qualifying directory, parents before children, siblings by name. */
    std::vector<IconDirectory> scan() const;

    /**
     * @brief Icon files of one directory, sorted by name.
     * @param recursive Also list nested directories' icons, after the directory's own files.
     */
    std::vector<std::filesystem::path> listIconFiles(const std::filesystem::path& directory, bool recursive) const;

    const std::filesystem::path& root() const { return m_root; }

    /** @brief True for names ending in `.svg`, in any letter case. */
    static bool IsIconFile(const std::filesystem::path& path);

private:
    struct Listing {
        std::vector<std::filesystem::path> files;
        std::vector<std::filesystem::path> directories;
    };

    Listing listDirectory(const std::filesystem::path& directory) const;
    void walk(const std::filesystem::path& directory,
              std::vector<std::string>& segments,
              std::vector<IconDirectory>& out) const;

    std::filesystem::path m_root;
    domain::DiagnosticSink m_sink;
};

} // namespace iconforge::infrastructure
