/**
 * @file IconDirectoryScanner.cpp
 * @brief Implementation of the IconDirectoryScanner.
 */

#include "infrastructure/IconDirectoryScanner.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace iconforge::infrastructure {

IconDirectoryScanner::IconDirectoryScanner(const std::string& rootPath, domain::DiagnosticSink sink)
    : m_root(rootPath), m_sink(std::move(sink)) {
    std::error_code ec;
    if (rootPath.empty() || !fs::is_directory(m_root, ec)) {
        throw std::invalid_argument("Not a directory: \"" + rootPath + "\"");
    }
}

bool IconDirectoryScanner::IsIconFile(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext == ".svg";
}

IconDirectoryScanner::Listing IconDirectoryScanner::listDirectory(const fs::path& directory) const {
    Listing listing;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    const fs::directory_iterator end;

    for (; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code statusEc;
        if (entry.is_symlink(statusEc)) {
            // Linked files are read, linked directories are not walked.
            if (entry.is_regular_file(statusEc) && IsIconFile(entry.path())) {
                listing.files.push_back(entry.path());
            }
            continue;
        }
        if (entry.is_directory(statusEc)) {
            listing.directories.push_back(entry.path());
        } else if (entry.is_regular_file(statusEc) && IsIconFile(entry.path())) {
            listing.files.push_back(entry.path());
        }
    }

    if (ec) {
        if (m_sink) {
            m_sink(domain::Diagnostic{domain::Severity::Warning, directory.string(),
                                      "Cannot read directory: " + ec.message()});
        }
        return {};
    }

    std::sort(listing.files.begin(), listing.files.end());
    std::sort(listing.directories.begin(), listing.directories.end());
    return listing;
}

std::vector<IconDirectory> IconDirectoryScanner::scan() const {
    std::vector<IconDirectory> directories;
    std::vector<std::string> segments;
    walk(m_root, segments, directories);
    return directories;
}

void IconDirectoryScanner::walk(const fs::path& directory,
                                std::vector<std::string>& segments,
                                std::vector<IconDirectory>& out) const {
    const Listing listing = listDirectory(directory);
    if (!listing.files.empty()) {
        out.push_back(IconDirectory{directory, segments});
    }
    for (const auto& child : listing.directories) {
        segments.push_back(child.filename().string());
        walk(child, segments, out);
        segments.pop_back();
    }
}

std::vector<fs::path> IconDirectoryScanner::listIconFiles(const fs::path& directory, bool recursive) const {
    Listing listing = listDirectory(directory);
    std::vector<fs::path> files = std::move(listing.files);
    if (!recursive) return files;

    for (const auto& child : listing.directories) {
        auto nested = listIconFiles(child, true);
        files.insert(files.end(), nested.begin(), nested.end());
    }
    return files;
}

} // namespace iconforge::infrastructure
