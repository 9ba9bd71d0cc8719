// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace iconforge::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief `<directory>/<key>.json`; the root collection (empty key) is written as `icons.json`. */
    static std::filesystem::path GetCollectionFile(const std::filesystem::path& directory, const std::string& key);
};

} // namespace iconforge::infrastructure
