#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace iconforge::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCollectionFile(const fs::path& directory, const std::string& key) {
    return directory / ((key.empty() ? std::string("icons") : key) + ".json");
}

} // namespace iconforge::infrastructure
