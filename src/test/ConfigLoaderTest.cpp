#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using iconforge::infrastructure::ConfigLoader;
using iconforge::infrastructure::PathUtils;

namespace {

fs::path WriteSettings(const fs::path& dir, const std::string& name, const std::string& content) {
    fs::create_directories(dir);
    const fs::path path = dir / name;
    std::ofstream(path) << content;
    return path;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path testRoot = fs::temp_directory_path() / "iconforge_config_test";
    fs::remove_all(testRoot);

    auto settings = ConfigLoader::LoadImportSettings(testRoot / "missing.json");
    assert(settings.pathPrecision == 3);
    assert(settings.defaultSize == 16.0);
    assert(settings.keySeparator == "-");
    assert(settings.maxWorkers == 0);
    assert(settings.includeSubDirs);
    assert(settings.prefix.empty());
    std::cout << "[PASS] Missing file gives defaults." << std::endl;

    settings = ConfigLoader::LoadImportSettings(WriteSettings(testRoot, "full.json", R"({
        "pathPrecision": 2,
        "defaultSize": 24,
        "keySeparator": "/",
        "maxWorkers": 4,
        "includeSubDirs": false,
        "prefix": "ic"
    })"));
    assert(settings.pathPrecision == 2);
    assert(settings.defaultSize == 24.0);
    assert(settings.keySeparator == "/");
    assert(settings.maxWorkers == 4);
    assert(!settings.includeSubDirs);
    assert(settings.prefix == "ic");
    std::cout << "[PASS] All keys are read." << std::endl;

    settings = ConfigLoader::LoadImportSettings(WriteSettings(testRoot, "typed.json", R"({
        "pathPrecision": "high",
        "defaultSize": -1,
        "maxWorkers": -2,
        "includeSubDirs": "yes",
        "prefix": "mdi"
    })"));
    assert(settings.pathPrecision == 3);
    assert(settings.defaultSize == 16.0);
    assert(settings.maxWorkers == 0);
    assert(settings.includeSubDirs);
    assert(settings.prefix == "mdi");
    std::cout << "[PASS] Wrongly typed keys are ignored individually." << std::endl;

    settings = ConfigLoader::LoadImportSettings(WriteSettings(testRoot, "broken.json", "{ \"prefix\": "));
    assert(settings.prefix.empty() && settings.pathPrecision == 3);
    settings = ConfigLoader::LoadImportSettings(WriteSettings(testRoot, "array.json", "[1, 2]"));
    assert(settings.keySeparator == "-");
    std::cout << "[PASS] Malformed file falls back to defaults." << std::endl;

    setenv("XDG_CONFIG_HOME", testRoot.c_str(), 1);
    assert(ConfigLoader::DefaultSettingsPath() == testRoot / "iconforge" / "settings.json");
    assert(PathUtils::GetCollectionFile(testRoot, "") == testRoot / "icons.json");
    assert(PathUtils::GetCollectionFile(testRoot, "ic-a") == testRoot / "ic-a.json");
    std::cout << "[PASS] Paths follow XDG_CONFIG_HOME." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
