/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace iconforge::infrastructure {

namespace {

void WarnType(const char* key, const char* expected) {
    std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected " << expected << std::endl;
}

} // namespace

std::filesystem::path ConfigLoader::DefaultSettingsPath() {
    return PathUtils::GetConfigHome() / "iconforge" / "settings.json";
}

domain::ImportSettings ConfigLoader::LoadImportSettings(const std::filesystem::path& settingsPath) {
    domain::ImportSettings settings;
    if (!std::filesystem::exists(settingsPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(settingsPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath.string() << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << settingsPath.string() << " is not a JSON object" << std::endl;
        return settings;
    }

    if (j.contains("pathPrecision")) {
        if (j["pathPrecision"].is_number_integer() && j["pathPrecision"].get<int>() >= 0) {
            settings.pathPrecision = j["pathPrecision"].get<int>();
        } else {
            WarnType("pathPrecision", "a non-negative integer");
        }
    }
    if (j.contains("defaultSize")) {
        if (j["defaultSize"].is_number() && j["defaultSize"].get<double>() > 0) {
            settings.defaultSize = j["defaultSize"].get<double>();
        } else {
            WarnType("defaultSize", "a positive number");
        }
    }
    if (j.contains("keySeparator")) {
        if (j["keySeparator"].is_string()) {
            settings.keySeparator = j["keySeparator"].get<std::string>();
        } else {
            WarnType("keySeparator", "a string");
        }
    }
    if (j.contains("maxWorkers")) {
        if (j["maxWorkers"].is_number_unsigned()) {
            settings.maxWorkers = j["maxWorkers"].get<unsigned>();
        } else {
            WarnType("maxWorkers", "a non-negative integer");
        }
    }
    if (j.contains("includeSubDirs")) {
        if (j["includeSubDirs"].is_boolean()) {
            settings.includeSubDirs = j["includeSubDirs"].get<bool>();
        } else {
            WarnType("includeSubDirs", "a boolean");
        }
    }
    if (j.contains("prefix")) {
        if (j["prefix"].is_string()) {
            settings.prefix = j["prefix"].get<std::string>();
        } else {
            WarnType("prefix", "a string");
        }
    }
    return settings;
}

} // namespace iconforge::infrastructure
