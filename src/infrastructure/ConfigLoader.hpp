/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading import configuration (settings.json).
 *
 * Provides a unified way to access settings like path precision or the collection key
 * separator without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include "domain/ImportSettings.hpp"

namespace iconforge::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Location of the user settings file.
     * @return `<config home>/iconforge/settings.json`.
     */
    static std::filesystem::path DefaultSettingsPath();

    /**
     * @brief Reads settings, falling back to defaults.
     * A missing file yields the defaults; a malformed file is logged and yields the defaults;
     * a key with the wrong type is logged and ignored.
     */
    static domain::ImportSettings LoadImportSettings(const std::filesystem::path& settingsPath);
};

} // namespace iconforge::infrastructure
