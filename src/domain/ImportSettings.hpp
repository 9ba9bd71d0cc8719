/**
 * @file ImportSettings.hpp
 * @brief Tunables shared by every import, read from settings.json.
 */

#pragma once
#include <string>
#include "domain/CollectionRecord.hpp"

namespace iconforge::domain {

/**
 * @struct ImportSettings
 * @brief Defaults for the import services; the CLI overrides them per invocation.
 */
struct ImportSettings {
    int pathPrecision = 3;                 ///< Decimal places kept in coordinates.
    double defaultSize = kDefaultIconSize; ///< Icon size that needs no width/height in the record.
    std::string keySeparator = "-";        ///< Joins path segments into collection keys.
    unsigned maxWorkers = 0;               ///< Concurrent directories; 0 uses the hardware concurrency.
    bool includeSubDirs = true;            ///< Single-collection import folds in nested directories.
    std::string prefix;                    ///< Collection prefix when none is given.
};

} // namespace iconforge::domain
