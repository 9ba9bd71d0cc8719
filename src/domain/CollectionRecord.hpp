/**
 * @file CollectionRecord.hpp
 * @brief Exported, serializable snapshot of an icon set.
 */

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace iconforge::domain {

/** @brief Size every icon is assumed to have unless its entry says otherwise. */
inline constexpr double kDefaultIconSize = 16.0;

/**
 * @struct IconEntry
 * @brief Persisted form of one icon. Optional fields are present only when they differ
 * from the collection defaults (0 for left/top, the default size for width/height).
 */
struct IconEntry {
    std::string body;
    std::optional<double> left;
    std::optional<double> top;
    std::optional<double> width;
    std::optional<double> height;
};

/**
 * @struct IconAlias
 * @brief Alternative name referring to an icon or to another alias.
 */
struct IconAlias {
    std::string parent;
};

/**
 * @struct CollectionRecord
 * @brief Read-only result of an import, mirrors the Iconify JSON interchange shape.
 */
struct CollectionRecord {
    std::string prefix;
    std::map<std::string, IconEntry> icons;
    std::map<std::string, IconAlias> aliases;
    std::int64_t lastModified = 0; ///< Unix epoch seconds of the newest contributing file.
    std::optional<double> width;   ///< Collection default width when not 16.
    std::optional<double> height;  ///< Collection default height when not 16.
};

} // namespace iconforge::domain
