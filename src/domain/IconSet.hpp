/**
 * @file IconSet.hpp
 * @brief Working collection of icon documents and aliases for one import.
 */

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/CollectionRecord.hpp"
#include "domain/Diagnostic.hpp"
#include "domain/SvgDocument.hpp"

namespace iconforge::domain {

/**
 * @enum IconStage
 * @brief Position of an icon in the processing pipeline.
 */
enum class IconStage {
    Loaded,
    Validated,
    ColorCanonicalized,
    Optimized,
    CompatRewritten,
    Committed,
    Rejected
};

const char* ToString(IconStage stage);

/**
 * @struct Icon
 * @brief One icon owned by a set. The document is mutated in place by the pipeline.
 */
struct Icon {
    SvgDocument document;
    std::int64_t lastModified = 0; ///< Source file mtime, Unix epoch seconds.
    IconStage stage = IconStage::Loaded;
    std::string sourcePath;
};

/**
 * @class IconSet
 * @brief Owns name -> icon and alias -> parent mappings.
 *
 * Names are unique across icons and aliases. Removing an icon also removes every
 * alias that depended on it. Export produces an immutable CollectionRecord.
 */
class IconSet {
public:
    explicit IconSet(std::string prefix = "",
                     double defaultWidth = kDefaultIconSize,
                     double defaultHeight = kDefaultIconSize);

    /**
     * @brief Rebuilds a set from a previously exported record.
     * Icons whose body cannot be parsed are skipped and reported to the sink.
     */
    static IconSet FromRecord(const CollectionRecord& record, const DiagnosticSink& sink = nullptr);

    /** @return False when the name is already taken. */
    bool addIcon(const std::string& name, SvgDocument document, std::int64_t lastModified,
                 const std::string& sourcePath = {});

    /** @return False when the name is already taken. */
    bool addAlias(const std::string& name, const std::string& parent);

    /**
     * @brief Removes an icon or alias and every alias that no longer resolves afterwards.
     * @return True if something named `name` existed.
     */
    bool remove(const std::string& name);

    Icon* findIcon(const std::string& name);
    const Icon* findIcon(const std::string& name) const;
    bool contains(const std::string& name) const;

    /** @brief Follows alias links to the icon they end at, or nullopt for a broken or cyclic chain. */
    std::optional<std::string> resolve(const std::string& name) const;

    std::vector<std::string> iconNames() const;
    const std::map<std::string, std::string>& aliases() const { return m_aliases; }
    size_t iconCount() const { return m_icons.size(); }
    bool empty() const { return m_icons.empty(); }

    const std::string& prefix() const { return m_prefix; }
    void setPrefix(const std::string& prefix) { m_prefix = prefix; }
    double defaultWidth() const { return m_defaultWidth; }
    double defaultHeight() const { return m_defaultHeight; }

    /**
     * @brief Serializes every icon into a record.
     * Aliases that do not resolve are left out and reported to the sink.
     */
    CollectionRecord exportRecord(const DiagnosticSink& sink = nullptr) const;

private:
    void pruneBrokenAliases();

    std::string m_prefix;
    double m_defaultWidth;
    double m_defaultHeight;
    std::map<std::string, Icon> m_icons;
    std::map<std::string, std::string> m_aliases;
};

} // namespace iconforge::domain
