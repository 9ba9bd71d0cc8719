/**
 * @file IconSet.cpp
 * @brief Implementation of IconSet.
 */

#include "domain/IconSet.hpp"
#include "domain/IconErrors.hpp"
#include <algorithm>
#include <utility>

namespace iconforge::domain {

const char* ToString(IconStage stage) {
    switch (stage) {
        case IconStage::Loaded: return "loaded";
        case IconStage::Validated: return "validated";
        case IconStage::ColorCanonicalized: return "color-canonicalized";
        case IconStage::Optimized: return "optimized";
        case IconStage::CompatRewritten: return "compat-rewritten";
        case IconStage::Committed: return "committed";
        case IconStage::Rejected: return "rejected";
    }
    return "unknown";
}

IconSet::IconSet(std::string prefix, double defaultWidth, double defaultHeight)
    : m_prefix(std::move(prefix)), m_defaultWidth(defaultWidth), m_defaultHeight(defaultHeight) {}

IconSet IconSet::FromRecord(const CollectionRecord& record, const DiagnosticSink& sink) {
    IconSet set(record.prefix,
                record.width.value_or(kDefaultIconSize),
                record.height.value_or(kDefaultIconSize));

    for (const auto& [name, entry] : record.icons) {
        ViewBox viewBox{entry.left.value_or(0.0),
                        entry.top.value_or(0.0),
                        entry.width.value_or(set.m_defaultWidth),
                        entry.height.value_or(set.m_defaultHeight)};
        try {
            set.addIcon(name, SvgDocument::FromBody(entry.body, viewBox), record.lastModified);
        } catch (const InvalidIconError& e) {
            if (sink) sink(Diagnostic{Severity::Warning, name, e.what()});
        }
    }
    for (const auto& [name, alias] : record.aliases) {
        if (!set.addAlias(name, alias.parent) && sink) {
            sink(Diagnostic{Severity::Warning, name, "Alias name clashes with an icon"});
        }
    }
    return set;
}

bool IconSet::addIcon(const std::string& name, SvgDocument document, std::int64_t lastModified,
                      const std::string& sourcePath) {
    if (contains(name)) return false;
    m_icons.emplace(name, Icon{std::move(document), lastModified, IconStage::Loaded, sourcePath});
    return true;
}

bool IconSet::addAlias(const std::string& name, const std::string& parent) {
    if (contains(name)) return false;
    m_aliases.emplace(name, parent);
    return true;
}

bool IconSet::remove(const std::string& name) {
    const bool removed = m_icons.erase(name) > 0 || m_aliases.erase(name) > 0;
    if (removed) pruneBrokenAliases();
    return removed;
}

void IconSet::pruneBrokenAliases() {
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto it = m_aliases.begin(); it != m_aliases.end();) {
            if (!contains(it->second)) {
                it = m_aliases.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
    }
}

Icon* IconSet::findIcon(const std::string& name) {
    auto it = m_icons.find(name);
    return it == m_icons.end() ? nullptr : &it->second;
}

const Icon* IconSet::findIcon(const std::string& name) const {
    auto it = m_icons.find(name);
    return it == m_icons.end() ? nullptr : &it->second;
}

bool IconSet::contains(const std::string& name) const {
    return m_icons.count(name) > 0 || m_aliases.count(name) > 0;
}

std::optional<std::string> IconSet::resolve(const std::string& name) const {
    std::string current = name;
    // A chain longer than the number of aliases must contain a cycle.
    for (size_t steps = 0; steps <= m_aliases.size(); ++steps) {
        if (m_icons.count(current)) return current;
        auto it = m_aliases.find(current);
        if (it == m_aliases.end()) return std::nullopt;
        current = it->second;
    }
    return std::nullopt;
}

std::vector<std::string> IconSet::iconNames() const {
    std::vector<std::string> names;
    names.reserve(m_icons.size());
    for (const auto& entry : m_icons) {
        names.push_back(entry.first);
    }
    return names;
}

CollectionRecord IconSet::exportRecord(const DiagnosticSink& sink) const {
    CollectionRecord record;
    record.prefix = m_prefix;
    if (m_defaultWidth != kDefaultIconSize) record.width = m_defaultWidth;
    if (m_defaultHeight != kDefaultIconSize) record.height = m_defaultHeight;

    for (const auto& [name, icon] : m_icons) {
        const ViewBox& viewBox = icon.document.viewBox();
        IconEntry entry;
        entry.body = icon.document.body();
        if (viewBox.left != 0.0) entry.left = viewBox.left;
        if (viewBox.top != 0.0) entry.top = viewBox.top;
        if (viewBox.width != m_defaultWidth) entry.width = viewBox.width;
        if (viewBox.height != m_defaultHeight) entry.height = viewBox.height;
        record.icons.emplace(name, std::move(entry));
        record.lastModified = std::max(record.lastModified, icon.lastModified);
    }

    for (const auto& [name, parent] : m_aliases) {
        if (!resolve(name)) {
            if (sink) sink(Diagnostic{Severity::Warning, name, "Alias \"" + name + "\" does not resolve to an icon"});
            continue;
        }
        record.aliases.emplace(name, IconAlias{parent});
    }
    return record;
}

} // namespace iconforge::domain
