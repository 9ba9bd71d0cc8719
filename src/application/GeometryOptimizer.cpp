/**
 * @file GeometryOptimizer.cpp
 * @brief Implementation of GeometryOptimizer.
 */

#include "application/GeometryOptimizer.hpp"
#include "domain/IconErrors.hpp"
#include "domain/PathData.hpp"
#include "domain/SvgSchema.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <tinyxml2.h>

namespace iconforge::application {

namespace svg = domain::svg;
using domain::PathData;

namespace {

const char* const kNumericAttributes[] = {
    "x", "y", "width", "height", "rx", "ry", "cx", "cy", "r", "fx", "fy",
    "x1", "y1", "x2", "y2", "stroke-width", "stroke-dashoffset", "stroke-miterlimit"
};

// Attribute groups in output order; a name belongs to a group if it equals it or extends it with '-'.
const char* const kAttributeOrder[] = {
    "id", "width", "height", "x", "x1", "x2", "y", "y1", "y2", "cx", "cy", "r",
    "fill", "stroke", "marker", "d", "points"
};

// A group carrying one of these cannot hand its attributes to its child.
const char* const kGroupBarriers[] = {"id", "clip-path", "mask", "filter"};

// Paths carrying one of these are never merged with a neighbour.
const char* const kMergeBarriers[] = {
    "id", "marker", "marker-start", "marker-mid", "marker-end", "clip-path", "mask", "filter", "opacity"
};

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool ParsePlainNumber(const std::string& text, double& value) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) return false;
    const char* begin = trimmed.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0' && std::isfinite(value);
}

bool IsNamed(const tinyxml2::XMLElement* element, const char* name) {
    return std::string(element->Name()) == name;
}

std::map<std::string, std::string> AttributeMap(const tinyxml2::XMLElement* element) {
    std::map<std::string, std::string> attributes;
    for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
        attributes.emplace(attr->Name(), attr->Value());
    }
    return attributes;
}

size_t OrderGroup(const std::string& name) {
    const size_t count = sizeof(kAttributeOrder) / sizeof(kAttributeOrder[0]);
    for (size_t i = 0; i < count; ++i) {
        const std::string group = kAttributeOrder[i];
        if (name == group || name.compare(0, group.size() + 1, group + "-") == 0) return i;
    }
    return count;
}

bool IsHrefAttribute(const std::string& name) {
    return name == "href" || name == "xlink:href";
}

/** @brief Calls visit(id, begin, end) for every `url(#id)` in a value; [begin, end) spans the whole `url(...)`. */
template <typename Visitor>
void ForEachUrlReference(const std::string& value, Visitor visit) {
    size_t pos = 0;
    while ((pos = value.find("url(", pos)) != std::string::npos) {
        const size_t close = value.find(')', pos);
        if (close == std::string::npos) return;
        std::string inner = Trim(value.substr(pos + 4, close - pos - 4));
        if (inner.size() >= 2 && (inner.front() == '\'' || inner.front() == '"') && inner.back() == inner.front()) {
            inner = inner.substr(1, inner.size() - 2);
        }
        if (!inner.empty() && inner.front() == '#') {
            visit(inner.substr(1), pos, close + 1);
        }
        pos = close + 1;
    }
}

std::string RewriteReferences(const std::string& name, const std::string& value,
                              const std::map<std::string, std::string>& renames) {
    if (IsHrefAttribute(name)) {
        if (value.size() > 1 && value.front() == '#') {
            auto it = renames.find(value.substr(1));
            if (it != renames.end()) return "#" + it->second;
        }
        return value;
    }

    std::string result;
    size_t copied = 0;
    ForEachUrlReference(value, [&](const std::string& id, size_t begin, size_t end) {
        auto it = renames.find(id);
        if (it == renames.end()) return;
        result += value.substr(copied, begin - copied);
        result += "url(#" + it->second + ")";
        copied = end;
    });
    result += value.substr(copied);
    return result;
}

bool MergeablePaths(const tinyxml2::XMLElement* first, const tinyxml2::XMLElement* second) {
    if (!IsNamed(first, "path") || !IsNamed(second, "path")) return false;
    if (!first->Attribute("d") || !second->Attribute("d")) return false;

    for (const char* barrier : kMergeBarriers) {
        if (first->Attribute(barrier) || second->Attribute(barrier)) return false;
    }

    auto a = AttributeMap(first);
    auto b = AttributeMap(second);
    a.erase("d");
    b.erase("d");
    if (a != b) return false;

    // Only stroke-only paths: joined fills could cancel each other under the fill rule,
    // translucent strokes would no longer overlap.
    const char* fill = svg::InheritedAttribute(first, "fill");
    if (!fill || Trim(fill) != "none") return false;
    const char* strokeOpacity = svg::InheritedAttribute(first, "stroke-opacity");
    if (strokeOpacity && Trim(strokeOpacity) != "1") return false;
    return true;
}

} // namespace

void GeometryOptimizer::optimize(domain::SvgDocument& document) const {
    tinyxml2::XMLElement* root = document.root();

    roundNumericAttributes(root);
    removeDefaultAttributes(root);
    removeEmptyContainers(root);
    collapseGroups(root);
    mergePaths(root);
    // Merging can leave single-child groups, and attributes pushed onto a child can turn
    // out to be defaults once the group is gone.
    collapseGroups(root);
    removeDefaultAttributes(root);
    optimizePathData(root);
    removeEmptyContainers(root);
    cleanupIds(root);
    sortAttributes(root);

    if (!svg::HasVisibleGeometry(root)) {
        throw domain::InvalidIconError("Icon has no visible geometry after optimization");
    }
}

void GeometryOptimizer::roundNumericAttributes(tinyxml2::XMLElement* root) const {
    for (auto* element : svg::Descendants(root)) {
        for (const char* name : kNumericAttributes) {
            const char* raw = element->Attribute(name);
            double value = 0.0;
            if (raw && ParsePlainNumber(raw, value)) {
                element->SetAttribute(name, PathData::FormatNumber(value, m_options.precision).c_str());
            }
        }

        const char* points = element->Attribute("points");
        if (!points) continue;
        std::string rounded;
        std::string token;
        bool valid = true;
        auto flush = [&]() {
            if (token.empty()) return;
            double value = 0.0;
            if (!ParsePlainNumber(token, value)) valid = false;
            if (!rounded.empty()) rounded += ' ';
            rounded += PathData::FormatNumber(value, m_options.precision);
            token.clear();
        };
        for (const char* p = points; *p; ++p) {
            if (*p == ' ' || *p == ',' || *p == '\t' || *p == '\n' || *p == '\r') {
                flush();
            } else {
                token.push_back(*p);
            }
        }
        flush();
        if (valid) element->SetAttribute("points", rounded.c_str());
    }
}

void GeometryOptimizer::removeDefaultAttributes(tinyxml2::XMLElement* root) const {
    for (auto* element : svg::Descendants(root)) {
        const std::string elementName = element->Name();
        const tinyxml2::XMLElement* parent = element->Parent() ? element->Parent()->ToElement() : nullptr;

        std::vector<std::string> doomed;
        for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
            const std::string name = attr->Name();
            const std::string value = Trim(attr->Value());

            if ((name == "x" || name == "y") && value == "0" &&
                (elementName == "rect" || elementName == "use" || elementName == "image")) {
                doomed.push_back(name);
                continue;
            }

            const char* initial = svg::DefaultValue(name);
            if (!initial || value != initial) continue;

            if (svg::IsInheritedProperty(name)) {
                const char* inherited = parent ? svg::InheritedAttribute(parent, name.c_str()) : nullptr;
                if (inherited && Trim(inherited) != initial) continue;
            }
            doomed.push_back(name);
        }
        for (const auto& name : doomed) {
            element->DeleteAttribute(name.c_str());
        }
    }
}

void GeometryOptimizer::removeEmptyContainers(tinyxml2::XMLElement* element) const {
    for (auto* child : svg::ChildElements(element)) {
        removeEmptyContainers(child);
        if ((IsNamed(child, "g") || IsNamed(child, "defs")) && !child->FirstChild()) {
            element->DeleteChild(child);
        }
    }
}

void GeometryOptimizer::collapseGroups(tinyxml2::XMLElement* element) const {
    for (auto* group : svg::ChildElements(element)) {
        collapseGroups(group);
        if (!IsNamed(group, "g")) continue;

        if (svg::AttributeCount(group) == 0) {
            svg::UnwrapElement(group);
            continue;
        }

        tinyxml2::XMLNode* only = group->FirstChild();
        if (!only || only != group->LastChild()) continue;
        tinyxml2::XMLElement* inner = only->ToElement();
        if (!inner || svg::IsNonRenderingContainer(inner->Name())) continue;

        bool movable = true;
        for (const char* barrier : kGroupBarriers) {
            if (group->Attribute(barrier)) movable = false;
        }
        for (const auto* attr = group->FirstAttribute(); movable && attr; attr = attr->Next()) {
            const std::string name = attr->Name();
            if (name == "transform") continue;
            if (inner->Attribute(name.c_str()) && !svg::IsInheritedProperty(name)) movable = false;
        }
        if (!movable) continue;

        for (const auto& [name, value] : AttributeMap(group)) {
            if (name == "transform") {
                const char* own = inner->Attribute("transform");
                const std::string combined = own ? value + " " + own : value;
                inner->SetAttribute("transform", combined.c_str());
            } else if (!inner->Attribute(name.c_str())) {
                inner->SetAttribute(name.c_str(), value.c_str());
            }
        }
        svg::UnwrapElement(group);
    }
}

void GeometryOptimizer::mergePaths(tinyxml2::XMLElement* element) const {
    tinyxml2::XMLElement* previous = nullptr;
    for (auto* child : svg::ChildElements(element)) {
        if (previous && MergeablePaths(previous, child)) {
            auto segments = PathData::ToAbsolute(PathData::Parse(previous->Attribute("d")));
            const auto next = PathData::ToAbsolute(PathData::Parse(child->Attribute("d")));
            segments.insert(segments.end(), next.begin(), next.end());

            PathData::WriteOptions full;
            full.precision = -1;
            full.explicitCommands = true;
            full.compactArcFlags = false;
            previous->SetAttribute("d", PathData::Write(segments, full).c_str());
            element->DeleteChild(child);
            continue;
        }
        mergePaths(child);
        previous = child;
    }
}

void GeometryOptimizer::optimizePathData(tinyxml2::XMLElement* root) const {
    PathData::WriteOptions compact;
    compact.precision = m_options.precision;

    std::vector<tinyxml2::XMLElement*> empty;
    for (auto* element : svg::Descendants(root)) {
        if (!IsNamed(element, "path")) continue;
        const char* d = element->Attribute("d");
        const auto segments = PathData::Parse(d ? d : "");
        if (segments.empty()) {
            empty.push_back(element);
            continue;
        }
        const auto optimized = PathData::Optimize(PathData::ToAbsolute(segments), m_options.precision);
        element->SetAttribute("d", PathData::Write(optimized, compact).c_str());
    }
    for (auto* element : empty) {
        element->Parent()->DeleteChild(element);
    }
}

void GeometryOptimizer::cleanupIds(tinyxml2::XMLElement* root) const {
    const auto elements = svg::Descendants(root);
    for (auto* element : elements) {
        // CSS selectors may target IDs we cannot see.
        if (IsNamed(element, "style")) return;
    }

    std::set<std::string> referenced;
    for (auto* element : elements) {
        for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
            const std::string name = attr->Name();
            const std::string value = attr->Value();
            if (IsHrefAttribute(name)) {
                if (value.size() > 1 && value.front() == '#') referenced.insert(value.substr(1));
            } else {
                ForEachUrlReference(value, [&](const std::string& id, size_t, size_t) { referenced.insert(id); });
            }
        }
    }

    std::map<std::string, std::string> renames;
    for (auto* element : elements) {
        const char* id = element->Attribute("id");
        if (!id) continue;
        if (!referenced.count(id) || renames.count(id)) {
            element->DeleteAttribute("id");
            continue;
        }
        const std::string shortId = "svgID" + std::to_string(renames.size());
        renames.emplace(id, shortId);
        element->SetAttribute("id", shortId.c_str());
    }
    if (renames.empty()) return;

    for (auto* element : elements) {
        std::vector<std::pair<std::string, std::string>> updates;
        for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
            const std::string name = attr->Name();
            if (name == "id") continue;
            const std::string value = attr->Value();
            const std::string rewritten = RewriteReferences(name, value, renames);
            if (rewritten != value) updates.emplace_back(name, rewritten);
        }
        for (const auto& [name, value] : updates) {
            element->SetAttribute(name.c_str(), value.c_str());
        }
    }
}

void GeometryOptimizer::sortAttributes(tinyxml2::XMLElement* root) const {
    for (auto* element : svg::Descendants(root)) {
        std::vector<std::pair<std::string, std::string>> attributes;
        for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
            attributes.emplace_back(attr->Name(), attr->Value());
        }
        auto sorted = attributes;
        std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            const size_t groupA = OrderGroup(a.first);
            const size_t groupB = OrderGroup(b.first);
            if (groupA != groupB) return groupA < groupB;
            return a.first < b.first;
        });
        if (sorted == attributes) continue;

        for (const auto& attr : attributes) {
            element->DeleteAttribute(attr.first.c_str());
        }
        for (const auto& attr : sorted) {
            element->SetAttribute(attr.first.c_str(), attr.second.c_str());
        }
    }
}

} // namespace iconforge::application
