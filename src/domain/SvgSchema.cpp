#include "domain/SvgSchema.hpp"
#include <unordered_map>
#include <unordered_set>
#include <tinyxml2.h>

namespace iconforge::domain::svg {

namespace {

const std::unordered_set<std::string> kShapes = {
    "path", "rect", "circle", "ellipse", "line", "polyline", "polygon",
    "use", "text", "image"
};

const std::unordered_set<std::string> kNonRendering = {
    "defs", "clipPath", "mask", "symbol", "pattern", "marker",
    "linearGradient", "radialGradient", "filter"
};

const std::unordered_set<std::string> kPresentation = {
    "alignment-baseline", "baseline-shift", "clip", "clip-path", "clip-rule", "color",
    "color-interpolation", "color-interpolation-filters", "color-profile", "color-rendering",
    "cursor", "direction", "display", "dominant-baseline", "enable-background", "fill",
    "fill-opacity", "fill-rule", "filter", "flood-color", "flood-opacity", "font",
    "font-family", "font-size", "font-size-adjust", "font-stretch", "font-style",
    "font-variant", "font-weight", "glyph-orientation-horizontal",
    "glyph-orientation-vertical", "image-rendering", "kerning", "letter-spacing",
    "lighting-color", "marker", "marker-end", "marker-mid", "marker-start", "mask",
    "opacity", "overflow", "pointer-events", "shape-rendering", "stop-color",
    "stop-opacity", "stroke", "stroke-dasharray", "stroke-dashoffset", "stroke-linecap",
    "stroke-linejoin", "stroke-miterlimit", "stroke-opacity", "stroke-width",
    "text-anchor", "text-decoration", "text-rendering", "unicode-bidi", "visibility",
    "word-spacing", "writing-mode"
};

const std::unordered_set<std::string> kInherited = {
    "clip-rule", "color", "color-interpolation", "color-interpolation-filters",
    "color-rendering", "cursor", "direction", "fill", "fill-opacity", "fill-rule", "font",
    "font-family", "font-size", "font-size-adjust", "font-stretch", "font-style",
    "font-variant", "font-weight", "glyph-orientation-horizontal",
    "glyph-orientation-vertical", "image-rendering", "kerning", "letter-spacing", "marker",
    "marker-end", "marker-mid", "marker-start", "pointer-events", "shape-rendering",
    "stroke", "stroke-dasharray", "stroke-dashoffset", "stroke-linecap", "stroke-linejoin",
    "stroke-miterlimit", "stroke-opacity", "stroke-width", "text-anchor", "text-rendering",
    "visibility", "word-spacing", "writing-mode"
};

const std::unordered_map<std::string, const char*> kDefaults = {
    {"fill-opacity", "1"}, {"fill-rule", "nonzero"}, {"clip-rule", "nonzero"},
    {"stroke", "none"}, {"stroke-opacity", "1"}, {"stroke-width", "1"},
    {"stroke-linecap", "butt"}, {"stroke-linejoin", "miter"}, {"stroke-miterlimit", "4"},
    {"stroke-dasharray", "none"}, {"stroke-dashoffset", "0"}, {"opacity", "1"},
    {"stop-opacity", "1"}, {"flood-opacity", "1"}, {"visibility", "visible"},
    {"display", "inline"}
};

bool AncestorMatches(const tinyxml2::XMLElement* element, bool (*predicate)(const std::string&)) {
    for (const tinyxml2::XMLNode* node = element->Parent(); node; node = node->Parent()) {
        const tinyxml2::XMLElement* parent = node->ToElement();
        if (parent && predicate(parent->Name())) return true;
    }
    return false;
}

} // namespace

bool IsShapeElement(const std::string& name) { return kShapes.count(name) > 0; }
bool IsNonRenderingContainer(const std::string& name) { return kNonRendering.count(name) > 0; }
bool IsMaskContainer(const std::string& name) { return name == "clipPath" || name == "mask"; }
bool IsPresentationAttribute(const std::string& name) { return kPresentation.count(name) > 0; }
bool IsInheritedProperty(const std::string& name) { return kInherited.count(name) > 0; }

const char* DefaultValue(const std::string& name) {
    auto it = kDefaults.find(name);
    return it == kDefaults.end() ? nullptr : it->second;
}

std::vector<tinyxml2::XMLElement*> ChildElements(tinyxml2::XMLElement* element) {
    std::vector<tinyxml2::XMLElement*> children;
    for (auto* child = element->FirstChildElement(); child; child = child->NextSiblingElement()) {
        children.push_back(child);
    }
    return children;
}

std::vector<tinyxml2::XMLElement*> Descendants(tinyxml2::XMLElement* element) {
    std::vector<tinyxml2::XMLElement*> result;
    for (auto* child : ChildElements(element)) {
        result.push_back(child);
        auto nested = Descendants(child);
        result.insert(result.end(), nested.begin(), nested.end());
    }
    return result;
}

bool InNonRenderingContainer(const tinyxml2::XMLElement* element) {
    return AncestorMatches(element, &IsNonRenderingContainer);
}

bool InMaskContainer(const tinyxml2::XMLElement* element) {
    return AncestorMatches(element, &IsMaskContainer);
}

const char* InheritedAttribute(const tinyxml2::XMLElement* element, const char* name) {
    for (const tinyxml2::XMLNode* node = element; node; node = node->Parent()) {
        const tinyxml2::XMLElement* current = node->ToElement();
        if (!current) break;
        if (const char* value = current->Attribute(name)) return value;
    }
    return nullptr;
}

bool HasVisibleGeometry(tinyxml2::XMLElement* root) {
    for (auto* element : Descendants(root)) {
        if (IsShapeElement(element->Name()) && !InNonRenderingContainer(element)) {
            return true;
        }
    }
    return false;
}

void UnwrapElement(tinyxml2::XMLElement* element) {
    tinyxml2::XMLNode* parent = element->Parent();
    if (!parent) return;

    std::vector<tinyxml2::XMLNode*> children;
    for (auto* child = element->FirstChild(); child; child = child->NextSibling()) {
        children.push_back(child);
    }

    tinyxml2::XMLNode* anchor = element;
    for (auto* child : children) {
        parent->InsertAfterChild(anchor, child);
        anchor = child;
    }
    parent->DeleteChild(element);
}

size_t AttributeCount(const tinyxml2::XMLElement* element) {
    size_t count = 0;
    for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
        ++count;
    }
    return count;
}

} // namespace iconforge::domain::svg
