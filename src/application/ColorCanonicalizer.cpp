/**
 * @file ColorCanonicalizer.cpp
 * @brief Implementation of ColorCanonicalizer.
 */

#include "application/ColorCanonicalizer.hpp"
#include "domain/IconErrors.hpp"
#include "domain/SvgSchema.hpp"
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include <tinyxml2.h>

namespace iconforge::application {

namespace svg = domain::svg;

namespace {

const char* const kColorAttributes[] = {"fill", "stroke", "stop-color", "flood-color"};

bool HasMarkedAncestor(const tinyxml2::XMLElement* element,
                       const std::unordered_set<const tinyxml2::XMLElement*>& marked) {
    for (const tinyxml2::XMLNode* node = element->Parent(); node; node = node->Parent()) {
        const tinyxml2::XMLElement* parent = node->ToElement();
        if (parent && marked.count(parent)) return true;
    }
    return false;
}

/** @brief Shapes that take the default black fill when nothing sets one. */
bool PaintsDefaultFill(const tinyxml2::XMLElement* element) {
    const std::string name = element->Name();
    return svg::IsShapeElement(name) && name != "use" && name != "image";
}

} // namespace

ColorCanonicalizer::ColorCanonicalizer(Policy policy) : m_policy(std::move(policy)) {}

void ColorCanonicalizer::canonicalize(domain::SvgDocument& document) const {
    tinyxml2::XMLElement* root = document.root();
    const std::vector<tinyxml2::XMLElement*> elements = svg::Descendants(root);

    std::vector<tinyxml2::XMLElement*> toRemove;
    std::unordered_set<const tinyxml2::XMLElement*> marked;

    for (auto* element : elements) {
        const bool maskContent = svg::IsMaskContainer(element->Name()) || svg::InMaskContainer(element);
        bool remove = false;

        for (const char* attribute : kColorAttributes) {
            const char* raw = element->Attribute(attribute);
            if (!raw) continue;

            const auto color = domain::Color::Parse(raw);
            if (!color) {
                throw domain::InvalidIconError(std::string("Invalid color: \"") + raw +
                                               "\" in attribute " + attribute);
            }
            if (maskContent) continue;

            switch (m_policy(*color)) {
                case domain::ColorAction::Keep:
                    break;
                case domain::ColorAction::Inherit:
                    element->SetAttribute(attribute, domain::kInheritColor);
                    break;
                case domain::ColorAction::Remove:
                    remove = true;
                    break;
            }
        }

        if (!remove && !maskContent && PaintsDefaultFill(element) && !svg::InNonRenderingContainer(element) &&
            !svg::InheritedAttribute(element, "fill")) {
            switch (m_policy(domain::Color::Black())) {
                case domain::ColorAction::Keep:
                    break;
                case domain::ColorAction::Inherit:
                    element->SetAttribute("fill", domain::kInheritColor);
                    break;
                case domain::ColorAction::Remove:
                    remove = true;
                    break;
            }
        }

        if (remove) {
            toRemove.push_back(element);
            marked.insert(element);
        }
    }

    // Children of a removed element go with it; only the outermost marked elements are deleted.
    std::vector<tinyxml2::XMLElement*> outermost;
    for (auto* element : toRemove) {
        if (!HasMarkedAncestor(element, marked)) outermost.push_back(element);
    }
    for (auto* element : outermost) {
        element->Parent()->DeleteChild(element);
    }

    if (!svg::HasVisibleGeometry(root)) {
        throw domain::InvalidIconError("Icon has no visible geometry after removing white shapes");
    }
}

} // namespace iconforge::application
