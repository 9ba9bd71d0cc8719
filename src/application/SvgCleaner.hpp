/**
 * @file SvgCleaner.hpp
 * @brief First pipeline stage: structural validation and removal of presentation noise.
 */

#pragma once
#include "domain/SvgDocument.hpp"

namespace tinyxml2 {
class XMLNode;
class XMLElement;
}

namespace iconforge::application {

/**
 * @class SvgCleaner
 * @brief Validates an icon document and strips everything that is not needed to embed it.
 *
 * Removes declarations, comments, editor metadata, scripts and event handlers, inlines
 * `<style>` rules with simple type, class and id selectors, expands `style` declarations
 * into attributes, moves root presentation attributes onto a wrapping group
 * and unwraps attribute-less groups.
 */
class SvgCleaner {
public:
    /**
     * @brief Cleans the document in place.
     * @throws domain::InvalidIconError when the icon has no visible geometry or contains
     * content that cannot be redistributed (e.g. foreignObject, or a stylesheet rule
     * with a selector that cannot be inlined).
     */
    void clean(domain::SvgDocument& document) const;

private:
    void removeNonElementNodes(tinyxml2::XMLNode* node) const;
    void removeEditorContent(tinyxml2::XMLElement* element) const;
    void inlineStyleSheets(tinyxml2::XMLElement* root) const;
    void expandInlineStyle(tinyxml2::XMLElement* element) const;
    void wrapRootPresentation(domain::SvgDocument& document) const;
    void unwrapPlainGroups(tinyxml2::XMLElement* element) const;
};

} // namespace iconforge::application
