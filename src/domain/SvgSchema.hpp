/**
 * @file SvgSchema.hpp
 * @brief SVG vocabulary knowledge shared by the pipeline stages, plus small tree helpers.
 */

#pragma once
#include <string>
#include <vector>

namespace tinyxml2 {
class XMLElement;
class XMLNode;
}

namespace iconforge::domain::svg {

/** @brief Elements that draw something: path, rect, circle, ..., use, text, image. */
bool IsShapeElement(const std::string& name);

/** @brief Containers whose content is never rendered directly (defs, clipPath, mask, gradients, ...). */
bool IsNonRenderingContainer(const std::string& name);

/** @brief Containers whose shapes are geometry masks rather than paint (clipPath, mask). */
bool IsMaskContainer(const std::string& name);

/** @brief SVG 1.1 presentation attributes (the ones a `style` declaration may carry). */
bool IsPresentationAttribute(const std::string& name);

/** @brief Presentation properties whose value is inherited by descendants. */
bool IsInheritedProperty(const std::string& name);

/** @brief Initial value of a presentation property, or nullptr when it has none worth removing. */
const char* DefaultValue(const std::string& name);

/** @brief Element children in document order. */
std::vector<tinyxml2::XMLElement*> ChildElements(tinyxml2::XMLElement* element);

/** @brief All descendant elements, depth-first, parents before children. */
std::vector<tinyxml2::XMLElement*> Descendants(tinyxml2::XMLElement* element);

/** @brief True when any ancestor (not the element itself) satisfies IsNonRenderingContainer. */
bool InNonRenderingContainer(const tinyxml2::XMLElement* element);

/** @brief True when any ancestor (not the element itself) is a clipPath or mask. */
bool InMaskContainer(const tinyxml2::XMLElement* element);

/** @brief Value of an attribute on the element or its nearest ancestor, nullptr if none sets it. */
const char* InheritedAttribute(const tinyxml2::XMLElement* element, const char* name);

/** @brief True when at least one shape is rendered (outside defs, masks and similar containers). */
bool HasVisibleGeometry(tinyxml2::XMLElement* root);

/** @brief Replaces an element by its children, keeping their order. */
void UnwrapElement(tinyxml2::XMLElement* element);

/** @brief Number of attributes on an element. */
size_t AttributeCount(const tinyxml2::XMLElement* element);

} // namespace iconforge::domain::svg
