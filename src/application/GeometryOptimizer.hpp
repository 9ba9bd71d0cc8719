/**
 * @file GeometryOptimizer.hpp
 * @brief Generic size optimization of an icon tree.
 */

#pragma once
#include "domain/SvgDocument.hpp"

namespace tinyxml2 {
class XMLElement;
}

namespace iconforge::application {

/**
 * @class GeometryOptimizer
 * @brief Minimizes markup without changing the rendering.
 *
 * Rounds numbers, drops default attribute values, merges equivalent stroke-only paths,
 * removes and collapses groups, writes compact path data, shortens referenced IDs and
 * sorts attributes into a stable order. Running it on its own output changes nothing.
 */
class GeometryOptimizer {
public:
    struct Options {
        int precision = 3; ///< Decimal places kept in coordinates.
    };

    GeometryOptimizer() = default;
    explicit GeometryOptimizer(const Options& options) : m_options(options) {}

    /**
     * @brief Optimizes the document in place.
     * @throws domain::PathSyntaxError when a path cannot be parsed.
     * @throws domain::InvalidIconError when only empty paths were drawn.
     */
    void optimize(domain::SvgDocument& document) const;

private:
    void roundNumericAttributes(tinyxml2::XMLElement* root) const;
    void removeDefaultAttributes(tinyxml2::XMLElement* root) const;
    void removeEmptyContainers(tinyxml2::XMLElement* element) const;
    void mergePaths(tinyxml2::XMLElement* element) const;
    void collapseGroups(tinyxml2::XMLElement* element) const;
    void optimizePathData(tinyxml2::XMLElement* root) const;
    void cleanupIds(tinyxml2::XMLElement* root) const;
    void sortAttributes(tinyxml2::XMLElement* root) const;

    Options m_options;
};

} // namespace iconforge::application
