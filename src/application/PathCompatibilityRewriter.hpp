/**
 * @file PathCompatibilityRewriter.hpp
 * @brief Re-expands compact path data for renderers with weak path parsers.
 */

#pragma once
#include "domain/SvgDocument.hpp"

namespace iconforge::application {

/**
 * @class PathCompatibilityRewriter
 * @brief Rewrites every `d` attribute with one command letter per segment and
 * separated arc flags. Coordinates keep the optimizer's precision.
 */
class PathCompatibilityRewriter {
public:
    explicit PathCompatibilityRewriter(int precision = 3) : m_precision(precision) {}

    /** @throws domain::PathSyntaxError when a path cannot be parsed. */
    void rewrite(domain::SvgDocument& document) const;

private:
    int m_precision;
};

} // namespace iconforge::application
