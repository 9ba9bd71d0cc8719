/**
 * @file ColorCanonicalizer.hpp
 * @brief Pipeline stage that makes monotone icons theme-able.
 */

#pragma once
#include <functional>
#include "domain/Color.hpp"
#include "domain/ColorPolicy.hpp"
#include "domain/SvgDocument.hpp"

namespace iconforge::application {

/**
 * @class ColorCanonicalizer
 * @brief Walks the tree and applies a color policy to every paint attribute.
 *
 * The policy decides, the walker applies: Inherit rewrites the value to `currentColor`,
 * Remove deletes the element that paints with the color. Colors inside clipPath and mask
 * are validated but never rewritten.
 */
class ColorCanonicalizer {
public:
    using Policy = std::function<domain::ColorAction(const domain::Color&)>;

    explicit ColorCanonicalizer(Policy policy = domain::ClassifyColor);

    /**
     * @brief Rewrites the document in place.
     * @throws domain::InvalidIconError for an unparseable color value, or when removing
     * shapes leaves nothing visible.
     */
    void canonicalize(domain::SvgDocument& document) const;

private:
    Policy m_policy;
};

} // namespace iconforge::application
