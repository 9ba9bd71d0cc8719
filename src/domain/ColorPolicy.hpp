/**
 * @file ColorPolicy.hpp
 * @brief Monotone-icon palette policy: what happens to each parsed color.
 */

#pragma once
#include "domain/Color.hpp"

namespace iconforge::domain {

/**
 * @enum ColorAction
 * @brief Outcome of classifying one paint value.
 */
enum class ColorAction {
    Keep,    ///< Leave the value exactly as written.
    Inherit, ///< Replace with `currentColor` so callers choose the color.
    Remove   ///< Drop the element that paints with this color.
};

/** @brief Replacement value for colors classified as Inherit. */
inline constexpr const char* kInheritColor = "currentColor";

/**
 * @brief Pure classification: exact black inherits, exact white is removed,
 * everything else (including none, transparent, keywords and paint references) is kept.
 */
ColorAction ClassifyColor(const Color& color);

} // namespace iconforge::domain
