/**
 * @file Color.hpp
 * @brief Value type for SVG paint values (named, hex, rgb(), hsl() and keywords).
 */

#pragma once
#include <optional>
#include <string>

namespace iconforge::domain {

/**
 * @class Color
 * @brief A parsed paint value. Every concrete color is reduced to RGBA doubles
 * (channels 0-255, alpha 0-1) so different notations of the same color compare equal.
 */
class Color {
public:
    enum class Kind {
        Rgba,
        None,           ///< `none`
        Transparent,    ///< `transparent`
        CurrentColor,   ///< `currentColor`
        Inherit,        ///< `inherit`
        PaintReference  ///< `url(#id)`, a gradient or pattern
    };

    /**
     * @brief Parses a raw attribute value.
     * @return The color, or nullopt when the syntax is not recognized.
     */
    static std::optional<Color> Parse(const std::string& value);

    static Color FromRgba(double red, double green, double blue, double alpha = 1.0);
    static Color Black() { return FromRgba(0, 0, 0); }
    static Color White() { return FromRgba(255, 255, 255); }

    Kind kind() const { return m_kind; }
    double red() const { return m_red; }
    double green() const { return m_green; }
    double blue() const { return m_blue; }
    double alpha() const { return m_alpha; }

    /** @brief True for values that mean absence of paint (`none`, `transparent`). */
    bool isEmpty() const { return m_kind == Kind::None || m_kind == Kind::Transparent; }

    /** @brief Exact structural equality; no perceptual tolerance. */
    bool operator==(const Color& other) const;
    bool operator!=(const Color& other) const { return !(*this == other); }

private:
    explicit Color(Kind kind) : m_kind(kind) {}

    Kind m_kind = Kind::Rgba;
    double m_red = 0.0;
    double m_green = 0.0;
    double m_blue = 0.0;
    double m_alpha = 1.0;
};

} // namespace iconforge::domain
