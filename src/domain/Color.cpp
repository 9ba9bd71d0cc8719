/**
 * @file Color.cpp
 * @brief Implementation of Color parsing.
 */

#include "domain/Color.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>
#include <vector>

namespace iconforge::domain {

namespace {

const std::unordered_map<std::string, std::uint32_t>& NamedColors() {
    static const std::unordered_map<std::string, std::uint32_t> colors = {
        {"aliceblue", 0xF0F8FF}, {"antiquewhite", 0xFAEBD7}, {"aqua", 0x00FFFF},
        {"aquamarine", 0x7FFFD4}, {"azure", 0xF0FFFF}, {"beige", 0xF5F5DC},
        {"bisque", 0xFFE4C4}, {"black", 0x000000}, {"blanchedalmond", 0xFFEBCD},
        {"blue", 0x0000FF}, {"blueviolet", 0x8A2BE2}, {"brown", 0xA52A2A},
        {"burlywood", 0xDEB887}, {"cadetblue", 0x5F9EA0}, {"chartreuse", 0x7FFF00},
        {"chocolate", 0xD2691E}, {"coral", 0xFF7F50}, {"cornflowerblue", 0x6495ED},
        {"cornsilk", 0xFFF8DC}, {"crimson", 0xDC143C}, {"cyan", 0x00FFFF},
        {"darkblue", 0x00008B}, {"darkcyan", 0x008B8B}, {"darkgoldenrod", 0xB8860B},
        {"darkgray", 0xA9A9A9}, {"darkgreen", 0x006400}, {"darkgrey", 0xA9A9A9},
        {"darkkhaki", 0xBDB76B}, {"darkmagenta", 0x8B008B}, {"darkolivegreen", 0x556B2F},
        {"darkorange", 0xFF8C00}, {"darkorchid", 0x9932CC}, {"darkred", 0x8B0000},
        {"darksalmon", 0xE9967A}, {"darkseagreen", 0x8FBC8F}, {"darkslateblue", 0x483D8B},
        {"darkslategray", 0x2F4F4F}, {"darkslategrey", 0x2F4F4F}, {"darkturquoise", 0x00CED1},
        {"darkviolet", 0x9400D3}, {"deeppink", 0xFF1493}, {"deepskyblue", 0x00BFFF},
        {"dimgray", 0x696969}, {"dimgrey", 0x696969}, {"dodgerblue", 0x1E90FF},
        {"firebrick", 0xB22222}, {"floralwhite", 0xFFFAF0}, {"forestgreen", 0x228B22},
        {"fuchsia", 0xFF00FF}, {"gainsboro", 0xDCDCDC}, {"ghostwhite", 0xF8F8FF},
        {"gold", 0xFFD700}, {"goldenrod", 0xDAA520}, {"gray", 0x808080},
        {"green", 0x008000}, {"greenyellow", 0xADFF2F}, {"grey", 0x808080},
        {"honeydew", 0xF0FFF0}, {"hotpink", 0xFF69B4}, {"indianred", 0xCD5C5C},
        {"indigo", 0x4B0082}, {"ivory", 0xFFFFF0}, {"khaki", 0xF0E68C},
        {"lavender", 0xE6E6FA}, {"lavenderblush", 0xFFF0F5}, {"lawngreen", 0x7CFC00},
        {"lemonchiffon", 0xFFFACD}, {"lightblue", 0xADD8E6}, {"lightcoral", 0xF08080},
        {"lightcyan", 0xE0FFFF}, {"lightgoldenrodyellow", 0xFAFAD2}, {"lightgray", 0xD3D3D3},
        {"lightgreen", 0x90EE90}, {"lightgrey", 0xD3D3D3}, {"lightpink", 0xFFB6C1},
        {"lightsalmon", 0xFFA07A}, {"lightseagreen", 0x20B2AA}, {"lightskyblue", 0x87CEFA},
        {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xB0C4DE},
        {"lightyellow", 0xFFFFE0}, {"lime", 0x00FF00}, {"limegreen", 0x32CD32},
        {"linen", 0xFAF0E6}, {"magenta", 0xFF00FF}, {"maroon", 0x800000},
        {"mediumaquamarine", 0x66CDAA}, {"mediumblue", 0x0000CD}, {"mediumorchid", 0xBA55D3},
        {"mediumpurple", 0x9370DB}, {"mediumseagreen", 0x3CB371}, {"mediumslateblue", 0x7B68EE},
        {"mediumspringgreen", 0x00FA9A}, {"mediumturquoise", 0x48D1CC}, {"mediumvioletred", 0xC71585},
        {"midnightblue", 0x191970}, {"mintcream", 0xF5FFFA}, {"mistyrose", 0xFFE4E1},
        {"moccasin", 0xFFE4B5}, {"navajowhite", 0xFFDEAD}, {"navy", 0x000080},
        {"oldlace", 0xFDF5E6}, {"olive", 0x808000}, {"olivedrab", 0x6B8E23},
        {"orange", 0xFFA500}, {"orangered", 0xFF4500}, {"orchid", 0xDA70D6},
        {"palegoldenrod", 0xEEE8AA}, {"palegreen", 0x98FB98}, {"paleturquoise", 0xAFEEEE},
        {"palevioletred", 0xDB7093}, {"papayawhip", 0xFFEFD5}, {"peachpuff", 0xFFDAB9},
        {"peru", 0xCD853F}, {"pink", 0xFFC0CB}, {"plum", 0xDDA0DD},
        {"powderblue", 0xB0E0E6}, {"purple", 0x800080}, {"rebeccapurple", 0x663399},
        {"red", 0xFF0000}, {"rosybrown", 0xBC8F8F}, {"royalblue", 0x4169E1},
        {"saddlebrown", 0x8B4513}, {"salmon", 0xFA8072}, {"sandybrown", 0xF4A460},
        {"seagreen", 0x2E8B57}, {"seashell", 0xFFF5EE}, {"sienna", 0xA0522D},
        {"silver", 0xC0C0C0}, {"skyblue", 0x87CEEB}, {"slateblue", 0x6A5ACD},
        {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xFFFAFA},
        {"springgreen", 0x00FF7F}, {"steelblue", 0x4682B4}, {"tan", 0xD2B48C},
        {"teal", 0x008080}, {"thistle", 0xD8BFD8}, {"tomato", 0xFF6347},
        {"turquoise", 0x40E0D0}, {"violet", 0xEE82EE}, {"wheat", 0xF5DEB3},
        {"white", 0xFFFFFF}, {"whitesmoke", 0xF5F5F5}, {"yellow", 0xFFFF00},
        {"yellowgreen", 0x9ACD32}
    };
    return colors;
}

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string ToLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Color> ParseHex(const std::string& digits) {
    const size_t len = digits.size();
    if (len != 3 && len != 4 && len != 6 && len != 8) return std::nullopt;

    std::vector<int> values;
    for (char c : digits) {
        int v = HexValue(c);
        if (v < 0) return std::nullopt;
        values.push_back(v);
    }

    if (len <= 4) {
        double alpha = len == 4 ? (values[3] * 17) / 255.0 : 1.0;
        return Color::FromRgba(values[0] * 17, values[1] * 17, values[2] * 17, alpha);
    }
    double alpha = len == 8 ? (values[6] * 16 + values[7]) / 255.0 : 1.0;
    return Color::FromRgba(values[0] * 16 + values[1],
                           values[2] * 16 + values[3],
                           values[4] * 16 + values[5],
                           alpha);
}

/**
 * @brief Splits the argument list of a color function.
 * Accepts both `a, b, c[, d]` and `a b c[ / d]`; mixing the two forms is rejected.
 */
bool SplitArguments(const std::string& args, std::vector<std::string>& out, bool& slashAlpha) {
    out.clear();
    slashAlpha = false;
    const bool commaSyntax = args.find(',') != std::string::npos;
    std::string current;
    auto flush = [&]() {
        std::string token = Trim(current);
        current.clear();
        if (token.empty()) return false;
        out.push_back(token);
        return true;
    };

    for (char c : args) {
        if (commaSyntax && c == ',') {
            if (!flush()) return false;
        } else if (!commaSyntax && (c == ' ' || c == '\t' || c == '\n' || c == '\r')) {
            if (!Trim(current).empty()) flush();
            current.clear();
        } else if (!commaSyntax && c == '/') {
            if (!Trim(current).empty()) flush();
            current.clear();
            if (slashAlpha) return false;
            slashAlpha = true;
            if (out.size() != 3) return false;
        } else {
            current.push_back(c);
        }
    }
    if (!Trim(current).empty()) {
        flush();
    } else if (commaSyntax) {
        return false;
    }
    if (slashAlpha && out.size() != 4) return false;
    return out.size() == 3 || out.size() == 4;
}

/** @brief Parses a CSS number with an optional `%` suffix. */
bool ParseNumber(const std::string& token, double& value, bool& percent) {
    std::string text = token;
    percent = false;
    if (!text.empty() && text.back() == '%') {
        percent = true;
        text.pop_back();
    }
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0' && std::isfinite(value);
}

double Clamp(double v, double lo, double hi) {
    return std::min(hi, std::max(lo, v));
}

bool ParseAlpha(const std::string& token, double& alpha) {
    double value = 0.0;
    bool percent = false;
    if (!ParseNumber(token, value, percent)) return false;
    alpha = Clamp(percent ? value / 100.0 : value, 0.0, 1.0);
    return true;
}

std::optional<Color> ParseRgbFunction(const std::string& args) {
    std::vector<std::string> parts;
    bool slash = false;
    if (!SplitArguments(args, parts, slash)) return std::nullopt;

    double channels[3];
    for (int i = 0; i < 3; ++i) {
        double value = 0.0;
        bool percent = false;
        if (!ParseNumber(parts[i], value, percent)) return std::nullopt;
        channels[i] = Clamp(percent ? value * 255.0 / 100.0 : value, 0.0, 255.0);
    }

    double alpha = 1.0;
    if (parts.size() == 4 && !ParseAlpha(parts[3], alpha)) return std::nullopt;
    return Color::FromRgba(channels[0], channels[1], channels[2], alpha);
}

double HueToRgb(double p, double q, double t) {
    if (t < 0) t += 1;
    if (t > 1) t -= 1;
    if (t < 1.0 / 6.0) return p + (q - p) * 6 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6;
    return p;
}

std::optional<Color> ParseHslFunction(const std::string& args) {
    std::vector<std::string> parts;
    bool slash = false;
    if (!SplitArguments(args, parts, slash)) return std::nullopt;

    std::string hueToken = ToLower(parts[0]);
    if (hueToken.size() > 3 && hueToken.compare(hueToken.size() - 3, 3, "deg") == 0) {
        hueToken.resize(hueToken.size() - 3);
    }
    double hue = 0.0;
    bool huePercent = false;
    if (!ParseNumber(hueToken, hue, huePercent) || huePercent) return std::nullopt;

    double saturation = 0.0;
    double lightness = 0.0;
    bool percent = false;
    if (!ParseNumber(parts[1], saturation, percent) || !percent) return std::nullopt;
    if (!ParseNumber(parts[2], lightness, percent) || !percent) return std::nullopt;

    double alpha = 1.0;
    if (parts.size() == 4 && !ParseAlpha(parts[3], alpha)) return std::nullopt;

    const double h = std::fmod(std::fmod(hue, 360.0) + 360.0, 360.0) / 360.0;
    const double s = Clamp(saturation, 0.0, 100.0) / 100.0;
    const double l = Clamp(lightness, 0.0, 100.0) / 100.0;

    if (s == 0.0) {
        const double v = l * 255.0;
        return Color::FromRgba(v, v, v, alpha);
    }

    const double q = l < 0.5 ? l * (1 + s) : l + s - l * s;
    const double p = 2 * l - q;
    return Color::FromRgba(HueToRgb(p, q, h + 1.0 / 3.0) * 255.0,
                           HueToRgb(p, q, h) * 255.0,
                           HueToRgb(p, q, h - 1.0 / 3.0) * 255.0,
                           alpha);
}

} // namespace

Color Color::FromRgba(double red, double green, double blue, double alpha) {
    Color color(Kind::Rgba);
    color.m_red = red;
    color.m_green = green;
    color.m_blue = blue;
    color.m_alpha = alpha;
    return color;
}

std::optional<Color> Color::Parse(const std::string& value) {
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) return std::nullopt;

    const std::string lower = ToLower(trimmed);
    if (lower == "none") return Color(Kind::None);
    if (lower == "transparent") return Color(Kind::Transparent);
    if (lower == "currentcolor") return Color(Kind::CurrentColor);
    if (lower == "inherit") return Color(Kind::Inherit);

    if (lower.compare(0, 4, "url(") == 0) {
        if (lower.find(')') == std::string::npos) return std::nullopt;
        return Color(Kind::PaintReference);
    }

    if (lower[0] == '#') {
        return ParseHex(lower.substr(1));
    }

    const auto open = lower.find('(');
    if (open != std::string::npos) {
        if (lower.back() != ')') return std::nullopt;
        const std::string func = Trim(lower.substr(0, open));
        const std::string args = lower.substr(open + 1, lower.size() - open - 2);
        if (func == "rgb" || func == "rgba") return ParseRgbFunction(args);
        if (func == "hsl" || func == "hsla") return ParseHslFunction(args);
        return std::nullopt;
    }

    const auto& named = NamedColors();
    auto it = named.find(lower);
    if (it == named.end()) return std::nullopt;
    return FromRgba((it->second >> 16) & 0xFF, (it->second >> 8) & 0xFF, it->second & 0xFF);
}

bool Color::operator==(const Color& other) const {
    if (m_kind != other.m_kind) return false;
    if (m_kind != Kind::Rgba) return true;
    return m_red == other.m_red && m_green == other.m_green &&
           m_blue == other.m_blue && m_alpha == other.m_alpha;
}

} // namespace iconforge::domain
