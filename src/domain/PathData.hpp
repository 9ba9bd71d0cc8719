/**
 * @file PathData.hpp
 * @brief Parser and writer for SVG path data (`d` attribute).
 */

#pragma once
#include <string>
#include <vector>

namespace iconforge::domain {

/**
 * @struct PathSegment
 * @brief One path command with its arguments. Lowercase commands are relative.
 */
struct PathSegment {
    char command = 'M';
    std::vector<double> args;
};

/**
 * @class PathData
 * @brief Stateless helpers to read, normalize and write path data.
 *
 * Parsing expands implicit command repetition, so every segment carries its own command
 * (a repeated moveto becomes lineto). Writing is controlled by WriteOptions: the compact
 * form omits repeated letters and squeezes arc flags, the explicit form writes a letter
 * per segment and space-separated flags, which older renderers handle reliably.
 */
class PathData {
public:
    struct WriteOptions {
        int precision = 3;            ///< Decimal places; negative keeps full precision.
        bool explicitCommands = false; ///< Write a command letter for every segment.
        bool compactArcFlags = true;   ///< Write arc flags without separators.
    };

    /**
     * @brief Parses path data.
     * @throws PathSyntaxError on malformed input.
     */
    static std::vector<PathSegment> Parse(const std::string& d);

    /** @brief Converts every segment to its absolute, uppercase form. `Z` stays `Z`. */
    static std::vector<PathSegment> ToAbsolute(const std::vector<PathSegment>& segments);

    /**
     * @brief Rounds absolute segments and picks the shorter of absolute/relative per segment.
     * Straight lines parallel to an axis become `H`/`V`.
     */
    static std::vector<PathSegment> Optimize(const std::vector<PathSegment>& absolute, int precision);

    static std::string Write(const std::vector<PathSegment>& segments, const WriteOptions& options);

    /** @brief Number of arguments one instance of the command consumes, or -1 if unknown. */
    static int ArgumentCount(char command);

    /** @brief Shortest decimal text for a value, e.g. `0.5` -> `.5`, `-0` -> `0`. */
    static std::string FormatNumber(double value, int precision);

    static double Round(double value, int precision);
};

} // namespace iconforge::domain
