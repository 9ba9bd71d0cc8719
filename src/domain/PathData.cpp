/**
 * @file PathData.cpp
 * @brief Implementation of path data parsing and writing.
 */

#include "domain/PathData.hpp"
#include "domain/IconErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace iconforge::domain {

namespace {

// Beyond this magnitude a double no longer resolves the smallest written decimal.
constexpr double kMaxCoordinate = 1.0e9;

bool IsSeparator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == ',';
}

class PathLexer {
public:
    explicit PathLexer(const std::string& text) : m_text(text) {}

    void skipSeparators() {
        while (m_pos < m_text.size() && IsSeparator(m_text[m_pos])) ++m_pos;
    }

    bool atEnd() {
        skipSeparators();
        return m_pos >= m_text.size();
    }

    bool nextIsCommand() {
        skipSeparators();
        return m_pos < m_text.size() && PathData::ArgumentCount(m_text[m_pos]) >= 0;
    }

    bool nextIsNumber() {
        skipSeparators();
        if (m_pos >= m_text.size()) return false;
        const char c = m_text[m_pos];
        return std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.';
    }

    char readCommand() {
        skipSeparators();
        return m_text[m_pos++];
    }

    double readNumber() {
        skipSeparators();
        const size_t start = m_pos;
        if (m_pos < m_text.size() && (m_text[m_pos] == '-' || m_text[m_pos] == '+')) ++m_pos;

        bool digits = false;
        while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
            ++m_pos;
            digits = true;
        }
        if (m_pos < m_text.size() && m_text[m_pos] == '.') {
            ++m_pos;
            while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
                ++m_pos;
                digits = true;
            }
        }
        if (!digits) fail("expected a number");

        if (m_pos < m_text.size() && (m_text[m_pos] == 'e' || m_text[m_pos] == 'E')) {
            size_t exp = m_pos + 1;
            if (exp < m_text.size() && (m_text[exp] == '-' || m_text[exp] == '+')) ++exp;
            if (exp < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[exp]))) {
                m_pos = exp;
                while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) ++m_pos;
            }
        }

        const std::string token = m_text.substr(start, m_pos - start);
        const double value = std::strtod(token.c_str(), nullptr);
        if (!std::isfinite(value) || std::fabs(value) > kMaxCoordinate) {
            m_pos = start;
            fail("number out of range: " + token);
        }
        return value;
    }

    double readFlag() {
        skipSeparators();
        if (m_pos < m_text.size() && (m_text[m_pos] == '0' || m_text[m_pos] == '1')) {
            return m_text[m_pos++] == '1' ? 1.0 : 0.0;
        }
        fail("expected an arc flag");
        return 0.0;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw PathSyntaxError("Invalid path data at offset " + std::to_string(m_pos) + ": " + what);
    }

private:
    const std::string& m_text;
    size_t m_pos = 0;
};

bool IsRelative(char command) {
    return std::islower(static_cast<unsigned char>(command)) != 0;
}

char ToUpper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

char ToLower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool ContainsDotOrExponent(const std::string& token) {
    return token.find('.') != std::string::npos || token.find('e') != std::string::npos;
}

/** @brief Approximate written length of an argument list, used to pick absolute vs relative. */
size_t WrittenLength(const std::vector<double>& args, int precision, bool arc) {
    size_t length = 0;
    std::string previous;
    for (size_t i = 0; i < args.size(); ++i) {
        if (arc && (i == 3 || i == 4)) {
            length += 1;
            previous = "0";
            continue;
        }
        std::string token = PathData::FormatNumber(args[i], precision);
        if (!previous.empty() && token[0] != '-' && !(token[0] == '.' && ContainsDotOrExponent(previous))) {
            length += 1;
        }
        length += token.size();
        previous = token;
    }
    return length;
}

} // namespace

int PathData::ArgumentCount(char command) {
    switch (ToUpper(command)) {
        case 'M': case 'L': case 'T': return 2;
        case 'H': case 'V': return 1;
        case 'C': return 6;
        case 'S': case 'Q': return 4;
        case 'A': return 7;
        case 'Z': return 0;
        default: return -1;
    }
}

double PathData::Round(double value, int precision) {
    if (precision < 0) return value;
    const double factor = std::pow(10.0, precision);
    double rounded = std::round(value * factor) / factor;
    if (rounded == 0.0) rounded = 0.0; // drop negative zero
    return rounded;
}

std::string PathData::FormatNumber(double value, int precision) {
    const double printed = precision >= 0 ? Round(value, precision) : value;
    const char* format = precision >= 0 ? "%.*f" : "%.*g";
    const int digits = precision >= 0 ? precision : 12;

    const int length = std::snprintf(nullptr, 0, format, digits, printed);
    std::string text(static_cast<size_t>(std::max(length, 0)) + 1, '\0');
    std::snprintf(&text[0], text.size(), format, digits, printed);
    text.resize(static_cast<size_t>(std::max(length, 0)));

    if (text.find('.') != std::string::npos && text.find('e') == std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    if (text == "-0" || text.empty()) return "0";
    if (text.compare(0, 2, "0.") == 0) return text.substr(1);
    if (text.compare(0, 3, "-0.") == 0) return "-" + text.substr(2);
    return text;
}

std::vector<PathSegment> PathData::Parse(const std::string& d) {
    std::vector<PathSegment> segments;
    PathLexer lexer(d);
    if (lexer.atEnd()) return segments;

    if (!lexer.nextIsCommand()) lexer.fail("path must start with a command");

    while (!lexer.atEnd()) {
        if (!lexer.nextIsCommand()) lexer.fail("expected a command");
        char command = lexer.readCommand();
        if (segments.empty() && ToUpper(command) != 'M') lexer.fail("path must start with a moveto");

        const int count = ArgumentCount(command);
        if (count == 0) {
            segments.push_back(PathSegment{command, {}});
            continue;
        }

        bool first = true;
        while (first || lexer.nextIsNumber()) {
            PathSegment segment;
            segment.command = command;
            segment.args.reserve(count);
            for (int i = 0; i < count; ++i) {
                const bool flag = ToUpper(command) == 'A' && (i == 3 || i == 4);
                segment.args.push_back(flag ? lexer.readFlag() : lexer.readNumber());
            }
            segments.push_back(segment);
            first = false;

            // Coordinates following a moveto are implicit linetos.
            if (command == 'M') command = 'L';
            else if (command == 'm') command = 'l';
        }
    }
    return segments;
}

std::vector<PathSegment> PathData::ToAbsolute(const std::vector<PathSegment>& segments) {
    std::vector<PathSegment> result;
    result.reserve(segments.size());
    double x = 0, y = 0, startX = 0, startY = 0;

    for (const auto& seg : segments) {
        const bool rel = IsRelative(seg.command);
        PathSegment out;
        out.command = ToUpper(seg.command);
        out.args = seg.args;

        switch (out.command) {
            case 'M':
                if (rel) { out.args[0] += x; out.args[1] += y; }
                x = startX = out.args[0];
                y = startY = out.args[1];
                break;
            case 'L': case 'T':
                if (rel) { out.args[0] += x; out.args[1] += y; }
                x = out.args[0];
                y = out.args[1];
                break;
            case 'H':
                if (rel) out.args[0] += x;
                x = out.args[0];
                break;
            case 'V':
                if (rel) out.args[0] += y;
                y = out.args[0];
                break;
            case 'C': case 'S': case 'Q':
                if (rel) {
                    for (size_t i = 0; i + 1 < out.args.size(); i += 2) {
                        out.args[i] += x;
                        out.args[i + 1] += y;
                    }
                }
                x = out.args[out.args.size() - 2];
                y = out.args[out.args.size() - 1];
                break;
            case 'A':
                if (rel) { out.args[5] += x; out.args[6] += y; }
                x = out.args[5];
                y = out.args[6];
                break;
            case 'Z':
                x = startX;
                y = startY;
                break;
            default:
                break;
        }
        result.push_back(out);
    }
    return result;
}

std::vector<PathSegment> PathData::Optimize(const std::vector<PathSegment>& absolute, int precision) {
    std::vector<PathSegment> result;
    result.reserve(absolute.size());
    double x = 0, y = 0, startX = 0, startY = 0;

    for (const auto& source : absolute) {
        PathSegment abs = source;
        abs.command = ToUpper(abs.command);
        for (size_t i = 0; i < abs.args.size(); ++i) {
            const bool flag = abs.command == 'A' && (i == 3 || i == 4);
            if (!flag) abs.args[i] = Round(abs.args[i], precision);
        }

        if (abs.command == 'Z') {
            result.push_back(PathSegment{'z', {}});
            x = startX;
            y = startY;
            continue;
        }

        if (abs.command == 'L') {
            if (abs.args[1] == y) {
                abs.command = 'H';
                abs.args = {abs.args[0]};
            } else if (abs.args[0] == x) {
                abs.command = 'V';
                abs.args = {abs.args[1]};
            }
        }

        PathSegment rel;
        rel.command = ToLower(abs.command);
        rel.args = abs.args;
        switch (abs.command) {
            case 'H':
                rel.args[0] = Round(abs.args[0] - x, precision);
                break;
            case 'V':
                rel.args[0] = Round(abs.args[0] - y, precision);
                break;
            case 'A':
                rel.args[5] = Round(abs.args[5] - x, precision);
                rel.args[6] = Round(abs.args[6] - y, precision);
                break;
            default:
                for (size_t i = 0; i + 1 < rel.args.size(); i += 2) {
                    rel.args[i] = Round(abs.args[i] - x, precision);
                    rel.args[i + 1] = Round(abs.args[i + 1] - y, precision);
                }
                break;
        }

        const bool arc = abs.command == 'A';
        const bool useRelative = !result.empty() &&
            WrittenLength(rel.args, precision, arc) <= WrittenLength(abs.args, precision, arc);
        result.push_back(useRelative ? rel : abs);

        switch (abs.command) {
            case 'M':
                x = startX = abs.args[0];
                y = startY = abs.args[1];
                break;
            case 'H':
                x = abs.args[0];
                break;
            case 'V':
                y = abs.args[0];
                break;
            default:
                x = abs.args[abs.args.size() - 2];
                y = abs.args[abs.args.size() - 1];
                break;
        }
    }
    return result;
}

std::string PathData::Write(const std::vector<PathSegment>& segments, const WriteOptions& options) {
    std::string out;
    char previousCommand = 0;
    std::string previousToken;

    for (const auto& seg : segments) {
        bool writeLetter = true;
        if (!options.explicitCommands && previousCommand != 0) {
            const char c = seg.command;
            if (c == previousCommand && ToUpper(c) != 'M' && ToUpper(c) != 'Z') writeLetter = false;
            if ((previousCommand == 'M' && c == 'L') || (previousCommand == 'm' && c == 'l')) writeLetter = false;
        }
        if (writeLetter) {
            out.push_back(seg.command);
            previousToken.clear();
        }
        previousCommand = seg.command;

        const bool arc = ToUpper(seg.command) == 'A';
        for (size_t i = 0; i < seg.args.size(); ++i) {
            const bool flag = arc && (i == 3 || i == 4);
            std::string token = flag ? (seg.args[i] != 0.0 ? "1" : "0")
                                     : FormatNumber(seg.args[i], options.precision);

            bool separator = !previousToken.empty();
            if (separator && token[0] == '-') separator = false;
            if (separator && token[0] == '.' && ContainsDotOrExponent(previousToken)) separator = false;
            if (arc && options.compactArcFlags && (i == 4 || i == 5)) separator = false;

            if (separator) out.push_back(' ');
            out += token;
            previousToken = token;
        }
    }
    return out;
}

} // namespace iconforge::domain
