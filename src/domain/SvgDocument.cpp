/**
 * @file SvgDocument.cpp
 * @brief Implementation of SvgDocument.
 */

#include "domain/SvgDocument.hpp"
#include "domain/IconErrors.hpp"
#include "domain/PathData.hpp"
#include <cmath>
#include <cstdlib>
#include <optional>
#include <vector>
#include <tinyxml2.h>

namespace iconforge::domain {

namespace {

bool ParseDouble(const std::string& text, double& value) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0' && std::isfinite(value);
}

/** @brief Root width/height in user units; only unitless and `px` values are resolvable. */
std::optional<double> ParseLength(const char* raw) {
    if (!raw) return std::nullopt;
    std::string text = raw;
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.pop_back();
    if (text.size() > 2 && text.compare(text.size() - 2, 2, "px") == 0) {
        text.resize(text.size() - 2);
    }
    double value = 0.0;
    if (!ParseDouble(text, value) || value <= 0.0) return std::nullopt;
    return value;
}

} // namespace

ViewBox ViewBox::Parse(const std::string& value) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : value) {
        if (c == ' ' || c == ',' || c == '\t' || c == '\n' || c == '\r') {
            if (!current.empty()) tokens.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) tokens.push_back(current);

    if (tokens.size() != 4) {
        throw InvalidIconError("Invalid viewBox \"" + value + "\"");
    }

    double numbers[4];
    for (size_t i = 0; i < 4; ++i) {
        if (!ParseDouble(tokens[i], numbers[i])) {
            throw InvalidIconError("Invalid viewBox \"" + value + "\"");
        }
    }
    if (numbers[2] <= 0.0 || numbers[3] <= 0.0) {
        throw InvalidIconError("Invalid viewBox \"" + value + "\": size must be positive");
    }
    return ViewBox{numbers[0], numbers[1], numbers[2], numbers[3]};
}

std::string ViewBox::toString() const {
    return PathData::FormatNumber(left, -1) + " " + PathData::FormatNumber(top, -1) + " " +
           PathData::FormatNumber(width, -1) + " " + PathData::FormatNumber(height, -1);
}

SvgDocument::SvgDocument() : m_doc(std::make_unique<tinyxml2::XMLDocument>()) {}

SvgDocument::SvgDocument(SvgDocument&&) noexcept = default;
SvgDocument& SvgDocument::operator=(SvgDocument&&) noexcept = default;
SvgDocument::~SvgDocument() = default;

SvgDocument SvgDocument::Parse(const std::string& xml) {
    SvgDocument document;
    const tinyxml2::XMLError err = document.m_doc->Parse(xml.c_str(), xml.size());
    if (err != tinyxml2::XML_SUCCESS) {
        const char* detail = document.m_doc->ErrorStr();
        throw InvalidIconError(std::string("Malformed SVG: ") + (detail ? detail : "parse error"));
    }

    tinyxml2::XMLElement* root = document.m_doc->RootElement();
    if (!root) {
        throw InvalidIconError("Malformed SVG: document has no root element");
    }
    if (std::string(root->Name()) != "svg") {
        throw InvalidIconError(std::string("Root element is <") + root->Name() + ">, expected <svg>");
    }

    if (const char* viewBox = root->Attribute("viewBox")) {
        document.m_viewBox = ViewBox::Parse(viewBox);
    } else {
        auto width = ParseLength(root->Attribute("width"));
        auto height = ParseLength(root->Attribute("height"));
        if (!width || !height) {
            throw InvalidIconError("Missing viewBox and no usable width/height on <svg>");
        }
        document.setViewBox(ViewBox{0.0, 0.0, *width, *height});
    }
    return document;
}

SvgDocument SvgDocument::FromBody(const std::string& body, const ViewBox& viewBox) {
    const std::string xml = "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"" +
                            viewBox.toString() + "\">" + body + "</svg>";
    return Parse(xml);
}

tinyxml2::XMLElement* SvgDocument::root() {
    return m_doc->RootElement();
}

const tinyxml2::XMLElement* SvgDocument::root() const {
    return m_doc->RootElement();
}

void SvgDocument::setViewBox(const ViewBox& viewBox) {
    m_viewBox = viewBox;
    if (auto* element = root()) {
        element->SetAttribute("viewBox", viewBox.toString().c_str());
    }
}

std::string SvgDocument::body() const {
    const tinyxml2::XMLElement* element = root();
    if (!element) return {};

    tinyxml2::XMLPrinter printer(nullptr, true);
    for (const tinyxml2::XMLNode* child = element->FirstChild(); child; child = child->NextSibling()) {
        child->Accept(&printer);
    }
    return printer.CStr();
}

std::string SvgDocument::toString() const {
    tinyxml2::XMLPrinter printer(nullptr, true);
    m_doc->Print(&printer);
    return printer.CStr();
}

} // namespace iconforge::domain
