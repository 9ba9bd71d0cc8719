/**
 * @file SvgDocument.hpp
 * @brief In-memory, mutable tree of one icon, backed by tinyxml2.
 */

#pragma once
#include <memory>
#include <string>

namespace tinyxml2 {
class XMLDocument;
class XMLElement;
}

namespace iconforge::domain {

/**
 * @struct ViewBox
 * @brief Icon coordinate system; width and height are always positive.
 */
struct ViewBox {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;

    /**
     * @brief Parses `min-x min-y width height` (spaces and/or commas).
     * @throws InvalidIconError when the value is not four numbers or the size is not positive.
     */
    static ViewBox Parse(const std::string& value);

    std::string toString() const;
};

/**
 * @class SvgDocument
 * @brief Owns the XML tree of one icon and the view box resolved from its root.
 *
 * Pipeline stages mutate the tree in place through root(); the document is movable
 * but not copyable.
 */
class SvgDocument {
public:
    /**
     * @brief Parses a complete SVG file.
     * @throws InvalidIconError for malformed XML, a non-svg root or an unresolvable view box.
     */
    static SvgDocument Parse(const std::string& xml);

    /**
     * @brief Builds a document from exported inner markup and its view box.
     * @throws InvalidIconError when the body is not well-formed markup.
     */
    static SvgDocument FromBody(const std::string& body, const ViewBox& viewBox);

    SvgDocument(SvgDocument&&) noexcept;
    SvgDocument& operator=(SvgDocument&&) noexcept;
    SvgDocument(const SvgDocument&) = delete;
    SvgDocument& operator=(const SvgDocument&) = delete;
    ~SvgDocument();

    tinyxml2::XMLElement* root();
    const tinyxml2::XMLElement* root() const;
    tinyxml2::XMLDocument& xml() { return *m_doc; }

    const ViewBox& viewBox() const { return m_viewBox; }
    void setViewBox(const ViewBox& viewBox);

    /** @brief Serializes the children of the root element, compact, without the root tag. */
    std::string body() const;

    /** @brief Serializes the whole document as a standalone SVG file. */
    std::string toString() const;

private:
    SvgDocument();

    std::unique_ptr<tinyxml2::XMLDocument> m_doc;
    ViewBox m_viewBox;
};

} // namespace iconforge::domain
