/**
 * @file SvgCleaner.cpp
 * @brief Implementation of SvgCleaner.
 */

#include "application/SvgCleaner.hpp"
#include "domain/IconErrors.hpp"
#include "domain/SvgSchema.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>
#include <tinyxml2.h>

namespace iconforge::application {

namespace svg = domain::svg;

namespace {

const char* const kEditorPrefixes[] = {"inkscape:", "sodipodi:", "sketch:", "serif:"};

const char* const kDroppedElements[] = {"metadata", "title", "desc", "script"};

// Attributes that only mean something on the outermost viewport; the body never carries them.
const char* const kRootOnlyAttributes[] = {
    "width", "height", "x", "y", "version", "baseProfile", "preserveAspectRatio",
    "overflow", "clip", "enable-background", "style"
};

bool StartsWith(const std::string& text, const char* prefix) {
    return text.compare(0, std::string(prefix).length(), prefix) == 0;
}

bool HasEditorPrefix(const std::string& name) {
    for (const char* prefix : kEditorPrefixes) {
        if (StartsWith(name, prefix)) return true;
    }
    return false;
}

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool KeepsText(const std::string& elementName) {
    return elementName == "text" || elementName == "tspan" || elementName == "textPath" ||
           elementName == "style";
}

bool IsDroppedAttribute(const std::string& name) {
    if (HasEditorPrefix(name)) return true;
    if (StartsWith(name, "on")) return true; // event handlers
    if (name == "xml:space") return true;
    if (StartsWith(name, "xmlns:") && name != "xmlns:xlink") return true;
    return false;
}

/**
 * @brief One simple selector of a stylesheet rule: optional type, classes and id.
 * Only compound selectors without combinators, pseudo-classes or attribute tests are accepted.
 */
struct SimpleSelector {
    std::string type;
    std::vector<std::string> classes;
    std::string id;

    int specificity() const {
        return (id.empty() ? 0 : 100) + static_cast<int>(classes.size()) * 10 + (type.empty() ? 0 : 1);
    }
};

struct StyleRule {
    SimpleSelector selector;
    std::string declarations;
};

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

std::string StripCssComments(const std::string& css) {
    std::string result;
    size_t pos = 0;
    while (pos < css.size()) {
        const auto open = css.find("/*", pos);
        if (open == std::string::npos) {
            result += css.substr(pos);
            break;
        }
        result += css.substr(pos, open - pos);
        const auto close = css.find("*/", open + 2);
        if (close == std::string::npos) break;
        pos = close + 2;
    }
    return result;
}

SimpleSelector ParseSelector(const std::string& text) {
    SimpleSelector selector;
    size_t pos = 0;
    if (pos < text.size() && text[pos] == '*') {
        ++pos;
    } else {
        while (pos < text.size() && IsNameChar(text[pos])) selector.type += text[pos++];
    }

    while (pos < text.size()) {
        const char marker = text[pos++];
        std::string name;
        while (pos < text.size() && IsNameChar(text[pos])) name += text[pos++];
        if (name.empty() || (marker != '.' && marker != '#') || (marker == '#' && !selector.id.empty())) {
            throw domain::InvalidIconError("Unsupported stylesheet selector \"" + text + "\"");
        }
        if (marker == '.') {
            selector.classes.push_back(name);
        } else {
            selector.id = name;
        }
    }
    if (text.empty()) {
        throw domain::InvalidIconError("Empty stylesheet selector");
    }
    return selector;
}

void ParseStyleSheet(const std::string& text, std::vector<StyleRule>& rules) {
    const std::string css = StripCssComments(text);
    size_t pos = 0;
    while (true) {
        const auto open = css.find('{', pos);
        if (open == std::string::npos) {
            if (!Trim(css.substr(pos)).empty()) {
                throw domain::InvalidIconError("Unsupported stylesheet content \"" + Trim(css.substr(pos)) + "\"");
            }
            return;
        }
        const auto close = css.find('}', open);
        if (close == std::string::npos) {
            throw domain::InvalidIconError("Unterminated stylesheet rule");
        }

        const std::string selectors = Trim(css.substr(pos, open - pos));
        const std::string declarations = css.substr(open + 1, close - open - 1);
        pos = close + 1;
        if (selectors.find('@') != std::string::npos) {
            throw domain::InvalidIconError("Unsupported stylesheet at-rule \"" + selectors + "\"");
        }

        size_t start = 0;
        while (start <= selectors.size()) {
            size_t end = selectors.find(',', start);
            if (end == std::string::npos) end = selectors.size();
            rules.push_back(StyleRule{ParseSelector(Trim(selectors.substr(start, end - start))), declarations});
            start = end + 1;
        }
    }
}

bool Matches(const SimpleSelector& selector, const tinyxml2::XMLElement* element) {
    if (!selector.type.empty() && selector.type != element->Name()) return false;
    if (!selector.id.empty()) {
        const char* id = element->Attribute("id");
        if (!id || selector.id != id) return false;
    }
    if (selector.classes.empty()) return true;

    const char* raw = element->Attribute("class");
    if (!raw) return false;
    std::vector<std::string> classes;
    std::string current;
    for (const char* c = raw; ; ++c) {
        if (*c == '\0' || std::isspace(static_cast<unsigned char>(*c))) {
            if (!current.empty()) classes.push_back(current);
            current.clear();
            if (*c == '\0') break;
        } else {
            current += *c;
        }
    }
    for (const auto& name : selector.classes) {
        if (std::find(classes.begin(), classes.end(), name) == classes.end()) return false;
    }
    return true;
}

} // namespace

void SvgCleaner::clean(domain::SvgDocument& document) const {
    tinyxml2::XMLDocument& xml = document.xml();
    tinyxml2::XMLElement* root = document.root();
    if (!root) {
        throw domain::InvalidIconError("Document has no root element");
    }

    // XML declaration, DOCTYPE and top-level comments.
    std::vector<tinyxml2::XMLNode*> topLevel;
    for (auto* node = xml.FirstChild(); node; node = node->NextSibling()) {
        if (node != root) topLevel.push_back(node);
    }
    for (auto* node : topLevel) {
        xml.DeleteChild(node);
    }

    removeNonElementNodes(root);

    for (auto* element : svg::Descendants(root)) {
        if (std::string(element->Name()) == "foreignObject") {
            throw domain::InvalidIconError("Unsupported element <foreignObject>");
        }
    }

    removeEditorContent(root);
    inlineStyleSheets(root);

    expandInlineStyle(root);
    for (auto* element : svg::Descendants(root)) {
        expandInlineStyle(element);
    }

    wrapRootPresentation(document);
    for (const char* name : kRootOnlyAttributes) {
        root->DeleteAttribute(name);
    }

    unwrapPlainGroups(root);

    if (!svg::HasVisibleGeometry(root)) {
        throw domain::InvalidIconError("Icon has no visible geometry");
    }
}

void SvgCleaner::removeNonElementNodes(tinyxml2::XMLNode* node) const {
    const tinyxml2::XMLElement* owner = node->ToElement();
    const bool keepText = owner && KeepsText(owner->Name());

    std::vector<tinyxml2::XMLNode*> doomed;
    for (auto* child = node->FirstChild(); child; child = child->NextSibling()) {
        if (child->ToElement()) {
            removeNonElementNodes(child);
        } else if (child->ToText()) {
            if (!keepText) doomed.push_back(child);
        } else {
            // comments, declarations, unknown nodes
            doomed.push_back(child);
        }
    }
    for (auto* child : doomed) {
        node->DeleteChild(child);
    }
}

void SvgCleaner::removeEditorContent(tinyxml2::XMLElement* element) const {
    std::vector<std::string> attributes;
    for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
        if (IsDroppedAttribute(attr->Name())) attributes.emplace_back(attr->Name());
    }
    for (const auto& name : attributes) {
        element->DeleteAttribute(name.c_str());
    }

    for (auto* child : svg::ChildElements(element)) {
        const std::string name = child->Name();
        const bool dropped = HasEditorPrefix(name) ||
            std::find(std::begin(kDroppedElements), std::end(kDroppedElements), name) != std::end(kDroppedElements);
        if (dropped) {
            element->DeleteChild(child);
        } else {
            removeEditorContent(child);
        }
    }
}

void SvgCleaner::inlineStyleSheets(tinyxml2::XMLElement* root) const {
    std::vector<tinyxml2::XMLElement*> sheets;
    for (auto* element : svg::Descendants(root)) {
        if (std::string(element->Name()) == "style") sheets.push_back(element);
    }
    if (sheets.empty()) return;

    std::vector<StyleRule> rules;
    for (auto* sheet : sheets) {
        std::string text;
        for (auto* node = sheet->FirstChild(); node; node = node->NextSibling()) {
            if (node->ToText()) text += node->Value();
        }
        const char* media = sheet->Attribute("media");
        if (media && Trim(media) != "all" && Trim(media) != "screen") {
            throw domain::InvalidIconError(std::string("Unsupported stylesheet media \"") + media + "\"");
        }
        ParseStyleSheet(text, rules);
        sheet->Parent()->DeleteChild(sheet);
    }

    // Lower specificity first, so later declarations win; inline style stays last.
    std::stable_sort(rules.begin(), rules.end(), [](const StyleRule& a, const StyleRule& b) {
        return a.selector.specificity() < b.selector.specificity();
    });

    std::vector<tinyxml2::XMLElement*> elements{root};
    const auto descendants = svg::Descendants(root);
    elements.insert(elements.end(), descendants.begin(), descendants.end());

    for (auto* element : elements) {
        std::string style;
        for (const auto& rule : rules) {
            if (!Matches(rule.selector, element)) continue;
            const std::string declarations = Trim(rule.declarations);
            if (declarations.empty()) continue;
            if (!style.empty()) style += ";";
            style += declarations;
        }
        if (const char* inlineStyle = element->Attribute("style")) {
            if (!style.empty()) style += ";";
            style += inlineStyle;
        }
        if (!style.empty()) element->SetAttribute("style", style.c_str());
        element->DeleteAttribute("class");
    }
}

void SvgCleaner::expandInlineStyle(tinyxml2::XMLElement* element) const {
    const char* raw = element->Attribute("style");
    if (!raw) return;
    const std::string style = raw;

    std::vector<std::pair<std::string, std::string>> expanded;
    std::string remaining;

    size_t start = 0;
    while (start <= style.size()) {
        size_t end = style.find(';', start);
        if (end == std::string::npos) end = style.size();
        const std::string declaration = style.substr(start, end - start);
        start = end + 1;

        const auto colon = declaration.find(':');
        if (colon == std::string::npos) continue;

        std::string name = Trim(declaration.substr(0, colon));
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        std::string value = Trim(declaration.substr(colon + 1));
        const auto important = value.find("!important");
        if (important != std::string::npos) value = Trim(value.substr(0, important));
        if (name.empty() || value.empty()) continue;

        if (svg::IsPresentationAttribute(name)) {
            expanded.emplace_back(name, value);
        } else {
            if (!remaining.empty()) remaining += ";";
            remaining += name + ":" + value;
        }
    }

    // A style declaration takes precedence over the attribute of the same name.
    for (const auto& [name, value] : expanded) {
        element->SetAttribute(name.c_str(), value.c_str());
    }
    if (remaining.empty()) {
        element->DeleteAttribute("style");
    } else {
        element->SetAttribute("style", remaining.c_str());
    }
}

void SvgCleaner::wrapRootPresentation(domain::SvgDocument& document) const {
    tinyxml2::XMLElement* root = document.root();

    std::vector<std::pair<std::string, std::string>> inherited;
    for (const auto* attr = root->FirstAttribute(); attr; attr = attr->Next()) {
        const std::string name = attr->Name();
        if (svg::IsPresentationAttribute(name) && name != "overflow" && name != "clip" &&
            name != "enable-background") {
            inherited.emplace_back(name, attr->Value());
        }
    }
    if (inherited.empty()) return;

    for (const auto& entry : inherited) {
        root->DeleteAttribute(entry.first.c_str());
    }

    std::vector<tinyxml2::XMLNode*> children;
    for (auto* child = root->FirstChild(); child; child = child->NextSibling()) {
        children.push_back(child);
    }
    if (children.empty()) return;

    tinyxml2::XMLElement* group = document.xml().NewElement("g");
    for (const auto& [name, value] : inherited) {
        group->SetAttribute(name.c_str(), value.c_str());
    }
    for (auto* child : children) {
        group->InsertEndChild(child);
    }
    root->InsertEndChild(group);
}

void SvgCleaner::unwrapPlainGroups(tinyxml2::XMLElement* element) const {
    for (auto* child : svg::ChildElements(element)) {
        unwrapPlainGroups(child);
        if (std::string(child->Name()) == "g" && svg::AttributeCount(child) == 0) {
            svg::UnwrapElement(child);
        }
    }
}

} // namespace iconforge::application
