#include <cassert>
#include <iostream>
#include <string>
#include <tinyxml2.h>

#include "application/ColorCanonicalizer.hpp"
#include "application/GeometryOptimizer.hpp"
#include "application/IconProcessingService.hpp"
#include "application/PathCompatibilityRewriter.hpp"
#include "application/SvgCleaner.hpp"
#include "domain/IconErrors.hpp"
#include "domain/SvgDocument.hpp"

using namespace iconforge;
using iconforge::domain::SvgDocument;

namespace {

bool Contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

template <typename Stage>
bool Rejects(const std::string& xml, Stage stage) {
    try {
        SvgDocument doc = SvgDocument::Parse(xml);
        stage(doc);
    } catch (const domain::InvalidIconError&) {
        return true;
    }
    return false;
}

void TestDocumentParsing() {
    SvgDocument doc = SvgDocument::Parse("<svg viewBox=\"0, -2 17 16\"><path d=\"M0 0h1\"/></svg>");
    assert(doc.viewBox().left == 0 && doc.viewBox().top == -2);
    assert(doc.viewBox().width == 17 && doc.viewBox().height == 16);

    SvgDocument sized = SvgDocument::Parse("<svg width=\"24px\" height=\"20\"><path d=\"M0 0h1\"/></svg>");
    assert(sized.viewBox().width == 24 && sized.viewBox().height == 20);

    auto fails = [](const std::string& xml) {
        try {
            SvgDocument::Parse(xml);
        } catch (const domain::InvalidIconError&) {
            return true;
        }
        return false;
    };
    assert(fails("<svg viewBox=\"0 0 16 16\"><path d=\"M0 0h1\"></svg>"));
    assert(fails("<html viewBox=\"0 0 16 16\"/>"));
    assert(fails("<svg viewBox=\"0 0 16\"/>"));
    assert(fails("<svg viewBox=\"0 0 0 16\"/>"));
    assert(fails("<svg width=\"2em\" height=\"2em\"/>"));
    assert(fails(""));

    SvgDocument rebuilt = SvgDocument::FromBody("<path d=\"M0 0h1\"/>", domain::ViewBox{1, 2, 3, 4});
    assert(rebuilt.viewBox().left == 1 && rebuilt.viewBox().height == 4);
    assert(rebuilt.body() == "<path d=\"M0 0h1\"/>");
    std::cout << "[PASS] Document parsing." << std::endl;
}

void TestCleaner() {
    application::SvgCleaner cleaner;

    SvgDocument doc = SvgDocument::Parse(
        "<?xml version=\"1.0\"?><!-- exported --><svg xmlns=\"http://www.w3.org/2000/svg\" "
        "xmlns:inkscape=\"http://www.inkscape.org/namespaces/inkscape\" width=\"24\" height=\"24\" "
        "viewBox=\"0 0 24 24\" version=\"1.1\" inkscape:version=\"1.0\" xml:space=\"preserve\">"
        "<title>Icon</title><desc>d</desc><metadata>m</metadata><sodipodi:namedview/>"
        "<script>alert(1)</script>"
        "<path style=\"fill:#f00; stroke-width:2;mix-blend-mode:multiply\" fill=\"#00f\" "
        "d=\"M0 0h24v24H0z\" onclick=\"x()\" inkscape:label=\"p\"/>text</svg>");
    cleaner.clean(doc);

    const tinyxml2::XMLElement* root = doc.root();
    assert(!root->Attribute("width") && !root->Attribute("height") && !root->Attribute("version"));
    assert(!root->Attribute("inkscape:version") && !root->Attribute("xmlns:inkscape"));
    assert(!root->Attribute("xml:space"));

    const tinyxml2::XMLElement* path = root->FirstChildElement();
    assert(path && std::string(path->Name()) == "path" && !path->NextSiblingElement());
    assert(std::string(path->Attribute("fill")) == "#f00");
    assert(std::string(path->Attribute("stroke-width")) == "2");
    assert(std::string(path->Attribute("style")) == "mix-blend-mode:multiply");
    assert(!path->Attribute("onclick") && !path->Attribute("inkscape:label"));

    const std::string body = doc.body();
    assert(!Contains(body, "Icon") && !Contains(body, "exported") && !Contains(body, "text"));
    std::cout << "[PASS] Cleaner strips editor and metadata content." << std::endl;

    SvgDocument wrapped = SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\" fill=\"none\" stroke=\"#000\"><g><g><path d=\"M1 1h14\"/></g></g></svg>");
    cleaner.clean(wrapped);
    const tinyxml2::XMLElement* group = wrapped.root()->FirstChildElement();
    assert(!wrapped.root()->Attribute("fill"));
    assert(std::string(group->Name()) == "g");
    assert(std::string(group->Attribute("fill")) == "none");
    assert(std::string(group->Attribute("stroke")) == "#000");
    assert(std::string(group->FirstChildElement()->Name()) == "path");
    std::cout << "[PASS] Root presentation attributes move onto a group." << std::endl;

    auto clean = [&](SvgDocument& d) { cleaner.clean(d); };
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><foreignObject><div/></foreignObject><path d=\"M0 0h1\"/></svg>", clean));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><defs><path id=\"a\" d=\"M0 0h1\"/></defs></svg>", clean));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><title>empty</title></svg>", clean));
    std::cout << "[PASS] Cleaner rejects unusable icons." << std::endl;
}

void TestStyleSheets() {
    application::SvgCleaner cleaner;
    application::ColorCanonicalizer colors;

    // Illustrator-style export: colors live in class rules only.
    SvgDocument exported = SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\"><style>.a{fill:#000}.b{fill:#fff}</style>"
        "<path class=\"a\" d=\"M0 0h8v8z\"/><rect class=\"b\" width=\"16\" height=\"16\"/></svg>");
    cleaner.clean(exported);
    colors.canonicalize(exported);
    assert(exported.body() == "<path d=\"M0 0h8v8z\" fill=\"currentColor\"/>");
    std::cout << "[PASS] Stylesheet colors are canonicalized." << std::endl;

    SvgDocument cascade = SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\"><style><![CDATA[/* exported */ path{fill:#f00} "
        "#p.a{stroke-width:2} .a{fill:#0f0;stroke:#00f}]]></style>"
        "<path id=\"p\" class=\"a b\" fill=\"#123\" d=\"M0 0h1\"/>"
        "<path class=\"b\" style=\"fill:#321\" d=\"M0 1h1\"/>"
        "<circle class=\"a\" r=\"1\"/></svg>");
    cleaner.clean(cascade);
    const tinyxml2::XMLElement* first = cascade.root()->FirstChildElement();
    assert(std::string(first->Name()) == "path");
    assert(std::string(first->Attribute("fill")) == "#0f0");
    assert(std::string(first->Attribute("stroke")) == "#00f");
    assert(std::string(first->Attribute("stroke-width")) == "2");
    const tinyxml2::XMLElement* second = first->NextSiblingElement();
    assert(std::string(second->Attribute("fill")) == "#321");
    const tinyxml2::XMLElement* circle = second->NextSiblingElement();
    assert(std::string(circle->Attribute("fill")) == "#0f0" && !circle->Attribute("stroke-width"));
    assert(!Contains(cascade.body(), "class=") && !Contains(cascade.body(), "<style"));
    std::cout << "[PASS] Stylesheet rules follow specificity and yield to inline style." << std::endl;

    auto clean = [&](SvgDocument& d) { cleaner.clean(d); };
    auto cleanAndColor = [&](SvgDocument& d) {
        cleaner.clean(d);
        colors.canonicalize(d);
    };
    const std::string path = "<path class=\"a\" d=\"M0 0h1\"/>";
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><style>.a:hover{fill:red}</style>" + path + "</svg>", clean));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><style>g .a{fill:red}</style>" + path + "</svg>", clean));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><style>@media (min-width:1px){.a{fill:red}}</style>" + path + "</svg>",
                   clean));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><style>.a{fill:red</style>" + path + "</svg>", clean));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><style>.a{fill:bogus}</style>" + path + "</svg>", cleanAndColor));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><style>.a{fill:#fff}</style>" + path + "</svg>", cleanAndColor));
    std::cout << "[PASS] Stylesheets that cannot be inlined are rejected." << std::endl;
}

void TestStageTracking() {
    application::IconProcessingService service;

    domain::Icon good{SvgDocument::Parse("<svg viewBox=\"0 0 16 16\"><path d=\"M0 0h16v16H0z\"/></svg>")};
    assert(good.stage == domain::IconStage::Loaded);
    assert(service.processIcon(good).empty());
    assert(good.stage == domain::IconStage::Committed);

    domain::Icon badPath{SvgDocument::Parse("<svg viewBox=\"0 0 16 16\"><path d=\"M0 0 L\"/></svg>")};
    const std::string reason = service.processIcon(badPath);
    assert(Contains(reason, "after stage color-canonicalized"));
    assert(badPath.stage == domain::IconStage::Rejected);

    domain::Icon foreign{SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\"><foreignObject/><path d=\"M0 0h1\"/></svg>")};
    assert(Contains(service.processIcon(foreign), "after stage loaded"));
    std::cout << "[PASS] Icons record the last stage they passed." << std::endl;
}

void TestColorCanonicalizer() {
    application::ColorCanonicalizer colors;

    SvgDocument doc = SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\">"
        "<rect width=\"16\" height=\"16\" fill=\"#fff\"/>"
        "<circle cx=\"8\" cy=\"8\" r=\"4\"/>"
        "<path d=\"M0 0h4\" fill=\"none\" stroke=\"black\"/>"
        "<path d=\"M0 4h4\" fill=\"rgb(10, 20, 30)\" stroke=\"#010101\"/>"
        "<path d=\"M0 8h4\" fill=\"#000000\"/>"
        "</svg>");
    colors.canonicalize(doc);
    assert(doc.body() ==
        "<circle cx=\"8\" cy=\"8\" r=\"4\" fill=\"currentColor\"/>"
        "<path d=\"M0 0h4\" fill=\"none\" stroke=\"currentColor\"/>"
        "<path d=\"M0 4h4\" fill=\"rgb(10, 20, 30)\" stroke=\"#010101\"/>"
        "<path d=\"M0 8h4\" fill=\"currentColor\"/>");
    std::cout << "[PASS] Black inherits, white is removed, others untouched." << std::endl;

    SvgDocument masked = SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\"><defs>"
        "<mask id=\"m\"><rect width=\"16\" height=\"16\" fill=\"#fff\"/></mask>"
        "<linearGradient id=\"g\"><stop offset=\"0\" stop-color=\"#fff\"/><stop offset=\"1\" stop-color=\"#f00\"/></linearGradient>"
        "</defs>"
        "<path d=\"M0 0h16v16z\" fill=\"#000\" mask=\"url(#m)\"/>"
        "<rect width=\"4\" height=\"4\" fill=\"url(#g)\"/></svg>");
    colors.canonicalize(masked);
    const std::string body = masked.body();
    assert(Contains(body, "<mask id=\"m\"><rect width=\"16\" height=\"16\" fill=\"#fff\"/></mask>"));
    assert(!Contains(body, "stop-color=\"#fff\""));
    assert(Contains(body, "stop-color=\"#f00\""));
    assert(Contains(body, "fill=\"currentColor\" mask=\"url(#m)\""));
    assert(Contains(body, "fill=\"url(#g)\""));
    std::cout << "[PASS] Masks are left alone, white stops are removed." << std::endl;

    auto canonicalize = [&](SvgDocument& d) { colors.canonicalize(d); };
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><path d=\"M0 0h1\" fill=\"bogus\"/></svg>", canonicalize));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><rect width=\"1\" height=\"1\" fill=\"white\"/></svg>", canonicalize));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><g fill=\"#FFF\"><path d=\"M0 0h1\"/><path d=\"M0 1h1\"/></g></svg>",
                   canonicalize));
    try {
        SvgDocument bad = SvgDocument::Parse("<svg viewBox=\"0 0 16 16\"><path d=\"M0 0h1\" stroke=\"blurple\"/></svg>");
        colors.canonicalize(bad);
        assert(false && "invalid color must throw");
    } catch (const domain::InvalidIconError& e) {
        assert(Contains(e.what(), "blurple") && Contains(e.what(), "stroke"));
    }
    std::cout << "[PASS] Invalid colors and emptied icons are rejected." << std::endl;

    // The policy is pluggable: a keep-everything policy changes nothing.
    application::ColorCanonicalizer keepAll([](const domain::Color&) { return domain::ColorAction::Keep; });
    SvgDocument untouched = SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\"><path d=\"M0 0h1\" fill=\"#000\"/><path d=\"M0 1h1\" fill=\"#fff\"/></svg>");
    const std::string before = untouched.body();
    keepAll.canonicalize(untouched);
    assert(untouched.body() == before);

    // Canonicalizing canonical output is a no-op.
    const std::string once = doc.body();
    colors.canonicalize(doc);
    assert(doc.body() == once);
    std::cout << "[PASS] Policy is pluggable and canonicalization is idempotent." << std::endl;
}

std::string Optimize(const std::string& xml) {
    SvgDocument doc = SvgDocument::Parse(xml);
    application::GeometryOptimizer().optimize(doc);
    return doc.body();
}

void TestGeometryOptimizer() {
    assert(Optimize("<svg viewBox=\"0 0 16 16\"><path d=\"M0 0L10 0\" stroke=\"#f00\" stroke-width=\"1\" "
                    "stroke-linecap=\"butt\" fill-opacity=\"1\"/></svg>") ==
           "<path stroke=\"#f00\" d=\"M0 0h10\"/>");

    // A default value that overrides an inherited one is meaningful.
    assert(Optimize("<svg viewBox=\"0 0 16 16\"><g stroke-width=\"2\" stroke=\"#f00\">"
                    "<path d=\"M0 0h1\" stroke-width=\"1\"/><path d=\"M0 2h1\"/></g></svg>") ==
           "<g stroke=\"#f00\" stroke-width=\"2\"><path stroke-width=\"1\" d=\"M0 0h1\"/><path d=\"M0 2h1\"/></g>");

    assert(Optimize("<svg viewBox=\"0 0 16 16\"><circle cx=\"8.123456\" cy=\"8\" r=\"4.0004\"/>"
                    "<rect x=\"0\" y=\"0\" width=\"2\" height=\"2\"/></svg>") ==
           "<circle cx=\"8.123\" cy=\"8\" r=\"4\"/><rect width=\"2\" height=\"2\"/>");
    std::cout << "[PASS] Rounding and default removal." << std::endl;

    assert(Optimize("<svg viewBox=\"0 0 16 16\"><g transform=\"translate(1 1)\"><g transform=\"scale(2)\">"
                    "<path d=\"M0 0h1\"/></g></g><g/><defs/></svg>") ==
           "<path d=\"M0 0h1\" transform=\"translate(1 1) scale(2)\"/>");
    assert(Optimize("<svg viewBox=\"0 0 16 16\"><g fill=\"#f00\"><path d=\"M0 0h1\" fill=\"#0f0\"/></g></svg>") ==
           "<path fill=\"#0f0\" d=\"M0 0h1\"/>");
    assert(Optimize("<svg viewBox=\"0 0 16 16\"><g opacity=\".5\"><path d=\"M0 0h1\" opacity=\".5\"/></g></svg>") ==
           "<g opacity=\".5\"><path d=\"M0 0h1\" opacity=\".5\"/></g>");
    std::cout << "[PASS] Group collapsing." << std::endl;

    assert(Optimize("<svg viewBox=\"0 0 16 16\"><path d=\"M1 1h4\" fill=\"none\" stroke=\"currentColor\"/>"
                    "<path d=\"M1 5h4\" fill=\"none\" stroke=\"currentColor\"/></svg>") ==
           "<path fill=\"none\" stroke=\"currentColor\" d=\"M1 1h4M1 5h4\"/>");
    assert(Optimize("<svg viewBox=\"0 0 16 16\"><g fill=\"none\" stroke=\"#000\" stroke-width=\"1.5\">"
                    "<path d=\"M8 1L15 14H1Z\"/><path d=\"M8 6V9\"/></g></svg>") ==
           "<path fill=\"none\" stroke=\"#000\" stroke-width=\"1.5\" d=\"M8 1l7 13H1zm0 5v3\"/>");
    // Filled shapes are never joined.
    assert(Optimize("<svg viewBox=\"0 0 16 16\"><path d=\"M1 1h4v4z\" fill=\"#f00\"/>"
                    "<path d=\"M1 5h4v4z\" fill=\"#f00\"/></svg>") ==
           "<path fill=\"#f00\" d=\"M1 1h4v4z\"/><path fill=\"#f00\" d=\"M1 5h4v4z\"/>");
    std::cout << "[PASS] Stroke-only path merging." << std::endl;

    const std::string ids = Optimize(
        "<svg viewBox=\"0 0 16 16\"><defs><clipPath id=\"clip-a\"><rect width=\"16\" height=\"16\"/></clipPath>"
        "<linearGradient id=\"unused\"><stop offset=\"1\"/></linearGradient></defs>"
        "<g clip-path=\"url(#clip-a)\"><path id=\"shape\" d=\"M0 0h8v8H0z\"/></g>"
        "<use href=\"#clip-a\"/></svg>");
    assert(Contains(ids, "<clipPath id=\"svgID0\">"));
    assert(Contains(ids, "clip-path=\"url(#svgID0)\""));
    assert(Contains(ids, "href=\"#svgID0\""));
    assert(!Contains(ids, "clip-a") && !Contains(ids, "unused") && !Contains(ids, "shape"));
    std::cout << "[PASS] ID cleanup." << std::endl;

    auto optimize = [](SvgDocument& d) { application::GeometryOptimizer().optimize(d); };
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><path d=\"M0 0 L\"/></svg>", optimize));
    assert(Rejects("<svg viewBox=\"0 0 16 16\"><path d=\"\"/></svg>", optimize));

    const std::string once = Optimize(
        "<svg viewBox=\"0 0 24 24\"><g fill=\"none\" stroke=\"currentColor\"><path d=\"M2 12h18\"/></g>"
        "<g stroke-width=\"2\"><path d=\"M14 6l6 6-6 6\" stroke=\"#00f\" stroke-width=\"1\"/></g></svg>");
    assert(Optimize("<svg viewBox=\"0 0 24 24\">" + once + "</svg>") == once);
    std::cout << "[PASS] Malformed paths are rejected and optimization is stable." << std::endl;
}

void TestCompatibilityRewrite() {
    SvgDocument doc = SvgDocument::Parse(
        "<svg viewBox=\"0 0 16 16\"><path d=\"M0 0l6 6-6 6a2 2 0 1010 0\"/><circle r=\"2\"/></svg>");
    application::PathCompatibilityRewriter().rewrite(doc);
    assert(doc.body() == "<path d=\"M0 0l6 6l-6 6a2 2 0 1 0 10 0\"/><circle r=\"2\"/>");
    std::cout << "[PASS] Compatibility rewrite." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SVG pipeline stage test..." << std::endl;

    TestDocumentParsing();
    TestCleaner();
    TestStyleSheets();
    TestColorCanonicalizer();
    TestGeometryOptimizer();
    TestCompatibilityRewrite();
    TestStageTracking();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
