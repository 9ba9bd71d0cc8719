#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/CollectionImportService.hpp"
#include "infrastructure/CollectionSerializer.hpp"
#include "infrastructure/IconDirectoryLoader.hpp"

namespace fs = std::filesystem;
using namespace iconforge;
using application::CollectionImportService;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

bool Contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

const char* kSquare = "<svg viewBox=\"0 0 16 16\"><path d=\"M0 0h16v16H0z\"/></svg>";

const char* kAlert =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"16\" height=\"16\" viewBox=\"0 0 16 16\" "
    "fill=\"none\" stroke=\"#000\" stroke-width=\"1.5\"><path d=\"M8 1L15 14H1Z\"/><path d=\"M8 6V9\"/></svg>";

const char* kArrow =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 24 24\">"
    "<path d=\"M2 12h18\" stroke=\"black\" fill=\"none\"/>"
    "<path d=\"M14 6l6 6-6 6\" stroke=\"#0000ff\" fill=\"none\"/></svg>";

struct CollectingSink {
    std::vector<domain::Diagnostic> diagnostics;

    domain::DiagnosticSink sink() {
        return [this](const domain::Diagnostic& d) { diagnostics.push_back(d); };
    }

    bool warnedAbout(const std::string& subjectPart) const {
        for (const auto& d : diagnostics) {
            if (d.severity == domain::Severity::Warning && Contains(d.subject, subjectPart)) return true;
        }
        return false;
    }
};

void TestSingleCollection(const fs::path& root) {
    const fs::path line = root / "icons" / "line";
    WriteFile(line / "alert.svg", kAlert);
    WriteFile(line / "arrow.svg", kArrow);
    WriteFile(line / "broken.svg", "<svg viewBox=\"0 0 16 16\"><path d=");
    WriteFile(line / "blank.svg", "<svg viewBox=\"0 0 16 16\"><rect width=\"16\" height=\"16\" fill=\"#fff\"/></svg>");
    WriteFile(line / "notes.txt", "ignored");

    CollectingSink collected;
    CollectionImportService service({}, collected.sink());
    CollectionImportService::CollectionOptions options;
    options.source = line.string();

    const auto record = service.importSvgCollection(options);
    assert(record.prefix.empty());
    assert(record.icons.size() == 2);
    assert(record.icons.count("alert") && record.icons.count("arrow"));
    assert(!record.icons.count("broken") && !record.icons.count("blank"));

    const auto& alert = record.icons.at("alert");
    assert(alert.body == "<path fill=\"none\" stroke=\"currentColor\" stroke-width=\"1.5\" d=\"M8 1l7 13H1zm0 5v3\"/>");
    assert(!alert.width && !alert.height && !alert.left && !alert.top);

    const auto& arrow = record.icons.at("arrow");
    assert(Contains(arrow.body, "<path fill=\"none\" stroke=\"currentColor\" d=\"M2 12h18\"/>"));
    assert(Contains(arrow.body, "<path fill=\"none\" stroke=\"#0000ff\" d=\"M14 6l6 6l-6 6\"/>"));
    assert(arrow.width == std::optional<double>(24.0) && arrow.height == std::optional<double>(24.0));

    assert(collected.warnedAbout("broken.svg"));
    assert(collected.warnedAbout("blank"));
    std::cout << "[PASS] Single collection: icons/line scenario." << std::endl;

    const auto expected = std::max(infrastructure::IconDirectoryLoader::LastModifiedSeconds(line / "alert.svg"),
                                   infrastructure::IconDirectoryLoader::LastModifiedSeconds(line / "arrow.svg"));
    // The file clock conversion is re-evaluated on every call.
    assert(std::llabs(record.lastModified - expected) <= 1);

    options.prefix = "line";
    assert(service.importSvgCollection(options).prefix == "line");
    std::cout << "[PASS] Timestamps and prefix." << std::endl;
}

void TestSubdirectoryFolding(const fs::path& root) {
    const fs::path dir = root / "folded";
    WriteFile(dir / "x.svg", kSquare);
    WriteFile(dir / "nested" / "y.svg", kSquare);
    WriteFile(dir / "nested" / "x.svg", kAlert);
    WriteFile(dir / "odd.svg", "<svg viewBox=\"0 0 17 16\"><path d=\"M0 0h4\" stroke=\"red\"/></svg>");

    CollectingSink collected;
    CollectionImportService service({}, collected.sink());
    CollectionImportService::CollectionOptions options;
    options.source = dir.string();

    auto record = service.importSvgCollection(options);
    assert(record.icons.size() == 3);
    assert(record.icons.at("x").body == "<path fill=\"currentColor\" d=\"M0 0h16v16H0z\"/>");
    assert(record.icons.count("y"));
    assert(collected.warnedAbout((dir / "nested" / "x.svg").string()));
    assert(record.icons.at("odd").width == std::optional<double>(17.0));
    assert(!record.icons.at("odd").height);

    options.includeSubDirs = false;
    record = service.importSvgCollection(options);
    assert(record.icons.size() == 2 && !record.icons.count("y"));
    std::cout << "[PASS] Subdirectories fold into one collection." << std::endl;

    const fs::path invalidOnly = root / "invalid-only";
    WriteFile(invalidOnly / "bad.svg", "<svg><path/></svg>");
    options.source = invalidOnly.string();
    options.includeSubDirs = true;
    record = service.importSvgCollection(options);
    assert(record.icons.empty() && record.lastModified == 0);
    std::cout << "[PASS] Exhausted single collection is empty, not an error." << std::endl;
}

void TestMultiCollection(const fs::path& root) {
    const fs::path icons = root / "multi";
    WriteFile(icons / "a" / "x.svg", kSquare);
    WriteFile(icons / "a" / "b" / "y.svg", kSquare);
    WriteFile(icons / "bad" / "only.svg", "<svg viewBox=\"0 0 16 16\"><path d=\"M0 0\" fill=\"nope\"/></svg>");
    WriteFile(icons / "c" / "z.svg", kArrow);

    CollectingSink collected;
    CollectionImportService service({}, collected.sink());
    CollectionImportService::CollectionsOptions options;
    options.source = icons.string();
    options.prefix = "ic";

    auto collections = service.importSvgCollections(options);
    assert(collections.size() == 3);
    assert(collections.count("ic-a") && collections.count("ic-a-b") && collections.count("ic-c"));
    assert(!collections.count("ic-bad"));
    assert(collections.at("ic-a").icons.count("x") && !collections.at("ic-a").icons.count("y"));
    assert(collections.at("ic-a-b").icons.count("y") && collections.at("ic-a-b").icons.size() == 1);
    assert(collections.at("ic-a").prefix.empty());
    assert(collected.warnedAbout("only"));
    std::cout << "[PASS] Multi collection: prefixed keys, descendants excluded, invalid omitted." << std::endl;

    options.prefix.clear();
    collections = service.importSvgCollections(options);
    assert(collections.count("a") && collections.count("a-b") && collections.count("c"));

    domain::ImportSettings settings;
    settings.keySeparator = "/";
    CollectionImportService slashed(settings, nullptr);
    collections = slashed.importSvgCollections(options);
    assert(collections.count("a/b"));

    // Icons directly in the scan root form the collection with the bare prefix.
    WriteFile(icons / "top.svg", kSquare);
    collections = service.importSvgCollections(options);
    assert(collections.count("") && collections.at("").icons.count("top"));
    options.prefix = "ic";
    collections = service.importSvgCollections(options);
    assert(collections.count("ic") && collections.size() == 4);
    std::cout << "[PASS] Key separator and root collection." << std::endl;
}

void TestNonUtf8Input(const fs::path& root) {
    const fs::path icons = root / "encodings";
    WriteFile(icons / "latin" / "ok.svg", kSquare);
    WriteFile(icons / "latin" / "caf\xE9.svg", kSquare);
    WriteFile(icons / "latin" / "legacy.svg",
              "<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><svg viewBox=\"0 0 16 16\">"
              "<text>caf\xE9</text><path d=\"M0 0h16v16H0z\"/></svg>");
    WriteFile(icons / "other" / "y.svg", kSquare);

    CollectingSink collected;
    CollectionImportService service({}, collected.sink());
    CollectionImportService::CollectionsOptions options;
    options.source = icons.string();

    const auto collections = service.importSvgCollections(options);
    assert(collections.size() == 2);
    assert(collections.at("latin").icons.size() == 1 && collections.at("latin").icons.count("ok"));
    assert(collections.at("other").icons.count("y"));
    assert(collected.warnedAbout("legacy.svg"));
    size_t nameWarnings = 0;
    for (const auto& d : collected.diagnostics) {
        if (d.reason == "File name is not valid UTF-8") ++nameWarnings;
    }
    assert(nameWarnings == 1);

    const std::string json = infrastructure::CollectionSerializer::ToJson(collections);
    assert(Contains(json, "\"ok\"") && Contains(json, "\"y\""));
    std::cout << "[PASS] Non-UTF-8 names and contents are rejected per icon." << std::endl;
}

void TestInvocationErrors(const fs::path& root) {
    CollectionImportService service({}, nullptr);

    bool threw = false;
    try {
        CollectionImportService::CollectionOptions options;
        options.source = (root / "does-not-exist").string();
        service.importSvgCollection(options);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        service.importSvgCollections(CollectionImportService::CollectionsOptions{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Missing source is an invocation error." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting collection import test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "iconforge_import_test";
    fs::remove_all(root);

    TestSingleCollection(root);
    TestSubdirectoryFolding(root);
    TestMultiCollection(root);
    TestNonUtf8Input(root);
    TestInvocationErrors(root);

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
