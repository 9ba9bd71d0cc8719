/**
 * @file IconForgeCli.cpp
 * @brief Implementation of the IconForgeCli class.
 */
#include "app/IconForgeCli.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <map>
#include <stdexcept>
#include <vector>

#include "application/CollectionImportService.hpp"
#include "infrastructure/CollectionSerializer.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace iconforge::app {

namespace {

std::atomic<bool> g_cancelRequested{false};

void HandleInterrupt(int) {
    g_cancelRequested = true;
}

} // namespace

void IconForgeCli::PrintUsage() {
    std::cout <<
        "Usage: iconforge <command> <source> [options]\n"
        "\n"
        "Commands:\n"
        "  collection <dir>          Import one directory as one icon collection\n"
        "  collections <root>        Import every directory that holds .svg files\n"
        "  reprocess <file.json>     Run an exported collection through the pipeline again\n"
        "\n"
        "Options:\n"
        "  -o, --output <path>       Output file (collection, reprocess) or directory (collections)\n"
        "  --prefix <prefix>         Collection prefix (collection) or key prefix (collections)\n"
        "  --no-subdirs              Do not fold nested directories into the collection\n"
        "  --config <settings.json>  Settings file (default: "
              << infrastructure::ConfigLoader::DefaultSettingsPath().string() << ")\n"
        "  -v, --verbose             Print per-collection summaries\n"
        "  -h, --help                Show this help\n";
}

std::string IconForgeCli::ParseArguments(const std::vector<std::string>& args) {
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto takeValue = [&](std::string& target) -> bool {
            if (i + 1 >= args.size()) return false;
            target = args[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            m_options.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            m_options.verbose = true;
        } else if (arg == "--no-subdirs") {
            m_options.noSubDirs = true;
        } else if (arg == "-o" || arg == "--output") {
            if (!takeValue(m_options.output)) return "Missing value for " + arg;
        } else if (arg == "--config") {
            if (!takeValue(m_options.configPath)) return "Missing value for " + arg;
        } else if (arg == "--prefix") {
            if (!takeValue(m_options.prefix)) return "Missing value for " + arg;
            m_options.prefixGiven = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return "Unknown option: " + arg;
        } else {
            positional.push_back(arg);
        }
    }

    if (m_options.help) return {};
    if (positional.size() != 2) return "Expected a command and a source path";

    m_options.command = positional[0];
    m_options.source = positional[1];
    if (m_options.command != "collection" && m_options.command != "collections" &&
        m_options.command != "reprocess") {
        return "Unknown command: " + m_options.command;
    }
    return {};
}

int IconForgeCli::Run(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const std::string error = ParseArguments(args);
    if (!error.empty()) {
        std::cerr << "[IconForge] " << error << std::endl;
        PrintUsage();
        return UsageError;
    }
    if (m_options.help) {
        PrintUsage();
        return Success;
    }

    std::signal(SIGINT, HandleInterrupt);

    try {
        if (m_options.command == "collection") return RunCollection();
        if (m_options.command == "collections") return RunCollections();
        return RunReprocess();
    } catch (const application::ImportCancelledError& e) {
        std::cerr << "[IconForge] " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[IconForge] " << e.what() << std::endl;
    } catch (const infrastructure::CollectionFormatError& e) {
        std::cerr << "[IconForge] " << e.what() << std::endl;
    }
    return UsageError;
}

namespace {

domain::ImportSettings LoadSettings(const std::string& configPath) {
    const std::filesystem::path path = configPath.empty()
        ? infrastructure::ConfigLoader::DefaultSettingsPath()
        : std::filesystem::path(configPath);
    if (!configPath.empty() && !std::filesystem::exists(path)) {
        throw std::invalid_argument("Settings file not found: \"" + configPath + "\"");
    }
    return infrastructure::ConfigLoader::LoadImportSettings(path);
}

} // namespace

int IconForgeCli::RunCollection() {
    const domain::ImportSettings settings = LoadSettings(m_options.configPath);
    application::CollectionImportService service(settings,
        application::CollectionImportService::DefaultSink(m_options.verbose));

    application::CollectionImportService::CollectionOptions options;
    options.source = m_options.source;
    options.includeSubDirs = settings.includeSubDirs && !m_options.noSubDirs;
    options.prefix = m_options.prefixGiven ? m_options.prefix : settings.prefix;

    const auto record = service.importSvgCollection(options, &g_cancelRequested);
    Progress() << "[IconForge] Imported " << record.icons.size() << " icons from " << m_options.source << std::endl;
    return Emit(m_options.output, infrastructure::CollectionSerializer::ToJson(record));
}

int IconForgeCli::RunCollections() {
    const domain::ImportSettings settings = LoadSettings(m_options.configPath);
    application::CollectionImportService service(settings,
        application::CollectionImportService::DefaultSink(m_options.verbose));

    application::CollectionImportService::CollectionsOptions options;
    options.source = m_options.source;
    options.prefix = m_options.prefixGiven ? m_options.prefix : settings.prefix;

    const auto collections = service.importSvgCollections(options, &g_cancelRequested);
    Progress() << "[IconForge] Imported " << collections.size() << " collections from " << m_options.source << std::endl;

    if (m_options.output.empty()) {
        return Emit({}, infrastructure::CollectionSerializer::ToJson(collections));
    }

    infrastructure::PersistenceService persistence;
    std::vector<std::future<bool>> writes;
    for (const auto& [key, record] : collections) {
        const auto file = infrastructure::PathUtils::GetCollectionFile(m_options.output, key);
        writes.push_back(persistence.saveTextAsync(file.string(), infrastructure::CollectionSerializer::ToJson(record)));
    }
    persistence.stop();

    int exitCode = Success;
    for (auto& write : writes) {
        if (!write.get()) exitCode = WriteError;
    }
    return exitCode;
}

int IconForgeCli::RunReprocess() {
    const domain::ImportSettings settings = LoadSettings(m_options.configPath);
    application::CollectionImportService service(settings,
        application::CollectionImportService::DefaultSink(m_options.verbose));

    const auto input = infrastructure::CollectionSerializer::LoadFile(m_options.source);
    const auto record = service.reprocessCollection(input, &g_cancelRequested);
    Progress() << "[IconForge] Reprocessed " << record.icons.size() << " icons" << std::endl;
    return Emit(m_options.output, infrastructure::CollectionSerializer::ToJson(record));
}

std::ostream& IconForgeCli::Progress() const {
    // JSON on stdout must stay parseable.
    return m_options.output.empty() ? std::cerr : std::cout;
}

int IconForgeCli::Emit(const std::string& path, const std::string& text) {
    if (path.empty()) {
        std::cout << text << std::endl;
        return Success;
    }

    infrastructure::PersistenceService persistence;
    auto written = persistence.saveTextAsync(path, text + "\n");
    persistence.stop();
    if (!written.get()) {
        std::cerr << "[IconForge] Could not write " << path << std::endl;
        return WriteError;
    }
    std::cout << "[IconForge] Wrote " << path << std::endl;
    return Success;
}

} // namespace iconforge::app
