/**
 * @file CollectionImportService.cpp
 * @brief Implementation of CollectionImportService.
 */

#include "application/CollectionImportService.hpp"
#include "infrastructure/IconDirectoryLoader.hpp"
#include "infrastructure/IconDirectoryScanner.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace iconforge::application {

namespace {

domain::DiagnosticSink Synchronized(domain::DiagnosticSink sink) {
    if (!sink) return nullptr;
    auto mutex = std::make_shared<std::mutex>();
    return [mutex, sink = std::move(sink)](const domain::Diagnostic& diagnostic) {
        std::lock_guard<std::mutex> lock(*mutex);
        sink(diagnostic);
    };
}

void ThrowIfCancelled(const std::atomic<bool>* cancel) {
    if (cancel && cancel->load()) throw ImportCancelledError();
}

} // namespace

CollectionImportService::CollectionImportService(domain::ImportSettings settings, domain::DiagnosticSink sink)
    : m_settings(std::move(settings)),
      m_sink(Synchronized(std::move(sink))),
      m_processor(m_settings.pathPrecision) {}

domain::DiagnosticSink CollectionImportService::DefaultSink(bool verbose) {
    return [verbose](const domain::Diagnostic& diagnostic) {
        if (diagnostic.severity == domain::Severity::Info) {
            if (verbose) std::cerr << "[IconImport] " << diagnostic.subject << ": " << diagnostic.reason << std::endl;
            return;
        }
        std::cerr << "[IconImport] " << domain::ToString(diagnostic.severity) << ": Skipping \""
                  << diagnostic.subject << "\": " << diagnostic.reason << std::endl;
    };
}

std::string CollectionImportService::CollectionKey(const std::vector<std::string>& segments,
                                                   const std::string& prefix,
                                                   const std::string& separator) {
    std::string key = prefix;
    for (const auto& segment : segments) {
        if (!key.empty()) key += separator;
        key += segment;
    }
    return key;
}

domain::CollectionRecord CollectionImportService::processSet(domain::IconSet& set,
                                                             const std::atomic<bool>* cancel) const {
    const auto summary = m_processor.process(set, m_sink, cancel);
    if (m_sink) {
        m_sink(domain::Diagnostic{domain::Severity::Info, set.prefix().empty() ? "(collection)" : set.prefix(),
                                  std::to_string(summary.committed) + " icons committed, " +
                                  std::to_string(summary.rejected) + " rejected"});
    }
    return set.exportRecord(m_sink);
}

domain::CollectionRecord CollectionImportService::importSvgCollection(const CollectionOptions& options,
                                                                      const std::atomic<bool>* cancel) const {
    infrastructure::IconDirectoryScanner scanner(options.source, m_sink);
    infrastructure::IconDirectoryLoader loader(m_sink);

    ThrowIfCancelled(cancel);
    const auto files = scanner.listIconFiles(scanner.root(), options.includeSubDirs);
    domain::IconSet set = loader.load(files, options.prefix, m_settings.defaultSize);
    return processSet(set, cancel);
}

unsigned CollectionImportService::workerCount(size_t jobs) const {
    unsigned workers = m_settings.maxWorkers;
    if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
    return static_cast<unsigned>(std::min<size_t>(workers, std::max<size_t>(jobs, 1)));
}

std::map<std::string, domain::CollectionRecord> CollectionImportService::importSvgCollections(
    const CollectionsOptions& options, const std::atomic<bool>* cancel) const {
    infrastructure::IconDirectoryScanner scanner(options.source, m_sink);

    ThrowIfCancelled(cancel);
    const auto partitions = scanner.scan();
    std::vector<std::optional<domain::CollectionRecord>> results(partitions.size());
    std::atomic<size_t> next{0};

    // Workers pull directories off a shared counter; each result lands in its partition's slot.
    auto worker = [&]() {
        infrastructure::IconDirectoryLoader loader(m_sink);
        for (size_t i = next++; i < partitions.size(); i = next++) {
            ThrowIfCancelled(cancel);
            const auto files = scanner.listIconFiles(partitions[i].path, false);
            domain::IconSet set = loader.load(files, "", m_settings.defaultSize);
            results[i] = processSet(set, cancel);
        }
    };

    std::vector<std::future<void>> futures;
    const unsigned workers = workerCount(partitions.size());
    for (unsigned w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }

    std::exception_ptr failure;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (...) {
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) std::rethrow_exception(failure);

    std::map<std::string, domain::CollectionRecord> collections;
    for (size_t i = 0; i < partitions.size(); ++i) {
        if (!results[i] || results[i]->icons.empty()) continue;
        const std::string key = CollectionKey(partitions[i].relativeSegments, options.prefix, m_settings.keySeparator);
        if (!collections.emplace(key, std::move(*results[i])).second && m_sink) {
            m_sink(domain::Diagnostic{domain::Severity::Warning, partitions[i].path.string(),
                                      "Collection key \"" + key + "\" is already taken"});
        }
    }
    return collections;
}

domain::CollectionRecord CollectionImportService::reprocessCollection(const domain::CollectionRecord& record,
                                                                      const std::atomic<bool>* cancel) const {
    ThrowIfCancelled(cancel);
    domain::IconSet set = domain::IconSet::FromRecord(record, m_sink);
    domain::CollectionRecord result = processSet(set, cancel);
    result.lastModified = record.lastModified;
    return result;
}

} // namespace iconforge::application
