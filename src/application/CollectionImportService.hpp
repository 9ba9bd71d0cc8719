/**
 * @file CollectionImportService.hpp
 * @brief Service that turns icon directories into collection records.
 */

#pragma once
#include <atomic>
#include <map>
#include <string>
#include <vector>
#include "application/IconProcessingService.hpp"
#include "domain/CollectionRecord.hpp"
#include "domain/Diagnostic.hpp"
#include "domain/IconSet.hpp"
#include "domain/ImportSettings.hpp"

namespace iconforge::application {

/**
 * @class CollectionImportService
 * @brief Orchestrates the import pipeline from directory scan to exported record.
 *
 * Diagnostics from every stage go to one sink; calls into it are serialized, so the sink
 * does not need to be thread-safe even when collections are imported concurrently.
 */
class CollectionImportService {
public:
    /**
     * @brief Options of a single-collection import.
     */
    struct CollectionOptions {
        std::string source;          ///< Directory holding the icons.
        bool includeSubDirs = true;  ///< Fold icons of nested directories into the same set.
        std::string prefix;          ///< Prefix written into the record.
    };

    /**
     * @brief Options of a multi-collection import.
     */
    struct CollectionsOptions {
        std::string source;  ///< Root of the tree to partition.
        std::string prefix;  ///< Leading segment of every collection key, none when empty.
    };

    /** @brief Sink that logs to stderr; info diagnostics only when verbose. */
    static domain::DiagnosticSink DefaultSink(bool verbose = false);

    explicit CollectionImportService(domain::ImportSettings settings = {},
                                     domain::DiagnosticSink sink = DefaultSink());

    /**
     * @brief Imports one directory as one collection.
     * @return The record; its icons are empty when nothing survived.
     * @throws std::invalid_argument when source is not a directory.
     * @throws ImportCancelledError when the cancel flag is raised.
     */
    domain::CollectionRecord importSvgCollection(const CollectionOptions& options,
                                                 const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Imports every directory of a tree that directly contains icons.
     * @return Records by collection key; directories whose icons were all rejected are omitted.
     * @throws std::invalid_argument when source is not a directory.
     * @throws ImportCancelledError when the cancel flag is raised; no partial result is returned.
     */
    std::map<std::string, domain::CollectionRecord> importSvgCollections(const CollectionsOptions& options,
                                                                         const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Runs an exported record through the pipeline again.
     * Aliases are kept when their icon survives.
     */
    domain::CollectionRecord reprocessCollection(const domain::CollectionRecord& record,
                                                 const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Key of a partition: its relative path segments joined by the separator,
     * preceded by the prefix when there is one.
     */
    static std::string CollectionKey(const std::vector<std::string>& segments,
                                     const std::string& prefix,
                                     const std::string& separator);

    const domain::ImportSettings& settings() const { return m_settings; }

private:
    domain::CollectionRecord processSet(domain::IconSet& set, const std::atomic<bool>* cancel) const;
    unsigned workerCount(size_t jobs) const;

    domain::ImportSettings m_settings;
    domain::DiagnosticSink m_sink;
    IconProcessingService m_processor;
};

} // namespace iconforge::application
