/**
 * @file IconProcessingService.hpp
 * @brief Runs every icon of a set through the normalization pipeline.
 */

#pragma once
#include <atomic>
#include <stdexcept>
#include <string>
#include "application/ColorCanonicalizer.hpp"
#include "application/GeometryOptimizer.hpp"
#include "application/PathCompatibilityRewriter.hpp"
#include "application/SvgCleaner.hpp"
#include "domain/Diagnostic.hpp"
#include "domain/IconSet.hpp"

namespace iconforge::application {

/**
 * @class ImportCancelledError
 * @brief Thrown when the caller's cancellation flag is raised during an import.
 */
class ImportCancelledError : public std::runtime_error {
public:
    ImportCancelledError() : std::runtime_error("Import cancelled") {}
};

/**
 * @class IconProcessingService
 * @brief Orchestrates clean -> color -> optimize -> compat for each icon.
 *
 * Each icon advances Loaded -> Validated -> ColorCanonicalized -> Optimized ->
 * CompatRewritten -> Committed. A failing stage rejects the icon: it is removed from
 * the set, together with aliases that pointed at it, and a warning is reported.
 */
class IconProcessingService {
public:
    struct Summary {
        size_t committed = 0;
        size_t rejected = 0;
    };

    explicit IconProcessingService(int precision = 3);

    /**
     * @brief Processes all icons of the set sequentially, in name order.
     * @param cancel Optional flag checked before each icon.
     * @throws ImportCancelledError when the flag is raised.
     */
    Summary process(domain::IconSet& set,
                    const domain::DiagnosticSink& sink,
                    const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Runs the pipeline on one icon and records its final stage.
     * @return The reason on rejection, an empty string on success.
     */
    std::string processIcon(domain::Icon& icon) const;

private:
    SvgCleaner m_cleaner;
    ColorCanonicalizer m_colors;
    GeometryOptimizer m_optimizer;
    PathCompatibilityRewriter m_compat;
};

} // namespace iconforge::application
