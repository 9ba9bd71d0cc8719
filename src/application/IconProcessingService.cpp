/**
 * @file IconProcessingService.cpp
 * @brief Implementation of IconProcessingService.
 */

#include "application/IconProcessingService.hpp"
#include "domain/IconErrors.hpp"

namespace iconforge::application {

namespace {

GeometryOptimizer::Options OptimizerOptions(int precision) {
    GeometryOptimizer::Options options;
    options.precision = precision;
    return options;
}

} // namespace

IconProcessingService::IconProcessingService(int precision)
    : m_optimizer(OptimizerOptions(precision)), m_compat(precision) {}

std::string IconProcessingService::processIcon(domain::Icon& icon) const {
    try {
        m_cleaner.clean(icon.document);
        icon.stage = domain::IconStage::Validated;

        m_colors.canonicalize(icon.document);
        icon.stage = domain::IconStage::ColorCanonicalized;

        m_optimizer.optimize(icon.document);
        icon.stage = domain::IconStage::Optimized;

        m_compat.rewrite(icon.document);
        icon.stage = domain::IconStage::CompatRewritten;
    } catch (const domain::InvalidIconError& e) {
        const std::string reason = std::string(e.what()) + " (after stage " + domain::ToString(icon.stage) + ")";
        icon.stage = domain::IconStage::Rejected;
        return reason;
    }

    icon.stage = domain::IconStage::Committed;
    return {};
}

IconProcessingService::Summary IconProcessingService::process(domain::IconSet& set,
                                                              const domain::DiagnosticSink& sink,
                                                              const std::atomic<bool>* cancel) const {
    Summary summary;
    for (const auto& name : set.iconNames()) {
        if (cancel && cancel->load()) throw ImportCancelledError();

        domain::Icon* icon = set.findIcon(name);
        if (!icon || icon->stage == domain::IconStage::Committed) continue;

        const std::string reason = processIcon(*icon);
        if (reason.empty()) {
            ++summary.committed;
            continue;
        }

        set.remove(name);
        ++summary.rejected;
        if (sink) sink(domain::Diagnostic{domain::Severity::Warning, name, reason});
    }
    return summary;
}

} // namespace iconforge::application
