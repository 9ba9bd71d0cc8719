/**
 * @file PathCompatibilityRewriter.cpp
 * @brief Implementation of PathCompatibilityRewriter.
 */

#include "application/PathCompatibilityRewriter.hpp"
#include "domain/PathData.hpp"
#include "domain/SvgSchema.hpp"
#include <tinyxml2.h>

namespace iconforge::application {

using domain::PathData;

void PathCompatibilityRewriter::rewrite(domain::SvgDocument& document) const {
    PathData::WriteOptions options;
    options.precision = m_precision;
    options.explicitCommands = true;
    options.compactArcFlags = false;

    for (auto* element : domain::svg::Descendants(document.root())) {
        const char* d = element->Attribute("d");
        if (!d) continue;
        const auto segments = PathData::Parse(d);
        if (segments.empty()) continue;
        element->SetAttribute("d", PathData::Write(segments, options).c_str());
    }
}

} // namespace iconforge::application
