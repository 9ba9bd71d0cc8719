/**
 * @file IconDirectoryLoader.cpp
 * @brief Implementation of IconDirectoryLoader.
 */

#include "infrastructure/IconDirectoryLoader.hpp"
#include "domain/IconErrors.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace iconforge::infrastructure {

namespace {

/** @brief Strict UTF-8 check: no overlong forms, surrogates or code points above U+10FFFF. */
bool IsValidUtf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 2;
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 3;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        } else {
            return false;
        }
        if (i + length >= text.size()) return false;

        for (size_t k = 1; k <= length; ++k) {
            const auto c = static_cast<unsigned char>(text[i + k]);
            if (c < (k == 1 ? low : 0x80) || c > (k == 1 ? high : 0xBF)) return false;
        }
        i += length + 1;
    }
    return true;
}

} // namespace

IconDirectoryLoader::IconDirectoryLoader(domain::DiagnosticSink sink) : m_sink(std::move(sink)) {}

std::int64_t IconDirectoryLoader::LastModifiedSeconds(const fs::path& path) {
    auto ftime = fs::last_write_time(path);
    auto systemTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
    );
    return std::chrono::duration_cast<std::chrono::seconds>(systemTime.time_since_epoch()).count();
}

void IconDirectoryLoader::warn(const fs::path& path, const std::string& reason) const {
    if (m_sink) m_sink(domain::Diagnostic{domain::Severity::Warning, path.string(), reason});
}

domain::IconSet IconDirectoryLoader::load(const std::vector<fs::path>& files,
                                          const std::string& prefix,
                                          double defaultSize) const {
    domain::IconSet set(prefix, defaultSize, defaultSize);

    for (const auto& path : files) {
        const std::string name = path.stem().string();
        if (!IsValidUtf8(name)) {
            warn(path, "File name is not valid UTF-8");
            continue;
        }
        if (set.contains(name)) {
            warn(path, "Duplicate icon name \"" + name + "\", keeping the first file");
            continue;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            warn(path, "Cannot open file");
            continue;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        std::int64_t lastModified = 0;
        try {
            lastModified = LastModifiedSeconds(path);
        } catch (const fs::filesystem_error& e) {
            warn(path, e.what());
            continue;
        }

        const std::string content = buffer.str();
        if (!IsValidUtf8(content)) {
            warn(path, "Content is not valid UTF-8");
            continue;
        }

        try {
            set.addIcon(name, domain::SvgDocument::Parse(content), lastModified, path.string());
        } catch (const domain::InvalidIconError& e) {
            warn(path, e.what());
        }
    }
    return set;
}

} // namespace iconforge::infrastructure
