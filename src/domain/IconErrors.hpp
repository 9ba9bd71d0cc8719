/**
 * @file IconErrors.hpp
 * @brief Recoverable, per-icon failures raised by the processing stages.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace iconforge::domain {

/**
 * @class InvalidIconError
 * @brief The icon cannot be safely redistributed; the orchestrator removes it from its set.
 */
class InvalidIconError : public std::runtime_error {
public:
    explicit InvalidIconError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class PathSyntaxError
 * @brief Path data that does not follow the SVG path grammar.
 */
class PathSyntaxError : public InvalidIconError {
public:
    explicit PathSyntaxError(const std::string& message) : InvalidIconError(message) {}
};

} // namespace iconforge::domain
