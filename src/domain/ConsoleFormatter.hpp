/**
 * @file ConsoleFormatter.hpp
 * @brief Presentation helpers for console output.
 */

#pragma once
#include <string>

namespace quire::domain {

/**
 * @class ConsoleFormatter
 * @brief Decorates text for the terminal. Build logic never inspects the result.
 */
class ConsoleFormatter {
public:
    virtual ~ConsoleFormatter() = default;

    /** @brief Emphasis for names and paths in progress lines. */
    virtual std::string highlight(const std::string& text) const = 0;
    virtual std::string success(const std::string& text) const = 0;
    virtual std::string error(const std::string& text) const = 0;
};

} // namespace quire::domain
