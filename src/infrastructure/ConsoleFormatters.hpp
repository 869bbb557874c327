/**
 * @file ConsoleFormatters.hpp
 * @brief Terminal implementations of the ConsoleFormatter interface.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/ConsoleFormatter.hpp"

namespace quire::infrastructure {

/**
 * @class AnsiConsoleFormatter
 * @brief Colors text with ANSI escape sequences (cyan, green, red).
 */
class AnsiConsoleFormatter : public domain::ConsoleFormatter {
public:
    std::string highlight(const std::string& text) const override;
    std::string success(const std::string& text) const override;
    std::string error(const std::string& text) const override;
};

/**
 * @class PlainConsoleFormatter
 * @brief Returns text unchanged.
 */
class PlainConsoleFormatter : public domain::ConsoleFormatter {
public:
    std::string highlight(const std::string& text) const override { return text; }
    std::string success(const std::string& text) const override { return text; }
    std::string error(const std::string& text) const override { return text; }
};

/** @brief Plain output when NO_COLOR is set to a non-empty value, colored otherwise. */
std::unique_ptr<domain::ConsoleFormatter> MakeConsoleFormatter();

} // namespace quire::infrastructure
