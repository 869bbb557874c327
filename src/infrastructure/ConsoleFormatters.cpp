#include "infrastructure/ConsoleFormatters.hpp"
#include <cstdlib>

namespace quire::infrastructure {

namespace {

const char* kReset = "\033[0m";

std::string colored(const char* code, const std::string& text) {
    return std::string(code) + text + kReset;
}

} // namespace

std::string AnsiConsoleFormatter::highlight(const std::string& text) const {
    return colored("\033[36m", text);
}

std::string AnsiConsoleFormatter::success(const std::string& text) const {
    return colored("\033[32m", text);
}

std::string AnsiConsoleFormatter::error(const std::string& text) const {
    return colored("\033[31m", text);
}

std::unique_ptr<domain::ConsoleFormatter> MakeConsoleFormatter() {
    const char* noColor = std::getenv("NO_COLOR");
    if (noColor && *noColor) {
        return std::make_unique<PlainConsoleFormatter>();
    }
    return std::make_unique<AnsiConsoleFormatter>();
}

} // namespace quire::infrastructure
