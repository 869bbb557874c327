/**
 * @file BuildError.hpp
 * @brief Error taxonomy shared by every build phase.
 */

#pragma once
#include <string>

namespace quire::domain {

/**
 * @enum ErrorKind
 * @brief Categories of build failures.
 */
enum class ErrorKind {
    PathNotFound,   ///< Project directory does not exist.
    LayoutNotFound, ///< Requested layout is not part of the theme.
    IOError,        ///< Read, write, copy or mkdir failure.
    RenderError,    ///< Site construction or rendering collaborator failure.
    AggregateError  ///< Several sibling failures merged into one message.
};

/**
 * @struct BuildError
 * @brief A failure reported by one unit of work.
 */
struct BuildError {
    ErrorKind kind = ErrorKind::RenderError;
    std::string message;

    static std::string KindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::PathNotFound: return "PathNotFound";
            case ErrorKind::LayoutNotFound: return "LayoutNotFound";
            case ErrorKind::IOError: return "IOError";
            case ErrorKind::RenderError: return "RenderError";
            case ErrorKind::AggregateError: return "AggregateError";
        }
        return "RenderError";
    }
};

} // namespace quire::domain
