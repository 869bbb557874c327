/**
 * @file Outcome.hpp
 * @brief Tagged result of a single unit of work.
 *
 * An Outcome is either a success (optionally carrying a value) or a failure
 * carrying a BuildError. Phases never throw across layers; they return these.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include "BuildError.hpp"

namespace quire::domain {

template <typename T>
class Outcome {
public:
    using value_type = T;

    /** @brief Success carrying a value. */
    static Outcome success(T value) {
        return Outcome(std::optional<T>(std::move(value)));
    }

    /** @brief Success carrying nothing. */
    static Outcome empty() {
        return Outcome(std::optional<T>());
    }

    static Outcome failure(BuildError error) {
        return Outcome(std::move(error));
    }

    static Outcome failure(ErrorKind kind, const std::string& message) {
        return Outcome(BuildError{kind, message});
    }

    bool isSuccess() const { return std::holds_alternative<std::optional<T>>(m_state); }
    bool isFailure() const { return !isSuccess(); }
    explicit operator bool() const { return isSuccess(); }

    /** @brief True for a success that carries a value. */
    bool hasValue() const {
        return isSuccess() && std::get<std::optional<T>>(m_state).has_value();
    }

    const T& value() const {
        if (!hasValue()) {
            throw std::logic_error("Outcome has no value");
        }
        return *std::get<std::optional<T>>(m_state);
    }

    T& value() {
        if (!hasValue()) {
            throw std::logic_error("Outcome has no value");
        }
        return *std::get<std::optional<T>>(m_state);
    }

    const BuildError& error() const {
        if (isSuccess()) {
            throw std::logic_error("Outcome is not a failure");
        }
        return std::get<BuildError>(m_state);
    }

private:
    explicit Outcome(std::optional<T> value) : m_state(std::move(value)) {}
    explicit Outcome(BuildError error) : m_state(std::move(error)) {}

    std::variant<std::optional<T>, BuildError> m_state;
};

/// Result of a unit of work that produces no value.
using Status = Outcome<std::monostate>;

inline Status ok() { return Status::empty(); }

/** @brief Drops the success value of an outcome, keeping a failure intact. */
template <typename T>
Status toStatus(const Outcome<T>& outcome) {
    if (outcome.isFailure()) {
        return Status::failure(outcome.error());
    }
    return ok();
}

} // namespace quire::domain
