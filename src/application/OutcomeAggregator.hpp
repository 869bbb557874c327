/**
 * @file OutcomeAggregator.hpp
 * @brief Folds the per-item outcomes of a parallel phase into one overall result.
 */

#pragma once
#include <utility>
#include <vector>
#include "domain/Outcome.hpp"

namespace quire::application {

/**
 * @brief One step of the fold.
 *
 * - success + success: the value is appended when the item carries one.
 * - success + failure: the failure replaces the accumulator.
 * - failure + success: the accumulator is kept.
 * - failure + failure: an AggregateError joining both messages with ", ".
 */
template <typename T>
domain::Outcome<std::vector<T>> mergeOutcome(domain::Outcome<std::vector<T>> accumulated,
                                             const domain::Outcome<T>& next) {
    using Result = domain::Outcome<std::vector<T>>;

    if (accumulated.isFailure()) {
        if (next.isSuccess()) {
            return accumulated;
        }
        return Result::failure(domain::ErrorKind::AggregateError,
                               accumulated.error().message + ", " + next.error().message);
    }

    if (next.isFailure()) {
        return Result::failure(next.error());
    }

    if (next.hasValue()) {
        accumulated.value().push_back(next.value());
    }
    return accumulated;
}

/**
 * @brief Left-folds outcomes starting from success with an empty list.
 * @return The values in input order, or the (possibly aggregated) failure.
 */
template <typename T>
domain::Outcome<std::vector<T>> collectOutcomes(const std::vector<domain::Outcome<T>>& outcomes) {
    auto accumulated = domain::Outcome<std::vector<T>>::success({});
    for (const auto& outcome : outcomes) {
        accumulated = mergeOutcome(std::move(accumulated), outcome);
    }
    return accumulated;
}

} // namespace quire::application
