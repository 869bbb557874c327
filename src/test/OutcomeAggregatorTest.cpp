#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/OutcomeAggregator.hpp"
#include "domain/Outcome.hpp"

using namespace quire::domain;
using quire::application::collectOutcomes;
using quire::application::mergeOutcome;

int main() {
    std::cout << "[Test] Starting Outcome Aggregator Test..." << std::endl;

    // Values are collected in input order, empty successes are skipped.
    {
        std::vector<Outcome<int>> outcomes = {
            Outcome<int>::success(1),
            Outcome<int>::empty(),
            Outcome<int>::success(2),
            Outcome<int>::success(3)
        };
        auto result = collectOutcomes(outcomes);
        assert(result.isSuccess());
        assert((result.value() == std::vector<int>{1, 2, 3}));
    }

    // No outcomes at all: success with an empty list.
    {
        auto result = collectOutcomes(std::vector<Outcome<int>>{});
        assert(result.isSuccess());
        assert(result.value().empty());
    }

    // [ok, fail(A), ok, fail(B)] -> "A, B".
    {
        std::vector<Status> outcomes = {
            ok(),
            Status::failure(ErrorKind::IOError, "A"),
            ok(),
            Status::failure(ErrorKind::IOError, "B")
        };
        auto result = collectOutcomes(outcomes);
        assert(result.isFailure());
        assert(result.error().message == "A, B");
        assert(result.error().kind == ErrorKind::AggregateError);
    }

    // A single failure keeps its own kind.
    {
        std::vector<Outcome<int>> outcomes = {
            Outcome<int>::success(1),
            Outcome<int>::failure(ErrorKind::LayoutNotFound, "Layout missing does not exist"),
            Outcome<int>::success(2)
        };
        auto result = collectOutcomes(outcomes);
        assert(result.isFailure());
        assert(result.error().kind == ErrorKind::LayoutNotFound);
        assert(result.error().message == "Layout missing does not exist");
    }

    // Identical messages are still concatenated.
    {
        std::vector<Status> outcomes = {
            Status::failure(ErrorKind::IOError, "same"),
            Status::failure(ErrorKind::IOError, "same")
        };
        auto result = collectOutcomes(outcomes);
        assert(result.error().message == "same, same");
    }

    // Three failures concatenate in fold order.
    {
        std::vector<Status> outcomes = {
            Status::failure(ErrorKind::IOError, "first"),
            ok(),
            Status::failure(ErrorKind::IOError, "second"),
            Status::failure(ErrorKind::LayoutNotFound, "third")
        };
        auto result = collectOutcomes(outcomes);
        assert(result.error().message == "first, second, third");
    }

    // Folding two halves separately and merging the results classifies the same way.
    {
        std::vector<Outcome<int>> left = {Outcome<int>::success(1), Outcome<int>::failure(ErrorKind::IOError, "A")};
        std::vector<Outcome<int>> right = {Outcome<int>::success(2), Outcome<int>::failure(ErrorKind::IOError, "B")};
        std::vector<Outcome<int>> all = left;
        all.insert(all.end(), right.begin(), right.end());

        auto whole = collectOutcomes(all);
        auto leftResult = collectOutcomes(left);
        auto rightResult = collectOutcomes(right);
        auto merged = mergeOutcome(leftResult, toStatus(rightResult).isFailure()
            ? Outcome<int>::failure(rightResult.error())
            : Outcome<int>::empty());

        assert(whole.isFailure() && merged.isFailure());
        assert(whole.error().message == merged.error().message);
        assert(whole.error().message == "A, B");
    }

    // A failure is sticky: later successes do not clear it.
    {
        auto accumulated = Outcome<std::vector<int>>::failure(ErrorKind::IOError, "broken");
        auto next = mergeOutcome(accumulated, Outcome<int>::success(7));
        assert(next.isFailure());
        assert(next.error().message == "broken");
        assert(next.error().kind == ErrorKind::IOError);
    }

    std::cout << "[PASS] Outcome Aggregator Test." << std::endl;
    return 0;
}
