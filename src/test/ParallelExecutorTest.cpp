#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "application/OutcomeAggregator.hpp"
#include "application/ParallelExecutor.hpp"

using namespace quire::domain;
using quire::application::ParallelExecutor;
using quire::application::collectOutcomes;

int main() {
    std::cout << "[Test] Starting Parallel Executor Test..." << std::endl;

    // Results follow input order even when later items finish first.
    {
        ParallelExecutor executor;
        std::vector<int> delays = {40, 30, 20, 10, 0};
        auto results = executor.map(delays, [](const int& delay) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            return Outcome<int>::success(delay);
        });
        assert(results.size() == delays.size());
        for (std::size_t i = 0; i < delays.size(); ++i) {
            assert(results[i].hasValue());
            assert(results[i].value() == delays[i]);
        }
    }

    // Items really overlap when uncapped.
    {
        ParallelExecutor executor;
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        std::vector<int> items(8, 0);
        auto results = executor.map(items, [&running, &peak](const int&) {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            --running;
            return ok();
        });
        assert(results.size() == items.size());
        assert(peak.load() > 1);
    }

    // A throwing item becomes a failure without affecting its siblings.
    {
        ParallelExecutor executor;
        std::vector<int> items = {1, 2, 3};
        auto results = executor.map(items, [](const int& item) {
            if (item == 2) {
                throw std::runtime_error("item 2 exploded");
            }
            return Outcome<int>::success(item * 10);
        });
        assert(results[0].value() == 10);
        assert(results[1].isFailure());
        assert(results[1].error().kind == ErrorKind::RenderError);
        assert(results[1].error().message == "item 2 exploded");
        assert(results[2].value() == 30);
    }

    // A worker cap bounds concurrency without changing results.
    {
        ParallelExecutor capped(2);
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        std::vector<int> items = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        auto results = capped.map(items, [&running, &peak](const int& item) {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
            return Outcome<int>::success(item * item);
        });
        assert(peak.load() <= 2);
        auto collected = collectOutcomes(results);
        assert(collected.isSuccess());
        assert((collected.value() == std::vector<int>{0, 1, 4, 9, 16, 25, 36, 49, 64, 81}));
    }

    // Zero-argument work items.
    {
        ParallelExecutor executor;
        std::vector<std::function<Outcome<std::string>()>> tasks = {
            [] { return Outcome<std::string>::success("a"); },
            [] { return Outcome<std::string>::failure(ErrorKind::IOError, "b failed"); },
            [] { return Outcome<std::string>::success("c"); }
        };
        auto results = executor.run(tasks);
        assert(results.size() == 3);
        assert(results[0].value() == "a");
        assert(results[1].error().message == "b failed");
        assert(results[2].value() == "c");
    }

    // Empty input.
    {
        ParallelExecutor executor;
        auto results = executor.map(std::vector<int>{}, [](const int&) { return ok(); });
        assert(results.empty());
    }

    std::cout << "[PASS] Parallel Executor Test." << std::endl;
    return 0;
}
