/**
 * @file ParallelExecutor.hpp
 * @brief Fork-join execution of independent units of work.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#include "domain/Outcome.hpp"

namespace quire::application {

/**
 * @class ParallelExecutor
 * @brief Runs work items concurrently and returns their outcomes in input order.
 *
 * Each call is a barrier: every dispatched item finishes before the call returns.
 * An item that throws becomes a RenderError outcome for that item only. With
 * @c maxWorkers == 0 one thread is started per item; otherwise at most
 * @c maxWorkers threads drain the items, which does not change the results.
 */
class ParallelExecutor {
public:
    explicit ParallelExecutor(std::size_t maxWorkers = 0) : m_maxWorkers(maxWorkers) {}

    std::size_t getMaxWorkers() const { return m_maxWorkers; }

    /**
     * @brief Applies @p fn to every item concurrently.
     * @param items Inputs; each must stay alive and unmodified for the duration of the call.
     * @param fn Callable taking <tt>const Item&</tt> and returning a domain::Outcome.
     * @return One outcome per item, in input order.
     */
    template <typename Item, typename Fn>
    auto map(const std::vector<Item>& items, Fn fn) const
        -> std::vector<std::invoke_result_t<Fn&, const Item&>> {
        using Result = std::invoke_result_t<Fn&, const Item&>;

        std::vector<std::function<Result()>> tasks;
        tasks.reserve(items.size());
        for (const auto& item : items) {
            tasks.emplace_back([&fn, &item]() { return fn(item); });
        }
        return run(tasks);
    }

    /** @brief Runs zero-argument work items concurrently. */
    template <typename Result>
    std::vector<Result> run(const std::vector<std::function<Result()>>& tasks) const {
        std::vector<std::optional<Result>> slots(tasks.size());
        std::atomic<std::size_t> nextIndex{0};

        // Every slot is written by exactly one worker.
        auto worker = [&tasks, &slots, &nextIndex]() {
            for (std::size_t index = nextIndex++; index < tasks.size(); index = nextIndex++) {
                slots[index] = invokeCaptured(tasks[index]);
            }
        };

        std::size_t workerCount = tasks.size();
        if (m_maxWorkers > 0 && m_maxWorkers < workerCount) {
            workerCount = m_maxWorkers;
        }

        std::vector<std::thread> threads;
        threads.reserve(workerCount);
        for (std::size_t i = 0; i < workerCount; ++i) {
            try {
                threads.emplace_back(worker);
            } catch (const std::system_error&) {
                // Out of threads: the workers already running drain the remaining items.
                break;
            }
        }
        if (threads.empty()) {
            worker();
        }
        for (auto& thread : threads) {
            thread.join();
        }

        std::vector<Result> results;
        results.reserve(slots.size());
        for (auto& slot : slots) {
            results.push_back(std::move(*slot));
        }
        return results;
    }

private:
    template <typename Result>
    static Result invokeCaptured(const std::function<Result()>& task) {
        try {
            return task();
        } catch (const std::exception& e) {
            return Result::failure(domain::ErrorKind::RenderError, e.what());
        } catch (...) {
            return Result::failure(domain::ErrorKind::RenderError, "Unknown error during task execution.");
        }
    }

    std::size_t m_maxWorkers;
};

} // namespace quire::application
