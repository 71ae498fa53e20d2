#pragma once

#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <folly/Try.h>
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>

namespace reachability {

/**
 * @brief Outcome of one unit of work: a value or the exception it threw
 *
 * @tparam T The value type
 */
template<typename T>
class Try {
public:
    explicit Try(folly::Try<T> outcome) : _outcome(std::move(outcome)) {}

    auto hasValue() const -> bool { return _outcome.hasValue(); }

    auto value() -> T& { return _outcome.value(); }

    // Null when the unit returned normally
    auto exception() const -> std::exception_ptr {
        if (!_outcome.hasException()) {
            return nullptr;
        }
        return _outcome.exception().to_exception_ptr();
    }

private:
    folly::Try<T> _outcome;
};

// Pending result of work scheduled on an executor
template<typename T>
class Future {
public:
    explicit Future(folly::Future<T> pending) : _pending(std::move(pending)) {}

    // Blocks until the result is available; rethrows a stored exception
    auto get() -> T {
        return std::move(_pending).get();
    }

    auto release() && -> folly::Future<T> {
        return std::move(_pending);
    }

private:
    folly::Future<T> _pending;
};

class FutureFactory {
public:
    FutureFactory() = delete;

    // Run func on executor. An exception thrown by func is captured in the
    // returned future rather than escaping onto the executor thread.
    template<typename F>
    static auto makeFutureVia(folly::Executor* executor, F&& func)
        -> Future<std::invoke_result_t<F>> {
        if (executor == nullptr) {
            throw std::invalid_argument("Executor cannot be null");
        }
        return Future<std::invoke_result_t<F>>(
            folly::via(folly::getKeepAliveToken(executor), std::forward<F>(func)));
    }
};

class FutureCollector {
public:
    FutureCollector() = delete;

    // Completes once every input has completed. One Try per input, in input
    // order, so a failed unit never hides its siblings.
    template<typename T>
    static auto collectAll(std::vector<Future<T>> futures) -> Future<std::vector<Try<T>>> {
        std::vector<folly::Future<T>> pending;
        pending.reserve(futures.size());
        for (auto& future : futures) {
            pending.push_back(std::move(future).release());
        }

        return Future<std::vector<Try<T>>>(
            folly::collectAll(pending.begin(), pending.end())
                .toUnsafeFuture()
                .thenValue([](std::vector<folly::Try<T>> outcomes) {
                    std::vector<Try<T>> wrapped;
                    wrapped.reserve(outcomes.size());
                    for (auto& outcome : outcomes) {
                        wrapped.emplace_back(std::move(outcome));
                    }
                    return wrapped;
                }));
    }
};

} // namespace reachability
