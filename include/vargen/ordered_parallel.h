// Worker pool that produces items in parallel and consumes them in order.
#pragma once

#include "vargen/error.h"

#include <fmt/format.h>

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace vargen {

// Upper bound on worker threads, whatever the caller asks for.
inline constexpr std::size_t kMaxJobs = 256;

[[nodiscard]] inline std::size_t default_concurrency(std::uint64_t task_count) {
    const unsigned hw   = std::thread::hardware_concurrency();
    std::uint64_t  jobs = hw == 0 ? 1u : hw;
    jobs                = std::max<std::uint64_t>(1, std::min(jobs, task_count));
    return static_cast<std::size_t>(jobs);
}

namespace detail {

// Wrap anything that is not already a vargen::error as a WorkerFailure.
inline std::exception_ptr as_worker_failure(std::exception_ptr ep, std::uint64_t index) {
    try {
        std::rethrow_exception(ep);
    } catch (const error &) {
        return ep;
    } catch (const std::exception &e) {
        return std::make_exception_ptr(error(ErrorKind::WorkerFailure, fmt::format("batch {} failed: {}", index, e.what())));
    } catch (...) {
        return std::make_exception_ptr(error(ErrorKind::WorkerFailure, fmt::format("batch {} failed with a non-standard exception", index)));
    }
}

} // namespace detail

// Run `produce(i)` for i in [0, count) on up to `jobs` threads and hand each
// result to `consume(i, std::move(result))` on the calling thread, strictly in
// ascending i. At most `window` items are claimed but not yet consumed, which
// bounds memory to `window` results no matter how far workers run ahead. No
// more than `window` (and never more than kMaxJobs) threads are started; if
// the system refuses a thread, the started ones are joined and
// vargen::error(WorkerFailure) is thrown.
//
// Items are claimed in ascending order. On the first failure no further items
// are claimed and nothing else is consumed; items already running finish, and
// the failure of the lowest failing index is rethrown. `produce` must be safe
// to call concurrently; `consume` is only ever called from this thread.
template <typename Produce, typename Consume>
void ordered_parallel_for(std::uint64_t count, std::size_t jobs, std::size_t window, Produce &&produce, Consume &&consume) {
    if (count == 0) {
        return;
    }
    window = std::max<std::size_t>(window, 1);
    jobs   = std::min({jobs, window, kMaxJobs});
    jobs   = static_cast<std::size_t>(std::max<std::uint64_t>(1, std::min<std::uint64_t>(jobs, count)));

    if (jobs == 1) {
        for (std::uint64_t i = 0; i < count; ++i) {
            std::exception_ptr failure;
            try {
                consume(i, produce(i));
            } catch (...) {
                failure = detail::as_worker_failure(std::current_exception(), i);
            }
            if (failure)
                std::rethrow_exception(failure);
        }
        return;
    }

    using Result = decltype(produce(std::uint64_t{0}));

    std::mutex                   mu;
    std::condition_variable      claim_cv;
    std::condition_variable      ready_cv;
    std::uint64_t                next_claim = 0;
    std::uint64_t                next_emit  = 0;
    std::size_t                  running    = 0;
    std::map<std::uint64_t, Result> done;
    bool                         stopped = false;
    std::optional<std::uint64_t> failed_index;
    std::exception_ptr           failure;

    auto record_failure = [&](std::uint64_t index, std::exception_ptr ep) {
        if (!failed_index || index < *failed_index) {
            failed_index = index;
            failure      = std::move(ep);
        }
        stopped = true;
    };

    auto worker = [&] {
        std::unique_lock<std::mutex> lock(mu);
        while (true) {
            claim_cv.wait(lock, [&] { return stopped || next_claim >= count || next_claim < next_emit + window; });
            if (stopped || next_claim >= count) {
                return;
            }
            const std::uint64_t index = next_claim++;
            ++running;
            lock.unlock();

            std::optional<Result> result;
            std::exception_ptr    ep;
            try {
                result.emplace(produce(index));
            } catch (...) {
                ep = detail::as_worker_failure(std::current_exception(), index);
            }

            lock.lock();
            --running;
            if (ep) {
                record_failure(index, std::move(ep));
                claim_cv.notify_all();
            } else {
                done.emplace(index, std::move(*result));
            }
            ready_cv.notify_one();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(jobs);
    try {
        for (std::size_t t = 0; t < jobs; ++t) {
            threads.emplace_back(worker);
        }
    } catch (const std::exception &e) {
        {
            std::lock_guard<std::mutex> lock(mu);
            stopped = true;
        }
        claim_cv.notify_all();
        ready_cv.notify_all();
        for (auto &th : threads) {
            th.join();
        }
        throw error(ErrorKind::WorkerFailure,
                    fmt::format("failed to start worker thread {} of {}: {}", threads.size() + 1, jobs, e.what()));
    }

    {
        std::unique_lock<std::mutex> lock(mu);
        while (next_emit < count) {
            ready_cv.wait(lock, [&] { return stopped || done.count(next_emit) != 0; });
            if (stopped) {
                break;
            }
            auto node = done.extract(next_emit);
            lock.unlock();

            std::exception_ptr ep;
            try {
                consume(next_emit, std::move(node.mapped()));
            } catch (...) {
                ep = detail::as_worker_failure(std::current_exception(), next_emit);
            }

            lock.lock();
            if (ep) {
                record_failure(next_emit, std::move(ep));
                claim_cv.notify_all();
                break;
            }
            ++next_emit;
            claim_cv.notify_all();
        }
        // Let in-flight items finish so a lower-index failure can still win.
        ready_cv.wait(lock, [&] { return running == 0; });
        stopped = true;
        claim_cv.notify_all();
    }

    for (auto &th : threads) {
        th.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace vargen
