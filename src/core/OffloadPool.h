#pragma once

#include "core/Error.h"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace psmonitor {

template <class T>
struct TaskResult {
    boost::system::error_code ec;
    std::string detail;   // exception text when ec == errc::provider_failure
    T value{};
};

// Fixed-size pool for blocking calls. Work is queued FIFO without bound
// (asio's scheduler queue), so submit() never blocks the caller. Completions
// are posted to the executor handed to submit(), never run on a pool thread.
class OffloadPool {
public:
    explicit OffloadPool(std::size_t threads);
    ~OffloadPool();

    OffloadPool(const OffloadPool&) = delete;
    OffloadPool& operator=(const OffloadPool&) = delete;

    std::size_t size() const noexcept { return size_; }
    std::size_t in_flight() const noexcept { return in_flight_.load(); }
    bool stopped() const noexcept { return stopped_.load(); }

    // Runs fn() on a pool thread and posts handler(TaskResult<R>) to `ex`.
    // An exception escaping fn becomes errc::provider_failure. After stop(),
    // the handler is posted with errc::pool_stopped and fn never runs.
    template <class Fn, class Executor, class Handler>
    void submit(Fn fn, const Executor& ex, Handler handler) {
        using R = std::decay_t<std::invoke_result_t<Fn&>>;

        if (stopped_.load()) {
            TaskResult<R> result;
            result.ec = make_error_code(errc::pool_stopped);
            boost::asio::post(ex, [handler = std::move(handler), result = std::move(result)]() mutable {
                handler(std::move(result));
            });
            return;
        }

        ++in_flight_;
        boost::asio::post(pool_, [this, fn = std::move(fn), ex, handler = std::move(handler)]() mutable {
            TaskResult<R> result;
            try {
                result.value = fn();
            } catch (const std::exception& e) {
                result.ec = make_error_code(errc::provider_failure);
                result.detail = e.what();
            } catch (...) {
                result.ec = make_error_code(errc::provider_failure);
                result.detail = "unknown exception";
            }
            --in_flight_;
            boost::asio::post(ex, [handler = std::move(handler), result = std::move(result)]() mutable {
                handler(std::move(result));
            });
        });
    }

    // Rejects new work and waits for queued work to finish.
    void stop();

private:
    std::size_t size_;
    boost::asio::thread_pool pool_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> in_flight_{0};
};

} // namespace psmonitor
