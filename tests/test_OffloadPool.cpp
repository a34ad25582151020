#include <doctest/doctest.h>

#include "core/OffloadPool.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace psmonitor;
using namespace std::chrono_literals;

namespace asio = boost::asio;

DOCTEST_TEST_CASE("OffloadPool runs work off-thread and completes on the executor") {
    asio::io_context ioc;
    auto work = asio::make_work_guard(ioc);
    OffloadPool pool(2);

    const auto loop_thread = std::this_thread::get_id();
    std::thread::id worker_thread;
    std::thread::id completion_thread;
    TaskResult<int> result;

    pool.submit(
        [&] {
            worker_thread = std::this_thread::get_id();
            return 42;
        },
        ioc.get_executor(),
        [&](TaskResult<int> r) {
            completion_thread = std::this_thread::get_id();
            result = std::move(r);
            work.reset();
        });
    ioc.run();

    DOCTEST_CHECK_FALSE(result.ec);
    DOCTEST_CHECK_EQ(result.value, 42);
    DOCTEST_CHECK_NE(worker_thread, loop_thread);
    DOCTEST_CHECK_EQ(completion_thread, loop_thread);
}

DOCTEST_TEST_CASE("OffloadPool turns exceptions into provider_failure") {
    asio::io_context ioc;
    auto work = asio::make_work_guard(ioc);
    OffloadPool pool(1);

    TaskResult<int> failed;
    TaskResult<int> after;
    int done = 0;

    pool.submit([]() -> int { throw std::runtime_error("sensor unplugged"); }, ioc.get_executor(),
                [&](TaskResult<int> r) {
                    failed = std::move(r);
                    if (++done == 2) work.reset();
                });
    // the worker thread survives and serves the next task
    pool.submit([] { return 7; }, ioc.get_executor(),
                [&](TaskResult<int> r) {
                    after = std::move(r);
                    if (++done == 2) work.reset();
                });
    ioc.run();

    DOCTEST_CHECK_EQ(failed.ec, make_error_code(errc::provider_failure));
    DOCTEST_CHECK_EQ(failed.detail, "sensor unplugged");
    DOCTEST_CHECK_FALSE(after.ec);
    DOCTEST_CHECK_EQ(after.value, 7);
}

DOCTEST_TEST_CASE("OffloadPool queues work beyond its size in FIFO order") {
    asio::io_context ioc;
    auto work = asio::make_work_guard(ioc);
    OffloadPool pool(1);

    std::mutex mu;
    std::vector<int> started;
    int completed = 0;
    constexpr int kTasks = 8;

    for (int i = 0; i < kTasks; ++i) {
        pool.submit(
            [&, i] {
                {
                    std::lock_guard<std::mutex> lk(mu);
                    started.push_back(i);
                }
                std::this_thread::sleep_for(5ms);
                return i;
            },
            ioc.get_executor(),
            [&](TaskResult<int> r) {
                DOCTEST_CHECK_FALSE(r.ec);
                if (++completed == kTasks) work.reset();
            });
    }
    ioc.run();

    DOCTEST_CHECK_EQ(completed, kTasks);
    DOCTEST_REQUIRE_EQ(started.size(), static_cast<std::size_t>(kTasks));
    for (int i = 0; i < kTasks; ++i) DOCTEST_CHECK_EQ(started[i], i);
    DOCTEST_CHECK_EQ(pool.in_flight(), 0u);
}

DOCTEST_TEST_CASE("OffloadPool rejects work after stop") {
    asio::io_context ioc;
    OffloadPool pool(1);
    pool.stop();
    DOCTEST_CHECK(pool.stopped());

    bool ran = false;
    TaskResult<int> result;
    pool.submit([&] { ran = true; return 1; }, ioc.get_executor(),
                [&](TaskResult<int> r) { result = std::move(r); });
    ioc.run();

    DOCTEST_CHECK_FALSE(ran);
    DOCTEST_CHECK_EQ(result.ec, make_error_code(errc::pool_stopped));
}
