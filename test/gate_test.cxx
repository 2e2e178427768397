#include <Forerunner/parallel/gate.hxx>
#include <StormByte/test_handlers.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stop_token>
#include <thread>
#include <vector>

using Forerunner::Parallel::Gate;

int test_gate_initial_tokens() {
    Gate gate(3);
    ASSERT_EQUAL("capacity", gate.Capacity(), static_cast<std::size_t>(3));
    ASSERT_EQUAL("all available", gate.Available(), static_cast<std::size_t>(3));
    ASSERT_EQUAL("none in use", gate.InUse(), static_cast<std::size_t>(0));
    ASSERT_FALSE("not closed", gate.IsClosed());
    RETURN_TEST("test_gate_initial_tokens", 0);
}

int test_gate_try_acquire_until_exhausted() {
    Gate gate(2);
    ASSERT_TRUE("first token", gate.TryAcquire());
    ASSERT_TRUE("second token", gate.TryAcquire());
    ASSERT_FALSE("no third token", gate.TryAcquire());
    ASSERT_EQUAL("in use", gate.InUse(), static_cast<std::size_t>(2));
    ASSERT_EQUAL("peak", gate.Peak(), static_cast<std::size_t>(2));
    RETURN_TEST("test_gate_try_acquire_until_exhausted", 0);
}

int test_gate_release_never_exceeds_capacity() {
    Gate gate(2);
    ASSERT_FALSE("release on full gate", gate.Release());
    ASSERT_TRUE("acquire", gate.Acquire());
    ASSERT_TRUE("release held token", gate.Release());
    ASSERT_FALSE("second release ignored", gate.Release());
    ASSERT_EQUAL("available", gate.Available(), static_cast<std::size_t>(2));
    RETURN_TEST("test_gate_release_never_exceeds_capacity", 0);
}

int test_gate_acquire_blocks_until_release() {
    Gate gate(1);
    ASSERT_TRUE("take only token", gate.Acquire());

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        acquired.store(gate.Acquire());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    ASSERT_FALSE("waiter still blocked", acquired.load());

    gate.Release();
    waiter.join();

    ASSERT_TRUE("waiter got released token", acquired.load());
    ASSERT_EQUAL("token held by waiter", gate.InUse(), static_cast<std::size_t>(1));
    RETURN_TEST("test_gate_acquire_blocks_until_release", 0);
}

int test_gate_acquire_aborted_by_stop() {
    Gate gate(1);
    gate.Acquire();

    std::stop_source stop;
    std::atomic<bool> returned{false};
    std::atomic<bool> result{true};
    std::thread waiter([&]() {
        result.store(gate.Acquire(stop.get_token()));
        returned.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_FALSE("blocked before stop", returned.load());
    stop.request_stop();
    waiter.join();

    ASSERT_TRUE("waiter returned", returned.load());
    ASSERT_FALSE("acquire reported abort", result.load());
    ASSERT_EQUAL("no extra token taken", gate.InUse(), static_cast<std::size_t>(1));
    RETURN_TEST("test_gate_acquire_aborted_by_stop", 0);
}

int test_gate_acquire_with_stopped_token_fails_fast() {
    Gate gate(4);
    std::stop_source stop;
    stop.request_stop();
    ASSERT_FALSE("stopped token never acquires", gate.Acquire(stop.get_token()));
    ASSERT_EQUAL("nothing taken", gate.InUse(), static_cast<std::size_t>(0));
    RETURN_TEST("test_gate_acquire_with_stopped_token_fails_fast", 0);
}

int test_gate_close_releases_all_waiters() {
    Gate gate(1);
    gate.Acquire();

    std::atomic<int> aborted{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&]() {
            if (!gate.Acquire()) aborted.fetch_add(1);
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gate.Close();
    for (auto& t : waiters) t.join();

    ASSERT_EQUAL("every waiter aborted", aborted.load(), 4);
    ASSERT_TRUE("gate closed", gate.IsClosed());
    ASSERT_FALSE("closed gate refuses", gate.TryAcquire());
    ASSERT_TRUE("release still accepted", gate.Release());
    RETURN_TEST("test_gate_close_releases_all_waiters", 0);
}

int test_gate_bound_under_contention() {
    const std::size_t capacity = 3;
    Gate gate(capacity);
    std::atomic<std::size_t> holders{0};
    std::atomic<std::size_t> max_holders{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                gate.Acquire();
                std::size_t now = holders.fetch_add(1) + 1;
                std::size_t seen = max_holders.load();
                while (now > seen && !max_holders.compare_exchange_weak(seen, now)) {}
                std::this_thread::yield();
                holders.fetch_sub(1);
                gate.Release();
            }
        });
    }
    for (auto& t : threads) t.join();

    ASSERT_TRUE("holders never exceeded capacity", max_holders.load() <= capacity);
    ASSERT_TRUE("peak never exceeded capacity", gate.Peak() <= capacity);
    ASSERT_EQUAL("all tokens returned", gate.Available(), capacity);
    RETURN_TEST("test_gate_bound_under_contention", 0);
}

int main() {
    int result = 0;
    result += test_gate_initial_tokens();
    result += test_gate_try_acquire_until_exhausted();
    result += test_gate_release_never_exceeds_capacity();
    result += test_gate_acquire_blocks_until_release();
    result += test_gate_acquire_aborted_by_stop();
    result += test_gate_acquire_with_stopped_token_fails_fast();
    result += test_gate_close_releases_all_waiters();
    result += test_gate_bound_under_contention();

    if (result == 0) {
        std::cout << "Gate tests passed!" << std::endl;
    } else {
        std::cout << result << " Gate tests failed." << std::endl;
    }
    return result;
}
