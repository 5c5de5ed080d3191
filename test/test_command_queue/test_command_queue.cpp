#include <unity.h>
#include "idasen_tray/command_queue.hpp"

#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace idasen_tray;

static CommandQueue* queue;

void setUp() {
    queue = new CommandQueue();
}

void tearDown() {
    delete queue;
}

// =============================================================================
// Ordering
// =============================================================================

void test_commands_run_in_arrival_order() {
    std::vector<int> order;
    for (int i = 0; i < 50; i++) {
        queue->post([&order, i] { order.push_back(i); });
    }
    queue->submit([] {}).wait();

    TEST_ASSERT_EQUAL(50, static_cast<int>(order.size()));
    for (int i = 0; i < 50; i++) {
        TEST_ASSERT_EQUAL(i, order[i]);
    }
}

void test_commands_run_off_the_caller_thread() {
    const auto caller = std::this_thread::get_id();
    auto worker = queue->submit([] { return std::this_thread::get_id(); }).get();

    TEST_ASSERT_TRUE(worker != caller);
}

void test_submit_returns_command_result() {
    auto answer = queue->submit([] { return std::string("stand"); });

    TEST_ASSERT_EQUAL_STRING("stand", answer.get().c_str());
}

void test_submit_propagates_exceptions() {
    auto failing = queue->submit([]() -> int { throw std::runtime_error("boom"); });

    bool threw = false;
    try {
        failing.get();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);

    // Worker survives a throwing command
    TEST_ASSERT_EQUAL(3, queue->submit([] { return 3; }).get());
}

void test_throwing_posted_command_does_not_stop_worker() {
    queue->post([] { throw std::runtime_error("positions file vanished"); });
    queue->post([] { throw std::logic_error("second failure"); });

    TEST_ASSERT_EQUAL(7, queue->submit([] { return 7; }).get());
}

// =============================================================================
// Stop
// =============================================================================

void test_post_after_stop_is_rejected() {
    queue->stop();

    TEST_ASSERT_FALSE(queue->post([] {}));
}

void test_stop_drops_pending_commands() {
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    queue->post([gate_future] { gate_future.wait(); });
    auto pending = queue->submit([] { return 1; });

    std::thread stopper([] { queue->stop(); });
    while (queue->post([] {})) {
        std::this_thread::yield();
    }
    gate.set_value();
    stopper.join();

    bool broken = false;
    try {
        pending.get();
    } catch (const std::future_error& e) {
        broken = e.code() == std::future_errc::broken_promise;
    }
    TEST_ASSERT_TRUE(broken);
}

void test_stop_twice_is_safe() {
    queue->stop();
    queue->stop();

    TEST_ASSERT_FALSE(queue->post([] {}));
}

// =============================================================================
// Test Runner
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_commands_run_in_arrival_order);
    RUN_TEST(test_commands_run_off_the_caller_thread);
    RUN_TEST(test_submit_returns_command_result);
    RUN_TEST(test_submit_propagates_exceptions);
    RUN_TEST(test_throwing_posted_command_does_not_stop_worker);

    RUN_TEST(test_post_after_stop_is_rejected);
    RUN_TEST(test_stop_drops_pending_commands);
    RUN_TEST(test_stop_twice_is_safe);

    return UNITY_END();
}
