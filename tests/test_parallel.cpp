#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include "jsonnice/parallel/queue.hpp"
#include "jsonnice/parallel/scheduler.hpp"

using namespace jsonnice::parallel;

void test_queue_fifo() {
    auto q = blocking_queue<int>{};
    for (int i = 0; i < 5; ++i) {
        assert(q.send(i));
    }
    for (int i = 0; i < 5; ++i) {
        assert(q.recv() == i);
    }

    std::cout << "test_queue_fifo: PASSED\n";
}

void test_queue_close_drains_then_ends() {
    auto q = blocking_queue<int>{};
    q.send(1);
    q.send(2);
    q.close();

    assert(!q.send(3));
    assert(q.recv() == 1);
    assert(q.recv() == 2);
    assert(!q.recv());

    std::cout << "test_queue_close_drains_then_ends: PASSED\n";
}

void test_queue_close_wakes_receiver() {
    auto q = blocking_queue<int>{};
    auto got = std::optional<int>{42};
    auto receiver = std::thread([&] { got = q.recv(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.close();
    receiver.join();
    assert(!got);

    std::cout << "test_queue_close_wakes_receiver: PASSED\n";
}

void test_task_group_waits_for_all() {
    auto pool = thread_pool_t{4};
    auto group = task_group_t<thread_pool_t>{pool};
    auto done = std::atomic<int>{0};

    for (int i = 0; i < 32; ++i) {
        group.spawn([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++done;
        });
    }
    group.wait();
    assert(done == 32);

    std::cout << "test_task_group_waits_for_all: PASSED\n";
}

void test_task_group_rethrows_first_error() {
    auto pool = thread_pool_t{2};
    auto group = task_group_t<thread_pool_t>{pool};
    auto ran = std::atomic<int>{0};

    group.spawn([] { throw std::runtime_error("boom"); });
    group.spawn([&ran] { ++ran; });

    auto caught = false;
    try {
        group.wait();
    } catch (const std::runtime_error& e) {
        caught = std::string(e.what()) == "boom";
    }
    assert(caught);
    assert(ran == 1);

    // The error is reported once
    group.wait();

    std::cout << "test_task_group_rethrows_first_error: PASSED\n";
}

int main() {
    test_queue_fifo();
    test_queue_close_drains_then_ends();
    test_queue_close_wakes_receiver();
    test_task_group_waits_for_all();
    test_task_group_rethrows_first_error();

    std::cout << "All parallel tests passed!\n";
    return 0;
}
