#pragma once

#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace jsonnice {
namespace parallel {

// =============================================================================
// Scheduler concept
// =============================================================================

template<typename S>
concept Scheduler = requires(S& scheduler) {
    { scheduler.spawn([](){}) } -> std::same_as<void>;
};

// =============================================================================
// Thread pool scheduler
// =============================================================================

class thread_pool_t {
public:
    explicit thread_pool_t(std::size_t num_threads) {
        _workers.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            _workers.emplace_back([this] { worker_loop(); });
        }
    }

    ~thread_pool_t() {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _stop = true;
        }
        _cv.notify_all();
        for (auto& worker : _workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    thread_pool_t(const thread_pool_t&) = delete;
    thread_pool_t& operator=(const thread_pool_t&) = delete;

    template<typename F>
    void spawn(F&& task) {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            auto shared_task = std::make_shared<std::decay_t<F>>(std::forward<F>(task));
            _tasks.push([shared_task]() mutable { (*shared_task)(); });
        }
        _cv.notify_one();
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _cv.wait(lock, [this] {
                    return _stop || !_tasks.empty();
                });
                if (_stop && _tasks.empty()) {
                    return;
                }
                if (!_tasks.empty()) {
                    task = std::move(_tasks.front());
                    _tasks.pop();
                }
            }
            if (task) {
                task();
            }
        }
    }

    std::vector<std::thread> _workers;
    std::queue<std::function<void()>> _tasks;
    std::mutex _mutex;
    std::condition_variable _cv;
    bool _stop = false;
};

// =============================================================================
// Task group: tracks every task spawned through it so the owner can join
// all of them (a wait-group barrier). The first exception escaping a task is
// rethrown from wait().
// =============================================================================

template<Scheduler S>
class task_group_t {
public:
    explicit task_group_t(S& scheduler) : _scheduler(scheduler) {}

    ~task_group_t() {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return _in_flight == 0; });
    }

    task_group_t(const task_group_t&) = delete;
    task_group_t& operator=(const task_group_t&) = delete;

    template<typename F>
    void spawn(F&& task) {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            ++_in_flight;
        }
        _scheduler.spawn([this, task = std::forward<F>(task)]() mutable {
            auto error = std::exception_ptr{};
            try {
                task();
            } catch (...) {
                error = std::current_exception();
            }
            finish(error);
        });
    }

    void wait() {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return _in_flight == 0; });
        if (_error) {
            auto error = std::exchange(_error, nullptr);
            std::rethrow_exception(error);
        }
    }

private:
    void finish(std::exception_ptr error) {
        // Notify under the lock: a waiting destructor may free _cv as soon
        // as it observes zero.
        std::unique_lock<std::mutex> lock(_mutex);
        if (error && !_error) {
            _error = error;
        }
        --_in_flight;
        _cv.notify_all();
    }

    S& _scheduler;
    std::size_t _in_flight = 0;
    std::exception_ptr _error;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
};

} // namespace parallel
} // namespace jsonnice
