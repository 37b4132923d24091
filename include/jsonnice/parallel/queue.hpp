#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace jsonnice {
namespace parallel {

// =============================================================================
// Blocking queue (analogous to Go channels)
//
// Any number of senders, any number of receivers. After close(), send() is
// refused and recv() keeps returning queued items until the queue is empty,
// then returns nullopt.
// =============================================================================

template<typename T>
class blocking_queue {
public:
    auto send(T item) -> bool {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            if (_closed) {
                return false;
            }
            _queue.push(std::move(item));
        }
        _cv.notify_one();
        return true;
    }

    std::optional<T> recv() {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return !_queue.empty() || _closed; });
        if (_queue.empty()) {
            return std::nullopt;
        }
        auto item = std::move(_queue.front());
        _queue.pop();
        return item;
    }

    void close() {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

private:
    std::queue<T> _queue;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    bool _closed = false;
};

} // namespace parallel
} // namespace jsonnice
