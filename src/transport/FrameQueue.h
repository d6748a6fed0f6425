#ifndef FRAME_QUEUE_H
#define FRAME_QUEUE_H

#include <stddef.h>

#include <condition_variable>
#include <mutex>

#include <etl/queue.h>

namespace hexilink {

// Bounded FIFO shared by producer and consumer threads. push() blocks while
// the queue is full, so nothing is ever dropped. close() wakes every waiter;
// after that push() refuses new items and pop() drains what is left.
template <typename T, size_t N>
class FrameQueue {
public:
    FrameQueue() : _closed(false) {}

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    bool push(const T& item) {
        std::unique_lock<std::mutex> lock(_mutex);
        _not_full.wait(lock, [this] { return _closed || !_items.full(); });
        if (_closed) {
            return false;
        }
        _items.push(item);
        _not_empty.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(_mutex);
        _not_empty.wait(lock, [this] { return _closed || !_items.empty(); });
        if (_items.empty()) {
            return false;
        }
        out = _items.front();
        _items.pop();
        _not_full.notify_one();
        return true;
    }

    // Non-blocking variant used by tests and drains.
    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_items.empty()) {
            return false;
        }
        out = _items.front();
        _items.pop();
        _not_full.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(_mutex);
        _closed = true;
        _not_empty.notify_all();
        _not_full.notify_all();
    }

    // Re-arms a closed queue and discards its contents.
    void reopen() {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.clear();
        _closed = false;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _closed;
    }

    static constexpr size_t capacity() { return N; }

private:
    mutable std::mutex _mutex;
    std::condition_variable _not_empty;
    std::condition_variable _not_full;
    etl::queue<T, N> _items;
    bool _closed;
};

} // namespace hexilink

#endif // FRAME_QUEUE_H
