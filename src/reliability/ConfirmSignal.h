#ifndef CONFIRM_SIGNAL_H
#define CONFIRM_SIGNAL_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hexilink {

// Single-slot rendezvous between the reader loop (set) and the frame sender
// (reset / waitFor). Only one confirmable frame is outstanding at a time.
class ConfirmSignal {
public:
    ConfirmSignal() : _set(false) {}

    void set() {
        std::lock_guard<std::mutex> lock(_mutex);
        _set = true;
        _cv.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(_mutex);
        _set = false;
    }

    bool isSet() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _set;
    }

    // Returns true as soon as the signal is set, false after timeout.
    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cv.wait_for(lock, timeout, [this] { return _set; });
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    bool _set;
};

} // namespace hexilink

#endif // CONFIRM_SIGNAL_H
