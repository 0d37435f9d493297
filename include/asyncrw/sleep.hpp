#pragma once

#include "core.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace asyncrw {

namespace detail {

/// Fires registered callbacks at their deadlines from a dedicated thread.
class TimedScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    TimedScheduler() {
        _thread = std::thread([this] { loop(); });
    }

    ~TimedScheduler() {
        {
            std::scoped_lock lock {_mutex};
            _loop = false;
        }
        _cv.notify_one();
        _thread.join();
    }

    void timeout(std::chrono::milliseconds time, Callback::WeakRef callback) {
        const auto deadline = Clock::now() + time;
        {
            std::scoped_lock lock {_mutex};
            _timeouts[deadline].push_back(std::move(callback));
        }
        _cv.notify_one();
    }

    static TimedScheduler& instance() {
        static TimedScheduler scheduler;
        return scheduler;
    }

private:
    void loop() {
        std::unique_lock lock {_mutex};
        while (_loop) {
            if (_timeouts.empty()) {
                _cv.wait(lock, [this] { return !_loop || !_timeouts.empty(); });
                continue;
            }
            // woken up either by a new earlier deadline or by the current one
            _cv.wait_until(lock, _timeouts.begin()->first);
            auto fired = collectFired();
            lock.unlock();
            for (auto& weakCB : fired) {
                if (auto callback = weakCB.lock()) {
                    callback->invoke();
                }
            }
            lock.lock();
        }
    }

    std::vector<Callback::WeakRef> collectFired() {
        std::vector<Callback::WeakRef> fired;
        const auto now = Clock::now();
        auto it = _timeouts.begin();
        for (; it != _timeouts.end() && now >= it->first; ++it) {
            for (auto& weakCB : it->second) {
                fired.push_back(std::move(weakCB));
            }
        }
        _timeouts.erase(_timeouts.begin(), it);
        return fired;
    }

private:
    std::thread _thread;
    std::map<TimePoint, std::vector<Callback::WeakRef>> _timeouts;
    std::condition_variable _cv;
    std::mutex _mutex;
    bool _loop = true;
};

class SleepAwaitable {
public:
    SleepAwaitable(uint32_t sleep)
        : _sleep(sleep) {}

    SleepAwaitable(uint32_t sleep, const PromiseBase& promise)
        : _sleep(sleep)
        , _stopToken(promise.context.stopToken) {}

    bool await_ready() noexcept {
        return false;
    }

    template <typename Promise>
    bool await_suspend(std::coroutine_handle<Promise> continuation) {
        Waker waker = Waker::create(CoroHandle::fromTypedHandle(continuation));
        _callback = Callback::create([waker]() { waker.wake(); });
        TimedScheduler::instance().timeout(std::chrono::milliseconds {_sleep}, _callback);
        return waker.suspend();
    }

    /// Throws if the sleep was interrupted by a stop request.
    void await_resume() {
        _callback.reset();
        _stopToken.throwIfStopped();
    }

private:
    friend struct asyncrw::await_ready_trait<SleepAwaitable>;

    uint32_t _sleep;
    StopToken _stopToken;
    Callback::Ref _callback;
};

} // namespace detail

/// Suspend current task for given amount of milliseconds, without blocking the executor.
inline detail::SleepAwaitable sleep(uint32_t milliseconds) {
    return detail::SleepAwaitable {milliseconds};
}

template <>
struct await_ready_trait<detail::SleepAwaitable> {
    static detail::SleepAwaitable await_transform(const PromiseBase& promise, detail::SleepAwaitable&& awaitable) {
        return detail::SleepAwaitable {awaitable._sleep, promise};
    }
};

} // namespace asyncrw
