#pragma once

#include "callback.hpp"
#include "executor.hpp"
#include "handle.hpp"
#include "handle.inl.hpp"
#include "promise_base.hpp"

#include <atomic>
#include <memory>
#include <utility>

namespace asyncrw {

namespace detail {

/**
 * Shared state behind the copies of a single Waker.
 * The status moves forward only: Arming -> Suspended -> Woken, Arming -> Woken or Arming -> Dismissed.
 * Whoever moves it to Woken from Suspended owns the coroutine handle and schedules it, so the coroutine is resumed
 * at most once no matter how many copies of the waker get invoked, from how many threads.
 */
class WakerState : public std::enable_shared_from_this<WakerState> {
public:
    using Ref = std::shared_ptr<WakerState>;

    enum class Status {
        /// The coroutine is still inside await_suspend().
        Arming,
        /// The coroutine is suspended and waits for wake().
        Suspended,
        /// wake() was delivered, the coroutine is resumed or about to be.
        Woken,
        /// The coroutine got what it was waiting for without a wake().
        Dismissed,
    };

    explicit WakerState(CoroHandle handle)
        : _handle(std::move(handle)) {}

    bool wake() noexcept {
        Status status = _status.load(std::memory_order_acquire);
        while (true) {
            switch (status) {
            case Status::Arming:
                // await_suspend() is still running, it will notice the wake up and won't suspend
                if (_status.compare_exchange_weak(
                        status, Status::Woken, std::memory_order_acq_rel, std::memory_order_acquire)) {
                    return true;
                }
                break;
            case Status::Suspended:
                if (_status.compare_exchange_weak(
                        status, Status::Woken, std::memory_order_acq_rel, std::memory_order_acquire)) {
                    CoroHandle handle = std::move(_handle);
                    Executor::Ref executor = handle.promise().executor;
                    executor->schedule(std::move(handle));
                    return true;
                }
                break;
            case Status::Woken:
            case Status::Dismissed:
                return false;
            }
        }
    }

    bool suspend() noexcept {
        Status expected = Status::Arming;
        if (_status.compare_exchange_strong(
                expected, Status::Suspended, std::memory_order_acq_rel, std::memory_order_acquire)) {
            return true;
        }
        _handle.reset();
        return false;
    }

    bool dismiss() noexcept {
        Status expected = Status::Arming;
        const bool dismissed = _status.compare_exchange_strong(
            expected, Status::Dismissed, std::memory_order_acq_rel, std::memory_order_acquire);
        _handle.reset();
        return dismissed;
    }

    Status status() const noexcept {
        return _status.load(std::memory_order_acquire);
    }

    void watchStop(StopToken& token) {
        if (!token) {
            return;
        }
        std::weak_ptr<WakerState> weak = weak_from_this();
        _stopCallback = token.addStopCallback([weak = std::move(weak)]() {
            if (auto state = weak.lock()) {
                state->wake();
            }
        });
    }

private:
    std::atomic<Status> _status = Status::Arming;
    CoroHandle _handle;
    Callback::Ref _stopCallback;
};

} // namespace detail

/**
 * Resumes one suspended coroutine, from any thread.
 * Intended usage inside await_suspend():
 * ```
 * Waker waker = Waker::create(CoroHandle::fromTypedHandle(continuation));
 * registry.add(waker);            // make it reachable for whoever will call wake()
 * if (conditionMet()) {            // re-check after the registration
 *     waker.dismiss();
 *     return false;
 * }
 * return waker.suspend();          // false if wake() arrived in the meantime
 * ```
 * wake() may be called any number of times: the first call reaching a suspended coroutine schedules it on its
 * executor, all other calls are no-ops. A stop request on the coroutine's stop token wakes it as well, so a
 * cancelled coroutine can leave its waker behind in a registry without any harm.
 */
class Waker {
public:
    Waker() = default;

    /// Create a waker in arming state. Call it only from await_suspend() of the coroutine given.
    static Waker create(CoroHandle handle) {
        StopToken token = handle.promise().context.stopToken;
        auto state = std::make_shared<detail::WakerState>(std::move(handle));
        // may call wake() right away if the stop was already requested
        state->watchStop(token);
        return Waker {std::move(state)};
    }

public:
    /// Returns true if this call delivered the wake up, false if the coroutine was already woken or dismissed.
    bool wake() const noexcept {
        return _state && _state->wake();
    }

    /// Ends arming. Returns true if the coroutine should stay suspended, false if it has been woken already
    /// and must continue right away.
    bool suspend() const noexcept {
        return _state->suspend();
    }

    /// Ends arming without suspension, subsequent wake() calls will be ignored.
    /// Returns false if a wake() was delivered before the dismissal.
    bool dismiss() const noexcept {
        return _state->dismiss();
    }

    /// Whether wake() would still resume the coroutine.
    bool pending() const noexcept {
        if (!_state) return false;
        auto status = _state->status();
        return status == detail::WakerState::Status::Arming || status == detail::WakerState::Status::Suspended;
    }

    explicit operator bool() const noexcept {
        return static_cast<bool>(_state);
    }

private:
    explicit Waker(detail::WakerState::Ref state)
        : _state(std::move(state)) {}

private:
    detail::WakerState::Ref _state;
};

} // namespace asyncrw
