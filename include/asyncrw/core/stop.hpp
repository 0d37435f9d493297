#pragma once

#include "callback.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace asyncrw {

/// Default exception thrown into the tasks whose stop was requested.
class StopError : public std::runtime_error {
public:
    StopError()
        : std::runtime_error("Stop was requested via stop token.") {}
};

namespace detail {

/// State shared between a StopSource and its tokens.
class StopState {
public:
    explicit StopState(std::exception_ptr exception)
        : _exception(exception ? std::move(exception) : std::make_exception_ptr(StopError {})) {}

    /// Raises the flag and runs the registered callbacks, only the first call has an effect.
    void request() noexcept {
        std::vector<Callback::WeakRef> pending;
        {
            std::scoped_lock lock {_mutex};
            if (_requested.exchange(true)) {
                return;
            }
            pending.swap(_callbacks);
        }
        // outside of the mutex, a callback may resume a task which checks the flag right away
        for (const auto& weak : pending) {
            runIfAlive(weak);
        }
    }

    bool requested() const noexcept {
        return _requested.load();
    }

    /// Keeps a weak reference to the callback, or runs it in place when the stop is already requested.
    void subscribe(Callback::WeakRef callback) {
        {
            std::scoped_lock lock {_mutex};
            if (!_requested) {
                _callbacks.push_back(std::move(callback));
                return;
            }
        }
        runIfAlive(callback);
    }

    [[noreturn]] void rethrow() const {
        std::rethrow_exception(_exception);
    }

private:
    static void runIfAlive(const Callback::WeakRef& weak) noexcept {
        if (auto callback = weak.lock()) {
            callback->invoke();
        }
    }

private:
    std::mutex _mutex;
    std::atomic<bool> _requested = false;
    std::vector<Callback::WeakRef> _callbacks;
    const std::exception_ptr _exception;
};

} // namespace detail

/**
 * Observer side of a StopSource, carried in the context of a task and inherited by the tasks it co_await(s).
 * Default constructed token is never stopped.
 */
class StopToken {
public:
    StopToken() = default;
    StopToken(std::nullptr_t) {}

public:
    bool stopRequested() const noexcept {
        return _state && _state->requested();
    }

    /// Throws the exception of the stop source if stop was requested.
    void throwIfStopped() const {
        if (stopRequested()) {
            _state->rethrow();
        }
    }

    /// Detach from the stop source, the token will never report stop afterwards.
    void reset() {
        _state.reset();
    }

    /**
     * Register a function to be called once stop is requested, or right away if it already was.
     * The registration lasts as long as the returned reference, an empty one is returned by a detached token.
     */
    Callback::Ref addStopCallback(Callback::Func func) {
        if (!_state) {
            return {};
        }
        Callback::Ref callback = Callback::create(std::move(func));
        _state->subscribe(callback);
        return callback;
    }

    bool operator==(const StopToken& other) const {
        return _state == other._state;
    }

    explicit operator bool() const {
        return _state != nullptr;
    }

private:
    friend class StopSource;

    explicit StopToken(std::shared_ptr<detail::StopState> state)
        : _state(std::move(state)) {}

private:
    std::shared_ptr<detail::StopState> _state;
};

/// Requests stop of every task carrying one of its tokens. With a custom exception the stopped tasks throw it
/// instead of StopError.
class StopSource {
public:
    StopSource(std::exception_ptr exception = nullptr)
        : _state(std::make_shared<detail::StopState>(std::move(exception))) {}

public:
    StopToken token() const noexcept {
        return StopToken {_state};
    }

    void requestStop() noexcept {
        _state->request();
    }

    bool stopRequested() const noexcept {
        return _state->requested();
    }

private:
    std::shared_ptr<detail::StopState> _state;
};

} // namespace asyncrw
