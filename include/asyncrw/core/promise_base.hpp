#pragma once

#include "awaitable.hpp"
#include "executor.hpp"
#include "handle.hpp"
#include "stop.hpp"
#include "task.fwd.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <type_traits>

namespace asyncrw {

/// Execution context inherited by the tasks co_await(ed) from the task owning it.
struct TaskContext {
    StopToken stopToken = nullptr;
};

/**
 * Part of the task promise independent of the result type.
 * Keeps the executor and the context of the task, the reference count used by CoroHandle, and the continuation,
 * i.e. the task co_await(ing) this one, which is scheduled once this task reaches its final suspend point.
 */
class PromiseBase {
public:
    Executor::Ref executor;
    TaskContext context;

public:
    PromiseBase() = default;

    std::suspend_always initial_suspend() noexcept {
        return {};
    }

    struct FinalAwaiter {
        bool await_ready() noexcept {
            return false;
        }

        template <typename Promise>
        void await_suspend(std::coroutine_handle<Promise> handle) noexcept {
            PromiseBase& promise = handle.promise();
            promise.complete();
        }

        [[noreturn]] void await_resume() noexcept {
            // finished coroutines are never resumed
            std::abort();
        }
    };

    FinalAwaiter final_suspend() noexcept {
        return {};
    }

    void unhandled_exception() noexcept {
        _exception = std::current_exception();
    }

    template <typename U>
    Awaitable<Task<U>> await_transform(Task<U>&& task);

    template <typename T>
    decltype(auto) await_transform(T&& obj) {
        return await_ready_trait<std::remove_cvref_t<T>>::await_transform(*this, std::forward<T>(obj));
    }

public:
    /// Set the task to resume after this one, it is scheduled right away if this one has already finished.
    void set_continuation(CoroHandle&& next) {
        std::scoped_lock lock {_mutex};
        _continuation = std::move(next);
        if (_finished) {
            resumeContinuation();
        }
    }

    bool finished() const {
        std::scoped_lock lock {_mutex};
        return _finished;
    }

    /// Tasks started through Executor::future() keep their own context instead of the wrapper's empty one.
    void enableContextInheritance(bool inherit) {
        _inheritContext = inherit;
    }

    void inheritContext(const PromiseBase& parent) {
        if (_inheritContext) [[likely]] {
            context = parent.context;
        }
    }

protected:
    /// Rethrows the exception which escaped the coroutine body, if any.
    void rethrowIfFailed() const {
        if (_exception) {
            std::rethrow_exception(_exception);
        }
    }

private:
    void complete() {
        std::scoped_lock lock {_mutex};
        _finished = true;
        resumeContinuation();
    }

    void resumeContinuation() {
        if (!_continuation) {
            return;
        }
        Executor::Ref target = _continuation.promise().executor;
        // the awaiting task on the same executor goes first, it is what the executor was busy with
        if (target == executor) {
            target->next(_continuation);
        } else {
            target->schedule(_continuation);
        }
    }

private:
    friend class CoroHandle;
    std::atomic<size_t> _useCount = 0;

    std::exception_ptr _exception;
    CoroHandle _continuation;

    mutable std::mutex _mutex;
    bool _finished = false;
    bool _inheritContext = true;
};

inline const StopToken& detail::stopTokenOf(const PromiseBase& promise) {
    return promise.context.stopToken;
}

/// Helper to easily access to the current executor within the coroutine.
/// const Executor::Ref& executor = co_await asyncrw::currentExecutor;
struct ExecutorAwaitable {};
inline ExecutorAwaitable currentExecutor;

template <>
struct await_ready_trait<ExecutorAwaitable> {
    static ReadyAwaitable<const Executor::Ref> await_transform(const PromiseBase& promise, ExecutorAwaitable) {
        return {promise.executor};
    }
};

/// Stop token of the current task.
/// const StopToken& token = co_await asyncrw::currentStopToken;
struct StopTokenAwaitable {};
inline StopTokenAwaitable currentStopToken;

template <>
struct await_ready_trait<StopTokenAwaitable> {
    static ReadyAwaitable<const StopToken> await_transform(const PromiseBase& promise, StopTokenAwaitable) {
        return {promise.context.stopToken};
    }
};

} // namespace asyncrw
