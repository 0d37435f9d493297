#pragma once

#include "handle.hpp"
#include "stop.hpp"
#include "../detail/utils.hpp"

#include <coroutine>
#include <type_traits>
#include <utility>

namespace asyncrw {

class PromiseBase;

namespace detail {
/// Stop token of the task owning given promise, defined next to PromiseBase.
const StopToken& stopTokenOf(const PromiseBase& promise);
} // namespace detail

/**
 * Customization point of co_await inside tasks.
 * Every type T that should be co_await(able) from a Task needs a specialization providing
 * `static <awaitable> await_transform(PromiseBase& promise, T&& value)`, so the awaitable gets access to the
 * executor and the context of the awaiting task.
 */
template <typename T>
struct await_ready_trait {
    static T&& await_transform(const PromiseBase&, T&&) {
        static_assert(detail::False<T>, "Specialize this template for desired awaitable type.");
    }
};

/// Never suspends, yields a reference to a part of the awaiting task's state.
template <typename R>
struct ReadyAwaitable {
    R& result;

    bool await_ready() noexcept {
        return true;
    }

    void await_suspend(std::coroutine_handle<>) noexcept {}

    R& await_resume() noexcept {
        return result;
    }
};

/// Awaitable for co_await(ing) one task from another.
template <typename Task>
class Awaitable {
public:
    using Return = typename Task::Type;

    Awaitable(Task&& task)
        : _task(std::move(task)) {}

    Awaitable(Awaitable&&) = default;

    Awaitable& operator=(Awaitable&&) = default;

    bool await_ready() const noexcept {
        return false;
    }

    template <typename Promise>
    void await_suspend(std::coroutine_handle<Promise> awaiter) noexcept {
        CoroHandle awaitingHandle = CoroHandle::fromTypedHandle(awaiter);
        auto& awaitingPromise = awaiter.promise();
        auto& taskPromise = _task.promise();
        _awaiting = &awaitingPromise;
        if (taskPromise.executor == nullptr) {
            // if task is not scheduled on any executor,
            // copy awaiter task context and schedule on the same executor
            taskPromise.executor = awaitingPromise.executor;
            taskPromise.inheritContext(awaitingPromise);
            // schedule new task via next() to ensure that the call hierarchy has precedence.
            taskPromise.executor->next(_task.handle());
        }
        // Must stay the last statement, the awaiter may be resumed on another thread right after it.
        taskPromise.set_continuation(std::move(awaitingHandle));
    }

    Return await_resume() {
        // eagerly destroy completed task at the end of the scope
        detail::AtExit exit {[this]() noexcept { _task.reset(); }};

        detail::stopTokenOf(*_awaiting).throwIfStopped();

        if constexpr (std::is_void_v<Return>) {
            _task.promise().value();
        } else {
            return std::move(_task.promise()).value();
        }
    }

private:
    Task _task;
    PromiseBase* _awaiting = nullptr;
};

} // namespace asyncrw
