#pragma once

#include "executor.hpp"
#include "task.hpp"

#include <exception>
#include <type_traits>

namespace asyncrw {

template <typename R>
Task<R> Executor::schedule(Task<R>&& task) {
    CoroHandle handle = task.handle();
    PromiseBase& p = handle.promise();
    p.executor = shared_from_this();
    p.executor->schedule(std::move(handle));
    return std::move(task);
}

template <typename R>
Task<R> Executor::next(Task<R>&& task) {
    CoroHandle handle = task.handle();
    PromiseBase& p = handle.promise();
    p.executor = shared_from_this();
    p.executor->next(std::move(handle));
    return std::move(task);
}

template <typename R>
std::future<R> Executor::future(Task<R>&& task) {
    std::promise<R> promise;
    std::future<R> future = promise.get_future();
    // keep the task's own context, the wrapper has none to pass down
    task.promise().enableContextInheritance(false);
    Task<void> wrapper = [](Task<R> task, std::promise<R> promise) -> Task<void> {
        try {
            if constexpr (std::is_void_v<R>) {
                co_await std::move(task);
                promise.set_value();
            } else {
                promise.set_value(co_await std::move(task));
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }(std::move(task), std::move(promise));
    schedule(std::move(wrapper));
    return future;
}

template <typename R>
R Executor::syncWait(Task<R>&& task) {
    std::future<R> f = future(std::move(task));
    return f.get();
}

} // namespace asyncrw
