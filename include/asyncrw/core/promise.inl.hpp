#pragma once

#include "promise.hpp"
#include "task.hpp"

namespace asyncrw {

template <typename R>
Task<R> Promise<R>::get_return_object() {
    return Task<R> {CoroHandle::fromTypedHandle(handle_t::from_promise(*this))};
}

inline Task<void> Promise<void>::get_return_object() {
    return Task<void> {CoroHandle::fromTypedHandle(handle_t::from_promise(*this))};
}

template <typename U>
Awaitable<Task<U>> PromiseBase::await_transform(Task<U>&& task) {
    return Awaitable<Task<U>> {std::move(task)};
}

} // namespace asyncrw
