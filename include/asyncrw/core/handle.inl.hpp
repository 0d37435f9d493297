#pragma once

#include "handle.hpp"
#include "promise_base.hpp"

#include <utility>

namespace asyncrw {

template <typename Promise>
CoroHandle CoroHandle::fromTypedHandle(std::coroutine_handle<Promise> handle) {
    PromiseBase& promise = handle.promise();
    return CoroHandle {handle, &promise};
}

inline CoroHandle::CoroHandle(handle_t handle, PromiseBase* promise)
    : _handle(handle)
    , _promise(promise) {
    retain();
}

inline CoroHandle::CoroHandle(std::nullptr_t) {}

inline CoroHandle::~CoroHandle() {
    reset();
}

inline CoroHandle::CoroHandle(const CoroHandle& other)
    : _handle(other._handle)
    , _promise(other._promise) {
    retain();
}

inline CoroHandle::CoroHandle(CoroHandle&& other) noexcept
    : _handle(std::exchange(other._handle, nullptr))
    , _promise(std::exchange(other._promise, nullptr)) {}

inline CoroHandle& CoroHandle::operator=(const CoroHandle& other) {
    // the copy holds its own reference, so self assignment and assigning a handle to the same frame are fine
    CoroHandle copy {other};
    return *this = std::move(copy);
}

inline CoroHandle& CoroHandle::operator=(CoroHandle&& other) noexcept {
    if (this != &other) {
        reset();
        _handle = std::exchange(other._handle, nullptr);
        _promise = std::exchange(other._promise, nullptr);
    }
    return *this;
}

inline void CoroHandle::retain() const noexcept {
    if (_promise) {
        _promise->_useCount.fetch_add(1, std::memory_order_relaxed);
    }
}

inline void CoroHandle::reset() {
    handle_t handle = std::exchange(_handle, nullptr);
    PromiseBase* promise = std::exchange(_promise, nullptr);
    if (promise && promise->_useCount.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        handle.destroy();
    }
}

template <typename T>
T& CoroHandle::promise() {
    return static_cast<T&>(*_promise);
}

template <typename T>
const T& CoroHandle::promise() const {
    return static_cast<const T&>(*_promise);
}

inline CoroHandle::handle_t CoroHandle::handle() const {
    return _handle;
}

inline bool CoroHandle::done() const {
    return _handle.done();
}

inline void CoroHandle::resume() {
    _handle.resume();
}

inline CoroHandle::operator bool() const {
    return static_cast<bool>(_handle);
}

inline bool CoroHandle::operator==(const CoroHandle& other) const noexcept {
    return _handle == other._handle;
}

inline std::strong_ordering CoroHandle::operator<=>(const CoroHandle& other) const noexcept {
    return _handle <=> other._handle;
}

} // namespace asyncrw
