#pragma once

#include "lockable.hpp"
#include "../core.hpp"

#include <coroutine>
#include <cstdlib>
#include <mutex>
#include <shared_mutex>

namespace asyncrw {

namespace detail {

/// Single non-blocking acquisition attempt of the given access.
template <AsyncLockable Raw>
bool tryAcquire(Raw& raw, Access access) {
    switch (access) {
    case Access::Shared:
        return raw.try_lock_shared();
    case Access::Exclusive:
        return raw.try_lock();
    case Access::Upgradable:
        if constexpr (UpgradeLockable<Raw>) {
            return raw.try_lock_upgrade();
        }
        break;
    case Access::Upgrade:
        if constexpr (UpgradeLockable<Raw>) {
            return raw.try_unlock_upgrade_and_lock();
        }
        break;
    }
    // upgrade access requested from a lock without the upgrade operations
    std::abort();
}

/// co_await(ed) by the acquisition loops, yields true if the lock got acquired without suspension.
template <AsyncLockable Raw>
struct LockWait {
    Raw* raw;
    Access access;
};

template <AsyncLockable Raw>
class LockWaitAwaitable {
public:
    LockWaitAwaitable(LockWait<Raw> wait, const PromiseBase& promise)
        : _wait(wait)
        , _stopToken(promise.context.stopToken) {}

    bool await_ready() noexcept {
        return false;
    }

    template <typename Promise>
    bool await_suspend(std::coroutine_handle<Promise> continuation) {
        Waker waker = Waker::create(CoroHandle::fromTypedHandle(continuation));
        _wait.raw->register_waker(waker, _wait.access);
        // a release between the failed attempt and the registration above had nobody to wake
        if (tryAcquire(*_wait.raw, _wait.access)) {
            waker.dismiss();
            _acquired = true;
            return false;
        }
        return waker.suspend();
    }

    /// Returns whether the lock is held. Throws if the wait was interrupted by a stop request.
    bool await_resume() {
        if (!_acquired && _stopToken.stopRequested()) {
            // the release which woke this task may have had nobody else to wake
            _wait.raw->forward_wakeup(_wait.access);
            _stopToken.throwIfStopped();
        }
        return _acquired;
    }

private:
    LockWait<Raw> _wait;
    StopToken _stopToken;
    bool _acquired = false;
};

} // namespace detail

template <AsyncLockable Raw>
struct await_ready_trait<detail::LockWait<Raw>> {
    static detail::LockWaitAwaitable<Raw> await_transform(const PromiseBase& promise, detail::LockWait<Raw>&& wait) {
        return detail::LockWaitAwaitable<Raw> {wait, promise};
    }
};

namespace detail {

/**
 * Acquires given access and returns Lock constructed from `args..., std::adopt_lock`.
 * The lock is adopted inside this coroutine, so a stop request arriving after the acquisition can't leave it held
 * without an owner.
 */
template <typename Lock, AsyncLockable Raw, typename... Args>
Task<Lock> acquire(Raw& raw, Access access, Args&... args) {
    while (!tryAcquire(raw, access)) {
        const bool acquired = co_await LockWait<Raw> {&raw, access};
        if (acquired) {
            break;
        }
    }
    co_return Lock {args..., std::adopt_lock};
}

} // namespace detail

/// Acquire shared access without blocking the executor.
/// `auto lock = co_await asyncrw::sharedLock(rawLock);`
template <AsyncLockable Raw>
Task<std::shared_lock<Raw>> sharedLock(Raw& raw) {
    return detail::acquire<std::shared_lock<Raw>>(raw, Access::Shared, raw);
}

/// Acquire exclusive access without blocking the executor.
/// `auto lock = co_await asyncrw::uniqueLock(rawLock);`
template <AsyncLockable Raw>
Task<std::unique_lock<Raw>> uniqueLock(Raw& raw) {
    return detail::acquire<std::unique_lock<Raw>>(raw, Access::Exclusive, raw);
}

} // namespace asyncrw
