#pragma once

#include "lockable.hpp"
#include "../core/waker.hpp"
#include "../detail/containers.hpp"
#include "../detail/once_cell.hpp"
#include "../detail/spinlock.hpp"

#include <boost/thread/shared_mutex.hpp>

#include <cstdlib>
#include <mutex>
#include <optional>
#include <utility>

namespace asyncrw {

namespace detail {

struct Waiter {
    Waker waker;
    Access access;
};

using WaiterQueue = Queue<Waiter>;

} // namespace detail

/**
 * Reader/writer lock usable from tasks without blocking the executor threads.
 * Wraps a synchronous reader/writer lock and keeps all of its operations, so it can be used wherever the wrapped
 * lock is expected (std::unique_lock, std::shared_lock, RwLock...). On top of that tasks which failed to acquire it
 * can register a Waker, which is invoked when some holder releases the lock.
 *
 * Registration alone does not close the race with a concurrent release: a release which happens after the failed
 * attempt but before the registration finds nobody to wake. So whoever registers must retry the acquisition right
 * after the registration and suspend only if the retry fails as well. Push and pop on the waiters queue are
 * serialized by a spin lock, which is held only for the duration of a single push or pop and never while calling
 * the wrapped lock.
 *
 * Releases wake the first waiter whose task is still suspended. When that waiter is not after exclusive access,
 * the shared waiters queued right behind it are woken too, as they can most likely share the lock with it.
 * Releasing a shared hold first wakes the task waiting to upgrade its upgradable access, if there is one.
 *
 * A task may be resumed on another thread than the one it acquired the lock on, so the wrapped lock must allow
 * release from any thread. boost::shared_mutex does, std::shared_mutex does not.
 *
 * Destroying the lock while any task is still suspended on it aborts the process.
 */
template <SharedLockable Inner = boost::shared_mutex>
class AsyncRawRwLock {
public:
    using InnerLock = Inner;

    AsyncRawRwLock() = default;

    AsyncRawRwLock(const AsyncRawRwLock&) = delete;
    AsyncRawRwLock& operator=(const AsyncRawRwLock&) = delete;

    ~AsyncRawRwLock() {
        if (auto* waiters = _waiters.peek()) {
            while (auto waiter = waiters->pop()) {
                if (waiter->waker.pending()) {
                    std::abort();
                }
            }
        }
        if (_upgrader.pending()) {
            std::abort();
        }
    }

public:
    void lock_shared() {
        waiters();
        _inner.lock_shared();
    }

    bool try_lock_shared() {
        waiters();
        return _inner.try_lock_shared();
    }

    void unlock_shared() {
        _inner.unlock_shared();
        if constexpr (UpgradeLockable<Inner>) {
            if (wakeUpgrader()) {
                return;
            }
        }
        wakeWaiters();
    }

    void lock() {
        waiters();
        _inner.lock();
    }

    bool try_lock() {
        waiters();
        return _inner.try_lock();
    }

    void unlock() {
        _inner.unlock();
        wakeWaiters();
    }

public:
    void lock_upgrade()
        requires UpgradeLockable<Inner>
    {
        waiters();
        _inner.lock_upgrade();
    }

    bool try_lock_upgrade()
        requires UpgradeLockable<Inner>
    {
        waiters();
        return _inner.try_lock_upgrade();
    }

    void unlock_upgrade()
        requires UpgradeLockable<Inner>
    {
        _inner.unlock_upgrade();
        wakeWaiters();
    }

    /// Blocks until all shared holders are gone. Frees no capacity, so nobody is woken.
    void unlock_upgrade_and_lock()
        requires UpgradeLockable<Inner>
    {
        _inner.unlock_upgrade_and_lock();
    }

    bool try_unlock_upgrade_and_lock()
        requires UpgradeLockable<Inner>
    {
        return _inner.try_unlock_upgrade_and_lock();
    }

    void unlock_and_lock_upgrade()
        requires UpgradeLockable<Inner>
    {
        _inner.unlock_and_lock_upgrade();
        wakeWaiters();
    }

    void unlock_and_lock_shared()
        requires UpgradeLockable<Inner>
    {
        _inner.unlock_and_lock_shared();
        wakeWaiters();
    }

    void unlock_upgrade_and_lock_shared()
        requires UpgradeLockable<Inner>
    {
        _inner.unlock_upgrade_and_lock_shared();
        wakeWaiters();
    }

public:
    /**
     * Register the waker of a task which failed to acquire the lock with given access.
     * The caller must retry the acquisition after this call before suspending.
     * Access::Upgrade is reserved to the holder of upgradable access waiting for the readers to leave; there is
     * at most one such task at a time and it is woken before any other waiter when a reader leaves.
     */
    void register_waker(Waker waker, Access access = Access::Exclusive) {
        if (access == Access::Upgrade) {
            {
                std::scoped_lock lock {_locking};
                std::swap(_upgrader, waker);
            }
            // the replaced waker is released here, outside of the spin lock
            return;
        }
        auto& queue = waiters();
        std::scoped_lock lock {_locking};
        queue.push(detail::Waiter {std::move(waker), access});
    }

    /**
     * Called by a woken task which gives up without acquiring the lock, e.g. because its wait got stopped.
     * The wake up it may have consumed is handed to the waiters as if the lock was released once more.
     * A task waiting with Access::Upgrade keeps upgradable access until it leaves, and releasing it wakes the queue.
     */
    void forward_wakeup(Access access) {
        if (access != Access::Upgrade) {
            wakeWaiters();
        }
    }

    /// Wake a single registered waiter without releasing anything.
    /// Returns false if there was no suspended waiter to wake.
    bool notify_one() {
        return wakeFirst().has_value();
    }

    /// Wake all registered waiters, they will race for the lock again.
    void notify_all() {
        if constexpr (UpgradeLockable<Inner>) {
            wakeUpgrader();
        }
        while (wakeFirst()) {
        }
    }

private:
    detail::WaiterQueue& waiters() {
        return _waiters.get();
    }

    /// Pops waiters until one of them accepts the wake up, returns the access it is waiting for.
    std::optional<Access> wakeFirst() {
        auto* queue = _waiters.peek();
        if (!queue) {
            return std::nullopt;
        }
        while (true) {
            std::optional<detail::Waiter> waiter;
            {
                std::scoped_lock lock {_locking};
                waiter = queue->pop();
            }
            if (!waiter) {
                return std::nullopt;
            }
            // waiters cancelled or dismissed meanwhile reject the wake up, it goes to the next one
            if (waiter->waker.wake()) {
                return waiter->access;
            }
        }
    }

    void wakeSharedRun() {
        auto* queue = _waiters.peek();
        while (true) {
            std::optional<detail::Waiter> waiter;
            {
                std::scoped_lock lock {_locking};
                waiter = queue->popIf([](const detail::Waiter& w) { return w.access == Access::Shared; });
            }
            if (!waiter) {
                return;
            }
            waiter->waker.wake();
        }
    }

    void wakeWaiters() {
        auto access = wakeFirst();
        if (access && *access != Access::Exclusive) {
            wakeSharedRun();
        }
    }

    bool wakeUpgrader() {
        Waker upgrader;
        {
            std::scoped_lock lock {_locking};
            upgrader = std::move(_upgrader);
        }
        return upgrader.wake();
    }

private:
    detail::SpinLock _locking;
    detail::OnceCell<detail::WaiterQueue> _waiters;
    Waker _upgrader;
    Inner _inner;
};

} // namespace asyncrw
