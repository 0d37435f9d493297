#pragma once

#include "../core/waker.hpp"

#include <concepts>

namespace asyncrw {

/// Kind of access a task is waiting for.
enum class Access {
    Shared,
    Upgradable,
    Exclusive,
    /// Exclusive access requested by the holder of upgradable access.
    Upgrade,
};

/// Reader/writer lock with the standard SharedMutex operations, e.g. boost::shared_mutex.
template <typename L>
concept SharedLockable = requires(L& lock) {
    lock.lock();
    { lock.try_lock() } -> std::convertible_to<bool>;
    lock.unlock();
    lock.lock_shared();
    { lock.try_lock_shared() } -> std::convertible_to<bool>;
    lock.unlock_shared();
};

/// SharedLockable with the Boost.Thread upgrade operations, e.g. boost::upgrade_mutex.
template <typename L>
concept UpgradeLockable = SharedLockable<L> && requires(L& lock) {
    lock.lock_upgrade();
    { lock.try_lock_upgrade() } -> std::convertible_to<bool>;
    lock.unlock_upgrade();
    lock.unlock_upgrade_and_lock();
    { lock.try_unlock_upgrade_and_lock() } -> std::convertible_to<bool>;
    lock.unlock_and_lock_upgrade();
    lock.unlock_and_lock_shared();
    lock.unlock_upgrade_and_lock_shared();
};

/// Lock which can notify suspended tasks when it becomes available again.
template <typename L>
concept AsyncLockable = SharedLockable<L> && requires(L& lock, Waker waker, Access access) {
    lock.register_waker(waker, access);
    lock.forward_wakeup(access);
};

} // namespace asyncrw
