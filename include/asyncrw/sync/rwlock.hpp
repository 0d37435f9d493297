#pragma once

#include "raw_rwlock.hpp"
#include "wait.hpp"

#include <mutex>
#include <optional>
#include <utility>

namespace asyncrw {

/**
 * Value protected by an asynchronous reader/writer lock.
 * Access to the value is given out through guards, which release the lock when destroyed:
 * ```
 * RwLock<std::vector<int>> lock;
 * {
 *     auto guard = co_await lock.asyncWrite();
 *     guard->push_back(1);
 * }
 * auto guard = co_await lock.asyncRead();
 * ```
 * Blocking and try variants are available as well, the blocking ones block the calling thread and shouldn't be
 * used from within tasks.
 * Upgradable access (shared access which can be atomically turned into exclusive one) is available only when Raw
 * is UpgradeLockable, see UpgradableRwLock.
 */
template <typename T, AsyncLockable Raw = AsyncRawRwLock<>>
class RwLock {
public:
    class ReadGuard;
    class WriteGuard;
    class UpgradableReadGuard;

public:
    RwLock() = default;

    explicit RwLock(T value)
        : _value(std::move(value)) {}

    RwLock(const RwLock&) = delete;
    RwLock& operator=(const RwLock&) = delete;

public:
    ReadGuard read() {
        _raw.lock_shared();
        return ReadGuard {*this, std::adopt_lock};
    }

    WriteGuard write() {
        _raw.lock();
        return WriteGuard {*this, std::adopt_lock};
    }

    UpgradableReadGuard upgradableRead()
        requires UpgradeLockable<Raw>
    {
        _raw.lock_upgrade();
        return UpgradableReadGuard {*this, std::adopt_lock};
    }

    std::optional<ReadGuard> tryRead() {
        if (!_raw.try_lock_shared()) {
            return std::nullopt;
        }
        return ReadGuard {*this, std::adopt_lock};
    }

    std::optional<WriteGuard> tryWrite() {
        if (!_raw.try_lock()) {
            return std::nullopt;
        }
        return WriteGuard {*this, std::adopt_lock};
    }

    std::optional<UpgradableReadGuard> tryUpgradableRead()
        requires UpgradeLockable<Raw>
    {
        if (!_raw.try_lock_upgrade()) {
            return std::nullopt;
        }
        return UpgradableReadGuard {*this, std::adopt_lock};
    }

    /// Suspends the awaiting task until shared access is granted.
    Task<ReadGuard> asyncRead() {
        return detail::acquire<ReadGuard>(_raw, Access::Shared, *this);
    }

    /// Suspends the awaiting task until exclusive access is granted.
    Task<WriteGuard> asyncWrite() {
        return detail::acquire<WriteGuard>(_raw, Access::Exclusive, *this);
    }

    /// Suspends the awaiting task until upgradable access is granted.
    /// Upgradable access coexists with readers but not with writers or other upgradable holders.
    Task<UpgradableReadGuard> asyncUpgradableRead()
        requires UpgradeLockable<Raw>
    {
        return detail::acquire<UpgradableReadGuard>(_raw, Access::Upgradable, *this);
    }

public:
    Raw& raw() {
        return _raw;
    }

private:
    Raw _raw;
    T _value {};
};

template <typename T, AsyncLockable Raw>
class RwLock<T, Raw>::ReadGuard {
public:
    ReadGuard(RwLock& lock, std::adopt_lock_t)
        : _lock(&lock) {}

    ReadGuard(const ReadGuard&) = delete;
    ReadGuard& operator=(const ReadGuard&) = delete;

    ReadGuard(ReadGuard&& other) noexcept
        : _lock(std::exchange(other._lock, nullptr)) {}

    ReadGuard& operator=(ReadGuard&& other) noexcept {
        if (this != &other) {
            reset();
            _lock = std::exchange(other._lock, nullptr);
        }
        return *this;
    }

    ~ReadGuard() {
        reset();
    }

public:
    void reset() {
        if (_lock) {
            std::exchange(_lock, nullptr)->_raw.unlock_shared();
        }
    }

    const T& operator*() const {
        return _lock->_value;
    }

    const T* operator->() const {
        return &_lock->_value;
    }

    explicit operator bool() const {
        return _lock != nullptr;
    }

private:
    RwLock* _lock;
};

template <typename T, AsyncLockable Raw>
class RwLock<T, Raw>::WriteGuard {
public:
    WriteGuard(RwLock& lock, std::adopt_lock_t)
        : _lock(&lock) {}

    WriteGuard(const WriteGuard&) = delete;
    WriteGuard& operator=(const WriteGuard&) = delete;

    WriteGuard(WriteGuard&& other) noexcept
        : _lock(std::exchange(other._lock, nullptr)) {}

    WriteGuard& operator=(WriteGuard&& other) noexcept {
        if (this != &other) {
            reset();
            _lock = std::exchange(other._lock, nullptr);
        }
        return *this;
    }

    ~WriteGuard() {
        reset();
    }

public:
    void reset() {
        if (_lock) {
            std::exchange(_lock, nullptr)->_raw.unlock();
        }
    }

    /// Atomically turns exclusive access into shared one, this guard is left empty.
    ReadGuard downgrade()
        requires UpgradeLockable<Raw>
    {
        RwLock* lock = std::exchange(_lock, nullptr);
        lock->_raw.unlock_and_lock_shared();
        return ReadGuard {*lock, std::adopt_lock};
    }

    /// Atomically turns exclusive access into upgradable one, this guard is left empty.
    UpgradableReadGuard downgradeToUpgradable()
        requires UpgradeLockable<Raw>
    {
        RwLock* lock = std::exchange(_lock, nullptr);
        lock->_raw.unlock_and_lock_upgrade();
        return UpgradableReadGuard {*lock, std::adopt_lock};
    }

    T& operator*() const {
        return _lock->_value;
    }

    T* operator->() const {
        return &_lock->_value;
    }

    explicit operator bool() const {
        return _lock != nullptr;
    }

private:
    RwLock* _lock;
};

template <typename T, AsyncLockable Raw>
class RwLock<T, Raw>::UpgradableReadGuard {
public:
    UpgradableReadGuard(RwLock& lock, std::adopt_lock_t)
        : _lock(&lock) {}

    UpgradableReadGuard(const UpgradableReadGuard&) = delete;
    UpgradableReadGuard& operator=(const UpgradableReadGuard&) = delete;

    UpgradableReadGuard(UpgradableReadGuard&& other) noexcept
        : _lock(std::exchange(other._lock, nullptr)) {}

    UpgradableReadGuard& operator=(UpgradableReadGuard&& other) noexcept {
        if (this != &other) {
            reset();
            _lock = std::exchange(other._lock, nullptr);
        }
        return *this;
    }

    ~UpgradableReadGuard() {
        reset();
    }

public:
    void reset() {
        if (_lock) {
            std::exchange(_lock, nullptr)->_raw.unlock_upgrade();
        }
    }

    /// Blocks the calling thread until the readers are gone, this guard is left empty.
    WriteGuard upgrade() {
        RwLock* lock = std::exchange(_lock, nullptr);
        lock->_raw.unlock_upgrade_and_lock();
        return WriteGuard {*lock, std::adopt_lock};
    }

    /// On success this guard is left empty, on failure it keeps holding upgradable access.
    std::optional<WriteGuard> tryUpgrade() {
        if (!_lock->_raw.try_unlock_upgrade_and_lock()) {
            return std::nullopt;
        }
        return WriteGuard {*std::exchange(_lock, nullptr), std::adopt_lock};
    }

    /// Atomically turns upgradable access into shared one, this guard is left empty.
    ReadGuard downgrade() {
        RwLock* lock = std::exchange(_lock, nullptr);
        lock->_raw.unlock_upgrade_and_lock_shared();
        return ReadGuard {*lock, std::adopt_lock};
    }

    /**
     * Suspends the awaiting task until the readers are gone and returns exclusive access.
     * Upgradable access is kept for the whole wait, so no writer can get in between. If the wait is interrupted
     * by a stop request, the upgradable access is released together with the guard.
     * `auto writeGuard = co_await UpgradableReadGuard::asyncUpgrade(std::move(guard));`
     */
    static Task<WriteGuard> asyncUpgrade(UpgradableReadGuard guard) {
        RwLock& lock = *guard._lock;
        while (!lock._raw.try_unlock_upgrade_and_lock()) {
            const bool acquired = co_await detail::LockWait<Raw> {&lock._raw, Access::Upgrade};
            if (acquired) {
                break;
            }
        }
        guard._lock = nullptr;
        co_return WriteGuard {lock, std::adopt_lock};
    }

    const T& operator*() const {
        return _lock->_value;
    }

    const T* operator->() const {
        return &_lock->_value;
    }

    explicit operator bool() const {
        return _lock != nullptr;
    }

private:
    RwLock* _lock;
};

} // namespace asyncrw
