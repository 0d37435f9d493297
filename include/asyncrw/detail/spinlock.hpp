#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

#ifndef ASYNCRW_SPIN_BACKOFF_MIN
#define ASYNCRW_SPIN_BACKOFF_MIN 4
#endif

#ifndef ASYNCRW_SPIN_BACKOFF_MAX
#define ASYNCRW_SPIN_BACKOFF_MAX 1024
#endif

namespace asyncrw::detail {

inline void instructionPause() noexcept {
#if defined(__x86_64__) || defined(__i386__)
    __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield");
#elif defined(__powerpc64__)
    asm volatile("or 27,27,27");
#else
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

/**
 * Doubles the number of pause instructions on every call until MAX is reached.
 * Past MAX the calling thread yields its time slice instead of burning more cycles,
 * so a preempted lock holder gets a chance to run and leave the critical section.
 */
template <size_t MIN = ASYNCRW_SPIN_BACKOFF_MIN, size_t MAX = ASYNCRW_SPIN_BACKOFF_MAX>
class ExponentialBackOff {
    static_assert(MIN > 0 && MIN <= MAX);

public:
    void operator()() noexcept {
        backoff();
    }

    /// Returns false once the backoff has saturated and the thread started yielding.
    bool backoff() noexcept {
        if (_current > MAX) {
            std::this_thread::yield();
            return false;
        }
        for (size_t i = 0; i < _current; ++i) {
            instructionPause();
        }
        _current <<= 1;
        return true;
    }

    void reset() noexcept {
        _current = MIN;
    }

private:
    size_t _current = MIN;
};

/**
 * Test-and-test-and-set spin lock for critical sections of bounded, constant length.
 * Never hold it across anything that may block.
 * Satisfies Lockable requirements, so std::scoped_lock and std::unique_lock can be used with it.
 */
template <typename BackOff = ExponentialBackOff<>>
class SpinLockType {
public:
    SpinLockType() = default;

    SpinLockType(const SpinLockType&) = delete;
    SpinLockType& operator=(const SpinLockType&) = delete;

    void lock() noexcept {
        BackOff backoff;
        while (_locked.exchange(true, std::memory_order_acquire)) {
            // spin on a plain load so the cache line is not bounced between waiting cores
            while (_locked.load(std::memory_order_relaxed)) {
                backoff();
            }
        }
    }

    bool try_lock() noexcept {
        return !_locked.load(std::memory_order_relaxed) && !_locked.exchange(true, std::memory_order_acquire);
    }

    void unlock() noexcept {
        _locked.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> _locked = false;
};

using SpinLock = SpinLockType<>;

} // namespace asyncrw::detail
