#pragma once

#include <atomic>
#include <memory>

namespace asyncrw::detail {

/**
 * Lazily created value owned by the cell.
 * The first get() allocates the value and publishes it with a single compare-and-swap. Threads racing on the first
 * get() all allocate, but only one allocation wins; the others are discarded before get() returns, so every caller
 * observes the same object afterwards. The value lives until the cell is destroyed.
 */
template <typename T>
class OnceCell {
public:
    OnceCell() = default;

    OnceCell(const OnceCell&) = delete;
    OnceCell& operator=(const OnceCell&) = delete;

    ~OnceCell() {
        std::unique_ptr<T> owned {_value.load(std::memory_order_acquire)};
    }

    T& get() {
        T* current = _value.load(std::memory_order_acquire);
        if (current) {
            return *current;
        }
        auto created = std::make_unique<T>();
        if (_value.compare_exchange_strong(
                current, created.get(), std::memory_order_acq_rel, std::memory_order_acquire)) {
            return *created.release();
        }
        return *current;
    }

    /// Returns the value if it was already created, nullptr otherwise. Never allocates.
    T* peek() const noexcept {
        return _value.load(std::memory_order_acquire);
    }

    bool initialized() const noexcept {
        return peek() != nullptr;
    }

private:
    std::atomic<T*> _value = nullptr;
};

} // namespace asyncrw::detail
