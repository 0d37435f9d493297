#pragma once

#include <atomic>
#include <functional>
#include <memory>

namespace asyncrw {

/**
 * Shared, single shot callback.
 * Registries like StopState or the sleep timer keep only weak references to it, so the owner can revoke the
 * callback simply by dropping its strong reference. The function runs at most once even if invoke() is called
 * concurrently from different threads.
 */
class Callback {
public:
    using Ref = std::shared_ptr<Callback>;
    using WeakRef = std::weak_ptr<Callback>;
    using Func = std::function<void()>;

private:
    struct Tag {};

public:
    Callback(Tag, Func&& function)
        : _function(std::move(function)) {}

    static Ref create(Func function) {
        return std::make_shared<Callback>(Tag {}, std::move(function));
    }

    /// Invoke the function unless it has been invoked already. The function is expected not to throw.
    void invoke() noexcept {
        if (_invoked.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        Func function = std::move(_function);
        if (function) {
            function();
        }
    }

    bool invoked() const noexcept {
        return _invoked.load(std::memory_order_acquire);
    }

private:
    Func _function;
    std::atomic<bool> _invoked = false;
};

} // namespace asyncrw
