#pragma once

#include <compare>
#include <coroutine>
#include <cstddef>

namespace asyncrw {

class PromiseBase;

/**
 * Reference counted wrapper for a coroutine handle.
 * The coroutine frame lives as long as there is at least one CoroHandle referring to it. The counter is stored in the
 * promise, so every CoroHandle created via fromTypedHandle() for the same coroutine shares it.
 * Unlike the typeless std::coroutine_handle<> it keeps a PromiseBase pointer, so executors and wakers can reach the
 * executor and the task context of any coroutine they were given.
 */
class CoroHandle {
public:
    using handle_t = std::coroutine_handle<>;

public:
    /**
     * Create CoroHandle for a fully typed coroutine handle.
     * Not safe against a concurrent destruction of the same coroutine, call it from await_suspend() or from similar
     * places where the coroutine is known to be alive.
     */
    template <typename Promise>
    static CoroHandle fromTypedHandle(std::coroutine_handle<Promise> handle);

    /// Drops this reference, destroys the coroutine frame if it was the last one.
    void reset();

public:
    /// Returns the promise static casted to the requested type.
    template <typename T = PromiseBase>
    T& promise();

    template <typename T = PromiseBase>
    const T& promise() const;

    handle_t handle() const;

    bool done() const;

    void resume();

public:
    explicit operator bool() const;

    bool operator==(const CoroHandle& other) const noexcept;

    std::strong_ordering operator<=>(const CoroHandle& other) const noexcept;

public:
    CoroHandle() = default;

    CoroHandle(std::nullptr_t);

    ~CoroHandle();

    CoroHandle(const CoroHandle& other);

    CoroHandle(CoroHandle&& other) noexcept;

    CoroHandle& operator=(const CoroHandle& other);

    CoroHandle& operator=(CoroHandle&& other) noexcept;

private:
    CoroHandle(handle_t handle, PromiseBase* promise);

    /// Adds a reference to the frame this handle points to, if any.
    void retain() const noexcept;

private:
    handle_t _handle = nullptr;
    PromiseBase* _promise = nullptr;
};

} // namespace asyncrw
