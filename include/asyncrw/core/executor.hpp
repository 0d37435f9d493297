#pragma once

#include "handle.hpp"
#include "task.fwd.hpp"

#include <future>
#include <memory>

namespace asyncrw {

class Executor : public std::enable_shared_from_this<Executor> {
public:
    using Ref = std::shared_ptr<Executor>;

    virtual ~Executor() = default;

protected:
    Executor() = default;

public:
    /// Schedules given task on executor, ideally without blocking the scheduling thread.
    /// Scheduling is done in a FIFO manner, to be executed when all other tasks in front of it are executed.
    /// Returns the same task, which has been marked as executing on this executor. It can be stored and co_await(ed)
    /// even from another executor.
    template <typename R>
    Task<R> schedule(Task<R>&& task);

    /// Schedules given task on executor, ideally without blocking the scheduling thread.
    /// Scheduling is done in a LIFO manner, to be executed right away.
    template <typename R>
    Task<R> next(Task<R>&& task);

    /**
     * Schedule given task and return std::future, which will be satisfied when task is complete,
     * either with result value of the task or with an exception if there was an error.
     */
    template <typename R>
    std::future<R> future(Task<R>&& task);

    /// Schedule given task and synchronously wait for its completion.
    /// Returns value returned by task or throws exception if any.
    template <typename R>
    R syncWait(Task<R>&& task);

public:
    /// Will be called to schedule new independent handle, or a handle woken up by a Waker.
    /// Override should store given handle to be resumed later, it must not resume it inline.
    virtual void schedule(CoroHandle coro) = 0;

    /// Will be called to indicate that execution is awaiting for a completion of the given coroutine.
    /// So it is in the best interest of overall execution to schedule incoming handle in such way,
    /// that it is executed next.
    virtual void next(CoroHandle coro) = 0;
};

} // namespace asyncrw
