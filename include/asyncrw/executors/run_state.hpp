#pragma once

#include "../core.hpp"
#include "../detail/containers.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace asyncrw::detail {

/**
 * Run queue shared between an executor and its worker threads.
 * Workers keep it alive through shared ownership, so an executor can be destroyed by the very worker that
 * finished the last coroutine referring to it.
 */
struct RunState {
    using Ref = std::shared_ptr<RunState>;
    detail::Deque<CoroHandle> tasks;
    std::condition_variable cv;
    std::mutex mutex;
    std::atomic<bool> finished = false;

    void schedule(CoroHandle&& handle) {
        {
            std::scoped_lock lock {mutex};
            tasks.pushFront(std::move(handle));
        }
        cv.notify_one();
    }

    void next(CoroHandle&& handle) {
        {
            std::scoped_lock lock {mutex};
            tasks.pushBack(std::move(handle));
        }
        cv.notify_one();
    }

    void executorDestroyed() {
        {
            std::scoped_lock lock {mutex};
            finished = true;
        }
        cv.notify_all();
    }

    static void run(RunState::Ref state) {
        while (true) {
            std::unique_lock lock {state->mutex};
            state->cv.wait(lock, [&state] { return !state->tasks.empty() || state->finished; });
            if (state->finished) {
                // Executor is destroyed only when no coroutine refers to it anymore,
                // at that point there can't be anything left to run.
                if (!state->tasks.empty()) {
                    std::abort();
                }
                break;
            }
            CoroHandle task = state->tasks.popBack().value();
            // release lock and give a chance to schedule while task is being executed
            lock.unlock();
            task.resume();
        }
    }
};

} // namespace asyncrw::detail
