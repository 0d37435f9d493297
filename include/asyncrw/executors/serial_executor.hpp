#pragma once

#include "run_state.hpp"

#include <thread>

namespace asyncrw {

/**
 * Single threaded serial executor, executing scheduled task on a single thread in a serial manner.
 * This executor API is thread safe and can be used concurrently from different threads.
 * The execution itself takes place on a separate thread, so scheduling does not block the scheduling thread unless
 * specifically requested.
 * The lifetime of each executor is prolonged by tasks scheduled on it, regardless of user holding strong reference to
 * it. So effectively executor lives as long as it takes to finish all the tasks scheduled on it.
 * The following is a valid code for this executor:
 * ```
 * {
 *   auto executor = SerialExecutor::create();
 *   executor->schedule(someTask());
 * }
 * // executor will live on as long as it takes to finish someTask()
 * ```
 */
class SerialExecutor : public Executor {
public:
    using Ref = std::shared_ptr<SerialExecutor>;

    static Ref create() {
        return std::make_shared<SerialExecutor>(Tag {});
    }

public:
    // See comments in the base Executor class
    using Executor::next;
    using Executor::schedule;

protected:
    void schedule(CoroHandle coro) override {
        _state->schedule(std::move(coro));
    }

    void next(CoroHandle coro) override {
        _state->next(std::move(coro));
    }

protected:
    struct Tag {};

public:
    SerialExecutor(Tag)
        : _state(std::make_shared<detail::RunState>()) {
        _runningThread = std::thread([state = _state]() { detail::RunState::run(state); });
    }

    ~SerialExecutor() override {
        _state->executorDestroyed();
        _runningThread.detach();
    }

private:
    detail::RunState::Ref _state;
    std::thread _runningThread;
};

} // namespace asyncrw
