#pragma once

#include "run_state.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace asyncrw {

/**
 * Executor running scheduled tasks on a fixed set of worker threads sharing a single run queue.
 * A suspended task may be resumed on any of the workers, so the code of the tasks must not rely on thread identity.
 * Just like SerialExecutor, the executor lives as long as any task scheduled on it is alive.
 */
class ThreadPoolExecutor : public Executor {
public:
    using Ref = std::shared_ptr<ThreadPoolExecutor>;

    static Ref create(size_t threads = std::thread::hardware_concurrency()) {
        return std::make_shared<ThreadPoolExecutor>(Tag {}, threads);
    }

public:
    using Executor::next;
    using Executor::schedule;

    size_t size() const {
        return _workers.size();
    }

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
    ThreadPoolExecutor(Tag, size_t threads)
        : _state(std::make_shared<detail::RunState>()) {
        threads = std::max<size_t>(threads, 1);
        _workers.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            _workers.emplace_back([state = _state]() { detail::RunState::run(state); });
        }
    }

    ~ThreadPoolExecutor() override {
        _state->executorDestroyed();
        // the destructor may run on one of the workers, which can't join itself
        for (auto& worker : _workers) {
            worker.detach();
        }
    }

private:
    detail::RunState::Ref _state;
    std::vector<std::thread> _workers;
};

} // namespace asyncrw
