#pragma once

#include <deque>
#include <optional>
#include <queue>
#include <utility>

namespace asyncrw::detail {

/// Double ended queue returning std::nullopt instead of UB when popping from an empty container.
template <typename T>
class Deque {
public:
    Deque() = default;

    void pushFront(T data) {
        _deque.push_front(std::move(data));
    }

    void pushBack(T data) {
        _deque.push_back(std::move(data));
    }

    std::optional<T> popBack() {
        if (_deque.empty()) return std::nullopt;
        std::optional<T> result {std::move(_deque.back())};
        _deque.pop_back();
        return result;
    }

    bool empty() const {
        return _deque.empty();
    }

private:
    std::deque<T> _deque;
};

/// FIFO queue, not thread safe.
template <typename T>
class Queue {
public:
    Queue() = default;

    void push(T data) {
        _queue.push(std::move(data));
    }

    std::optional<T> pop() {
        if (_queue.empty()) return std::nullopt;
        std::optional<T> result {std::move(_queue.front())};
        _queue.pop();
        return result;
    }

    /// Pop the front element only if it satisfies the predicate.
    template <typename Predicate>
    std::optional<T> popIf(Predicate&& predicate) {
        if (_queue.empty() || !predicate(_queue.front())) return std::nullopt;
        return pop();
    }

private:
    std::queue<T> _queue;
};

} // namespace asyncrw::detail
