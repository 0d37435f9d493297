#pragma once

#include <utility>

namespace asyncrw::detail {

template <typename F>
concept NoThrowInvocable = requires(F f) {
    { f() } noexcept;
};

/// Runs given callable when the scope is left, regardless of the way it is left.
template <NoThrowInvocable F>
class AtExit {
public:
    AtExit(F f)
        : _callback(std::move(f)) {}

    AtExit(const AtExit&) = delete;
    AtExit& operator=(const AtExit&) = delete;

    ~AtExit() {
        _callback();
    }

private:
    F _callback;
};

template <typename T>
constexpr bool False = false;

} // namespace asyncrw::detail
