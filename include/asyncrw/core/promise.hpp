#pragma once

#include "promise_base.hpp"
#include "task.fwd.hpp"

#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>

namespace asyncrw {

class UninitializedValue : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

template <typename R>
class Promise : public PromiseBase {
public:
    using handle_t = std::coroutine_handle<Promise>;
    using return_t = R;

public:
    Task<R> get_return_object();

    void return_value(R r) {
        _value.emplace(std::move(r));
    }

public:
    const R& value() const& {
        checkValue();
        return *_value;
    }

    R&& value() && {
        checkValue();
        return std::move(*_value);
    }

private:
    void checkValue() const {
        rethrowIfFailed();
        if (!_value) {
            throw UninitializedValue("Value is not initialized.");
        }
    }

private:
    // optional, so move-only results without default constructor (lock guards) can be returned
    std::optional<R> _value;
};

template <>
class Promise<void> : public PromiseBase {
public:
    using handle_t = std::coroutine_handle<Promise>;
    using return_t = void;

public:
    Task<void> get_return_object();

    void return_void() {
        _returned = true;
    }

public:
    void value() const {
        rethrowIfFailed();
        if (!_returned) {
            throw UninitializedValue("Value is not initialized.");
        }
    }

private:
    bool _returned = false;
};

} // namespace asyncrw
