#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace plugview {

//-----------------------------------------------------------------------------
// Error - message, optional numeric code, optional cause chain
//-----------------------------------------------------------------------------
class Error {
public:
    Error() = default;
    explicit Error(std::string message, int code = 0)
        : _message(std::move(message)), _code(code) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)),
          _cause(std::make_shared<const Error>(std::move(cause))) {}

    const std::string& message() const noexcept { return _message; }

    // First non-zero code along the cause chain.
    int code() const noexcept {
        if (_code != 0 || !_cause) {
            return _code;
        }
        return _cause->code();
    }

    const Error* cause() const noexcept { return _cause.get(); }

    // "outer: inner: root"
    std::string fullMessage() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    int _code = 0;
    std::shared_ptr<const Error> _cause;
};

//-----------------------------------------------------------------------------
// Result<T>
//-----------------------------------------------------------------------------
template <typename T>
class [[nodiscard]] Result {
public:
    using value_type = T;

    Result(const T& value) : _storage(std::in_place_index<0>, value) {}
    Result(T&& value) : _storage(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _storage(std::in_place_index<1>, std::move(error)) {}

    template <typename U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U, T>)
    Result(Result<U>&& other) {
        if (other) {
            _storage.template emplace<0>(std::move(*other));
        } else {
            _storage.template emplace<1>(other.error());
        }
    }

    bool has_value() const noexcept { return _storage.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & { return std::get<0>(_storage); }
    const T& value() const& { return std::get<0>(_storage); }
    T&& value() && { return std::get<0>(std::move(_storage)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_storage); }

private:
    std::variant<T, Error> _storage;
};

template <>
class [[nodiscard]] Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const noexcept { return !_error.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//-----------------------------------------------------------------------------
// Constructors
//-----------------------------------------------------------------------------
inline Result<void> Ok() { return Result<void>(); }

template <typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T = void>
Result<T> Err(std::string message, int code = 0) {
    return Result<T>(Error(std::move(message), code));
}

template <typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error()));
}

template <typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().fullMessage();
}

} // namespace plugview
