#pragma once

#include <mutex>
#include <optional>
#include <utility>

namespace plugview {

// Holds a value that may be taken exactly once, from any thread.
template<typename T>
class OneShot {
public:
    explicit OneShot(T value) : _value(std::move(value)) {}

    OneShot(const OneShot&) = delete;
    OneShot& operator=(const OneShot&) = delete;

    // The value on the first call, nullopt afterwards.
    std::optional<T> take() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::optional<T> out;
        out.swap(_value);
        return out;
    }

    bool taken() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return !_value.has_value();
    }

private:
    mutable std::mutex _mutex;
    std::optional<T> _value;
};

} // namespace plugview
