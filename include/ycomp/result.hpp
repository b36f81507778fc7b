#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace ycomp {

// Error with an optional chained cause.
// to_string() renders "outer: inner: innermost".
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message))
        , _cause(std::make_shared<const Error>(cause)) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    std::string to_string() const {
        std::string out = _message;
        for (const Error* c = cause(); c; c = c->cause()) {
            out += ": ";
            out += c->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

// Error carrier convertible to any Result<T>
struct Unexpected {
    Error error;
};

template<typename T>
class Result {
public:
    using value_type = T;

    template<typename... Args>
    explicit Result(std::in_place_t, Args&&... args)
        : _data(std::in_place_index<0>, std::forward<Args>(args)...) {}

    Result(Unexpected u) : _data(std::in_place_index<1>, std::move(u.error)) {}

    // Result<shared_ptr<Impl>> -> Result<shared_ptr<Base>>
    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> && std::is_convertible_v<U, T>>>
    Result(Result<U>&& other)
        : _data(other ? Data(std::in_place_index<0>, T(std::move(*other)))
                      : Data(std::in_place_index<1>, other.error())) {}

    explicit operator bool() const { return _data.index() == 0; }
    bool has_value() const { return _data.index() == 0; }

    T& value() & { return std::get<0>(_data); }
    const T& value() const& { return std::get<0>(_data); }
    T&& value() && { return std::get<0>(std::move(_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    using Data = std::variant<T, Error>;
    Data _data;
};

template<>
class Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(Unexpected u) : _error(std::move(u.error)) {}

    explicit operator bool() const { return !_error.has_value(); }
    bool has_value() const { return !_error.has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::in_place, std::forward<T>(value));
}

inline Unexpected Err(std::string message) {
    return Unexpected{Error(std::move(message))};
}

template<typename T>
Result<T> Err(std::string message) {
    return Unexpected{Error(std::move(message))};
}

template<typename T>
Result<T> Err(std::string message, const Error& cause) {
    return Unexpected{Error(std::move(message), cause)};
}

template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Unexpected{Error(std::move(message), cause.error())};
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace ycomp
