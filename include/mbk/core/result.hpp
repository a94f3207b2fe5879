#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace mbk {

/**
 * @brief Success or failure of an operation, without exceptions
 *
 * Built from the Ok()/Err() tags below so that a Result whose value and
 * error share a type is never ambiguous. OkValue<U> converts into any
 * Result<T> constructible from U, so Ok(std::make_unique<Derived>())
 * can be returned as Result<std::unique_ptr<Base>>.
 */
template<typename T>
struct OkValue {
    T value;
};

struct OkVoid {};

template<typename E>
struct ErrValue {
    E error;
};

template<typename T, typename E>
class Result {
public:
    template<typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    Result(OkValue<U> ok) : state_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : state_(std::in_place_index<1>, std::move(err.error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return state_.index() == 1; }

    T& value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    E& error() { return std::get<1>(state_); }
    const E& error() const { return std::get<1>(state_); }

    T value_or(T fallback) const {
        if (is_ok()) {
            return value();
        }
        return fallback;
    }

private:
    std::variant<T, E> state_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(OkVoid) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_; }
    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<std::decay_t<T>> Ok(T&& value) {
    return OkValue<std::decay_t<T>>{std::forward<T>(value)};
}

inline OkVoid Ok() { return {}; }

template<typename T, typename E>
Result<T, E> Err(E error) {
    return Result<T, E>(ErrValue<E>{std::move(error)});
}

} // namespace mbk
