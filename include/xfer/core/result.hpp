#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace xfer {

namespace detail {

// Tags keep the success and error constructors apart when T == E
template<typename T>
struct OkTag {
    T value;
    explicit OkTag(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrTag {
    E error;
    explicit ErrTag(E e) : error(std::move(e)) {}
};

} // namespace detail

/**
 * @brief Value-or-error return type used across the library
 *
 * Socket and file helpers use the default string error. The protocol and
 * transfer layers use Result<T, TransferError> so callers can branch on the
 * failure kind. Accessing the wrong alternative throws std::bad_variant_access.
 */
template<typename T, typename E = std::string>
class Result {
public:
    Result(detail::OkTag<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(detail::ErrTag<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    /// Moves the success value out, leaving a moved-from T behind.
    T take_value() { return std::move(std::get<0>(data_)); }

private:
    std::variant<T, E> data_;
};

/// Success carries nothing; an engaged optional means failure.
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(detail::ErrTag<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_; }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(detail::OkTag<T>(std::move(value))); }

template<typename E = std::string>
Result<void, E> Ok() { return Result<void, E>(); }

/// Success value for results whose error type is not a string.
template<typename T, typename E>
Result<T, E> OkAs(T value) { return Result<T, E>(detail::OkTag<T>(std::move(value))); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(detail::ErrTag<E>(std::move(error))); }

} // namespace xfer
