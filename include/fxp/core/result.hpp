#pragma once

/// @file result.hpp
/// @brief Result<T, E>: value-or-error return type used across the project.

#include <type_traits>
#include <utility>
#include <variant>

namespace fxp {

/// Holds either a value of type T or an error of type E.
///
/// Construct through the static factories:
/// @code
///   Result<int, MyError> r = Result<int, MyError>::ok(7);
///   if (r) { use(r.value()); } else { report(r.error()); }
/// @endcode
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    template <typename... Args>
    [[nodiscard]] static Result ok(Args&&... args) {
        return Result(std::in_place_index<0>, std::forward<Args>(args)...);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool hasValue() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] T& value() & { return std::get<0>(storage_); }
    [[nodiscard]] const T& value() const& { return std::get<0>(storage_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(storage_)); }

    [[nodiscard]] const E& error() const& { return std::get<1>(storage_); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(storage_)); }

    /// Return the value, or @p fallback when this holds an error.
    template <typename U>
    [[nodiscard]] T valueOr(U&& fallback) const& {
        return hasValue() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : storage_(idx, std::forward<Args>(args)...) {}

    std::variant<T, E> storage_;
};

/// Specialization for operations that produce no value.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] static Result err(E error) {
        Result r;
        r.failed_ = true;
        r.error_ = std::move(error);
        return r;
    }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] const E& error() const& { return error_; }
    [[nodiscard]] E&& error() && { return std::move(error_); }

private:
    Result() = default;

    bool failed_ = false;
    E error_{};
};

} // namespace fxp
