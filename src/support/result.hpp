//===----------------------------------------------------------------------===//
//
// Part of the Ciphel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/result.hpp
// Purpose: Value-or-error container used by every fallible runtime operation.
// Key invariants: A Result holds exactly one of a value or an error.
// Ownership/Lifetime: Result owns the contained value or error.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace ciphel::support
{

/// @brief Tag type used to construct successful Result values explicitly.
struct SuccessTag
{
    constexpr SuccessTag() = default;
};

/// @brief Sentinel instance for success construction convenience.
inline constexpr SuccessTag kSuccessTag{};

/// @brief Error carrier that converts into any Result with a matching error type.
/// @details Returning @c fail(e) from a function whose return type is
///          @c Result<T, E> selects the error alternative without naming @c T.
template <typename E> struct Failure
{
    E error;
};

/// @brief Wrap @p error so it can be returned as a failed Result.
template <typename E> [[nodiscard]] Failure<std::decay_t<E>> fail(E &&error)
{
    return Failure<std::decay_t<E>>{std::forward<E>(error)};
}

template <typename T> struct IsFailure : std::false_type
{
};

template <typename E> struct IsFailure<Failure<E>> : std::true_type
{
};

/// @brief Minimal expected-like container.
template <typename T, typename E> class Result
{
  public:
    /// @brief Creates a successful result containing a value.
    template <typename U = T> Result(SuccessTag /*tag*/, U &&value)
        : storage_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    /// @brief Creates a successful result from a value without an explicit tag.
    template <typename U = T>
        requires(!IsFailure<std::decay_t<U>>::value && !std::is_same_v<std::decay_t<U>, Result>)
    Result(U &&value) : Result(kSuccessTag, std::forward<U>(value))
    {
    }

    /// @brief Creates a failed result from a Failure carrier.
    Result(Failure<E> failure) : storage_(std::in_place_index<1>, std::move(failure.error)) {}

    /// @brief Indicates whether the Result currently holds a value.
    [[nodiscard]] bool isOk() const
    {
        return storage_.index() == 0;
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre @c isOk() must return true.
    T &value()
    {
        return std::get<0>(storage_);
    }

    /// @pre @c isOk() must return true.
    const T &value() const
    {
        return std::get<0>(storage_);
    }

    /// @pre @c isOk() must return false.
    const E &error() const
    {
        return std::get<1>(storage_);
    }

    /// @brief Re-wrap the stored error for propagation to a caller with a
    ///        different value type.
    /// @pre @c isOk() must return false.
    Failure<E> failure() const
    {
        return Failure<E>{error()};
    }

  private:
    std::variant<T, E> storage_;
};

/// @brief Result specialisation for procedures that produce no value.
template <typename E> class Result<void, E>
{
  public:
    Result() = default;

    Result(SuccessTag /*tag*/) {}

    Result(Failure<E> failure) : error_(std::move(failure.error)) {}

    [[nodiscard]] bool isOk() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre @c isOk() must return false.
    const E &error() const
    {
        return *error_;
    }

    /// @pre @c isOk() must return false.
    Failure<E> failure() const
    {
        return Failure<E>{*error_};
    }

  private:
    std::optional<E> error_;
};

} // namespace ciphel::support
