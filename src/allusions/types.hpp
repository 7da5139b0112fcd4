#pragma once
#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>

namespace allusions {

// A type without values. It fills the payload slot that a bare Empty(), Ok(v) or Err(e) doesn't use,
// so those convert into any Maybe / Result with a matching occupied slot.
struct Never {
    Never() = delete;
    friend constexpr bool operator==(const Never&, const Never&) noexcept { return true; }
};

template <typename T>
class Maybe;

template <typename T, typename E>
class Result;

template <typename T>
inline constexpr bool is_never_v = std::is_same_v<std::remove_cvref_t<T>, Never>;

template <typename T>
struct is_maybe : std::false_type {};

template <typename T>
struct is_maybe<Maybe<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_maybe_v = is_maybe<std::remove_cvref_t<T>>::value;

template <typename T>
struct is_result : std::false_type {};

template <typename T, typename E>
struct is_result<Result<T, E>> : std::true_type {};

template <typename T>
inline constexpr bool is_result_v = is_result<std::remove_cvref_t<T>>::value;

// std::hash<T> is enabled. Never counts as hashable since it is never hashed.
template <typename T>
concept Hashable = is_never_v<T> || requires(const T& value) {
    { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
};

// Payloads of two containers can be compared. A Never slot is never occupied, so it compares with anything.
template <typename A, typename B>
concept PayloadComparable = is_never_v<A> || is_never_v<B> || requires(const A& a, const B& b) {
    { a == b } -> std::convertible_to<bool>;
};

namespace detail {

// Error type of Result::flat_map: a continuation that can't fail keeps the current error type.
template <typename E, typename E2>
using joined_error_t = std::conditional_t<is_never_v<E2>, E, E2>;

template <typename T, typename U>
concept SlotConvertible = is_never_v<U> || std::is_convertible_v<U, T>;

} // namespace detail

} // namespace allusions
