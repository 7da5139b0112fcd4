#pragma once
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "types.hpp"

namespace allusions {

// Thrown by Maybe::unwrap() on an Empty.
class EmptyUnwrapError : public std::runtime_error {
public:
    EmptyUnwrapError() : std::runtime_error("Called unwrap() on Empty") {}
};

// A bare Empty() converts into an Empty of any payload type.
using Empty = Maybe<Never>;

template <typename T>
auto Some(T&& value) -> Maybe<std::decay_t<T>>;

template <typename A, typename B>
    requires PayloadComparable<A, B>
bool operator==(const Maybe<A>& lhs, const Maybe<B>& rhs);

/// Container that may or may not hold a value, like Rust's Option or Haskell's Maybe.
/// Build one with Some(value) or Empty(); inspect it with map / flat_map / match.
/// Aside from unwrap(), every operation is total.
/// Example usage:
///   lookup("cat", animals).map([](int n) { return std::to_string(n); });  // Some("6")
///   lookup("fish", animals).match([](int) { return "here"s; }, [] { return "gone"s; });  // "gone"
template <typename T>
class Maybe {
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "Maybe holds plain object types only");

public:
    using value_type = T;

    // Same as Empty().
    Maybe() = default;

    template <std::same_as<Never> N>
    explicit(false) Maybe(const Maybe<N>&) {}

    // The contained value, or EmptyUnwrapError.
    const T& unwrap() const& {
        if (!value_.has_value()) {
            throw EmptyUnwrapError();
        }
        return *value_;
    }

    T unwrap() && {
        if (!value_.has_value()) {
            throw EmptyUnwrapError();
        }
        return std::move(*value_);
    }

    // Some(fn(v)) for Some(v). Empty stays Empty and fn is never called.
    template <typename F>
    auto map(F&& fn) const& { return map_impl(*this, std::forward<F>(fn)); }

    template <typename F>
    auto map(F&& fn) && { return map_impl(std::move(*this), std::forward<F>(fn)); }

    // fn(v) for Some(v), with no re-wrapping. Empty stays Empty and fn is never called.
    template <typename F>
    auto flat_map(F&& fn) const& { return flat_map_impl(*this, std::forward<F>(fn)); }

    template <typename F>
    auto flat_map(F&& fn) && { return flat_map_impl(std::move(*this), std::forward<F>(fn)); }

    template <typename F>
    auto and_then(F&& fn) const& { return flat_map_impl(*this, std::forward<F>(fn)); }

    template <typename F>
    auto and_then(F&& fn) && { return flat_map_impl(std::move(*this), std::forward<F>(fn)); }

    // Calls exactly one of the branches and returns its result.
    template <typename IfSome, typename IfEmpty>
    auto match(IfSome&& if_some, IfEmpty&& if_empty) const& {
        return match_impl(*this, std::forward<IfSome>(if_some), std::forward<IfEmpty>(if_empty));
    }

    template <typename IfSome, typename IfEmpty>
    auto match(IfSome&& if_some, IfEmpty&& if_empty) && {
        return match_impl(std::move(*this), std::forward<IfSome>(if_some), std::forward<IfEmpty>(if_empty));
    }

private:
    template <typename... Args>
    explicit Maybe(std::in_place_t, Args&&... args): value_(std::in_place, std::forward<Args>(args)...) {}

    template <typename Self, typename F>
    static auto map_impl(Self&& self, [[maybe_unused]] F&& fn) {
        if constexpr (is_never_v<T>) {
            return Maybe<Never>();
        } else {
            using Payload = decltype(*std::forward<Self>(self).value_);
            using U = std::decay_t<std::invoke_result_t<F, Payload>>;
            static_assert(!std::is_void_v<U>, "map() needs a function that returns a value");

            if (!self.value_.has_value()) {
                return Maybe<U>();
            }
            return Maybe<U>(std::in_place, std::invoke(std::forward<F>(fn), *std::forward<Self>(self).value_));
        }
    }

    template <typename Self, typename F>
    static auto flat_map_impl(Self&& self, [[maybe_unused]] F&& fn) {
        if constexpr (is_never_v<T>) {
            return Maybe<Never>();
        } else {
            using Payload = decltype(*std::forward<Self>(self).value_);
            using R = std::remove_cvref_t<std::invoke_result_t<F, Payload>>;
            static_assert(is_maybe_v<R>, "flat_map() needs a function that returns a Maybe");

            if (!self.value_.has_value()) {
                return R();
            }
            return R(std::invoke(std::forward<F>(fn), *std::forward<Self>(self).value_));
        }
    }

    template <typename Self, typename IfSome, typename IfEmpty>
    static auto match_impl(Self&& self, [[maybe_unused]] IfSome&& if_some, IfEmpty&& if_empty) {
        if constexpr (is_never_v<T>) {
            return std::invoke(std::forward<IfEmpty>(if_empty));
        } else {
            using Payload = decltype(*std::forward<Self>(self).value_);
            using R = std::common_type_t<std::invoke_result_t<IfSome, Payload>, std::invoke_result_t<IfEmpty>>;

            if (self.value_.has_value()) {
                return static_cast<R>(std::invoke(std::forward<IfSome>(if_some), *std::forward<Self>(self).value_));
            }
            return static_cast<R>(std::invoke(std::forward<IfEmpty>(if_empty)));
        }
    }

    template <typename U>
    friend class Maybe;

    template <typename U>
    friend auto Some(U&& value) -> Maybe<std::decay_t<U>>;

    template <typename A, typename B>
        requires PayloadComparable<A, B>
    friend bool operator==(const Maybe<A>& lhs, const Maybe<B>& rhs);

    std::optional<T> value_;
};

template <typename T>
auto Some(T&& value) -> Maybe<std::decay_t<T>> {
    return Maybe<std::decay_t<T>>(std::in_place, std::forward<T>(value));
}

// Some(a) == Some(b) iff a == b. Empty equals Empty. Some never equals Empty.
template <typename A, typename B>
    requires PayloadComparable<A, B>
bool operator==(const Maybe<A>& lhs, const Maybe<B>& rhs) {
    if (lhs.value_.has_value() != rhs.value_.has_value()) {
        return false;
    }
    if constexpr (is_never_v<A> || is_never_v<B>) {
        return true;
    } else {
        return !lhs.value_.has_value() || static_cast<bool>(*lhs.value_ == *rhs.value_);
    }
}

} // namespace allusions

namespace std {

// Some(v) hashes as v, Empty as 0. Disabled when the payload isn't hashable.
// Equal values hash equally within one payload type only: Some(1) == Some(1.0), yet
// std::hash<Maybe<int>> and std::hash<Maybe<double>> may disagree on them.
template <typename T>
    requires allusions::Hashable<T>
struct hash<allusions::Maybe<T>> {
    size_t operator()(const allusions::Maybe<T>& maybe) const {
        return maybe.match(
            [](const auto& value) -> size_t { return hash<remove_cvref_t<decltype(value)>>{}(value); },
            []() -> size_t { return 0; });
    }
};

} // namespace std
