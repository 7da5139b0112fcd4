#pragma once
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include "maybe.hpp"
#include "types.hpp"

namespace allusions {

template <typename T>
auto Ok(T&& value) -> Result<std::decay_t<T>, Never>;

template <typename E>
auto Err(E&& error) -> Result<Never, std::decay_t<E>>;

template <typename T1, typename E1, typename T2, typename E2>
    requires PayloadComparable<T1, T2> && PayloadComparable<E1, E2>
bool operator==(const Result<T1, E1>& lhs, const Result<T2, E2>& rhs);

// The outcome of a computation that may fail - like Ocaml's Or_error or Rust's Result.
// E is an error by convention only; any type works as the payload.
// No unwrap() here: go through ok().unwrap() or err().unwrap().
template <typename T, typename E>
class Result {
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "Result holds plain object types only");
    static_assert(std::is_object_v<E> && !std::is_array_v<E>, "Result holds plain object types only");
    static_assert(!(is_never_v<T> && is_never_v<E>), "a Result<Never, Never> can't be constructed");

    // index 0 holds the value, index 1 the error. T and E may be the same type.
    using Storage = std::variant<T, E>;

public:
    using value_type = T;
    using error_type = E;

    // Ok(v), Err(e) and results with narrower payload types convert into this one.
    template <typename U, typename F>
        requires (!std::is_same_v<Result<U, F>, Result>)
                 && detail::SlotConvertible<T, U> && detail::SlotConvertible<E, F>
    explicit(false) Result(const Result<U, F>& other): value_or_error(convert(other)) {}

    template <typename U, typename F>
        requires (!std::is_same_v<Result<U, F>, Result>)
                 && detail::SlotConvertible<T, U> && detail::SlotConvertible<E, F>
    explicit(false) Result(Result<U, F>&& other): value_or_error(convert(std::move(other))) {}

    [[nodiscard]] bool is_ok() const {
        return value_or_error.index() == 0;
    }

    // Some(v) for Ok(v), Empty for Err.
    Maybe<T> ok() const& {
        if (!is_ok()) {
            return Empty();
        }
        return Some(std::get<0>(value_or_error));
    }

    Maybe<T> ok() && {
        if (!is_ok()) {
            return Empty();
        }
        return Some(std::get<0>(std::move(value_or_error)));
    }

    // Some(e) for Err(e), Empty for Ok.
    Maybe<E> err() const& {
        if (is_ok()) {
            return Empty();
        }
        return Some(std::get<1>(value_or_error));
    }

    Maybe<E> err() && {
        if (is_ok()) {
            return Empty();
        }
        return Some(std::get<1>(std::move(value_or_error)));
    }

    template <typename Func>
    auto map_ok(Func&& f) const& { return map_ok_impl(*this, std::forward<Func>(f)); }

    template <typename Func>
    auto map_ok(Func&& f) && { return map_ok_impl(std::move(*this), std::forward<Func>(f)); }

    template <typename Func>
    auto map_err(Func&& f) const& { return map_err_impl(*this, std::forward<Func>(f)); }

    template <typename Func>
    auto map_err(Func&& f) && { return map_err_impl(std::move(*this), std::forward<Func>(f)); }

    // For chaining operations on the happy path and handling the error only once.
    // If f returns Result<U, Never> the error type stays E, otherwise E has to convert into f's error type.
    template <typename Func>
    auto flat_map(Func&& f) const& { return flat_map_impl(*this, std::forward<Func>(f)); }

    template <typename Func>
    auto flat_map(Func&& f) && { return flat_map_impl(std::move(*this), std::forward<Func>(f)); }

    template <typename Func>
    auto and_then(Func&& f) const& { return flat_map_impl(*this, std::forward<Func>(f)); }

    template <typename Func>
    auto and_then(Func&& f) && { return flat_map_impl(std::move(*this), std::forward<Func>(f)); }

    // Merges value and error into one type.
    template <typename IfOk, typename IfErr>
    auto match(IfOk&& if_ok, IfErr&& if_err) const& {
        return match_impl(*this, std::forward<IfOk>(if_ok), std::forward<IfErr>(if_err));
    }

    template <typename IfOk, typename IfErr>
    auto match(IfOk&& if_ok, IfErr&& if_err) && {
        return match_impl(std::move(*this), std::forward<IfOk>(if_ok), std::forward<IfErr>(if_err));
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> slot, Args&&... args): value_or_error(slot, std::forward<Args>(args)...) {}

    template <typename Other>
    static Storage convert(Other&& other) {
        using Source = std::remove_cvref_t<Other>;
        if constexpr (is_never_v<typename Source::error_type>) {
            return Storage(std::in_place_index<0>, std::get<0>(std::forward<Other>(other).value_or_error));
        } else if constexpr (is_never_v<typename Source::value_type>) {
            return Storage(std::in_place_index<1>, std::get<1>(std::forward<Other>(other).value_or_error));
        } else {
            if (other.is_ok()) {
                return Storage(std::in_place_index<0>, std::get<0>(std::forward<Other>(other).value_or_error));
            }
            return Storage(std::in_place_index<1>, std::get<1>(std::forward<Other>(other).value_or_error));
        }
    }

    template <typename Self, typename Func>
    static auto map_ok_impl(Self&& self, [[maybe_unused]] Func&& f) {
        if constexpr (is_never_v<T>) {
            return Result(std::forward<Self>(self));
        } else {
            using Value = decltype(std::get<0>(std::forward<Self>(self).value_or_error));
            using U = std::decay_t<std::invoke_result_t<Func, Value>>;
            static_assert(!std::is_void_v<U>, "map_ok() needs a function that returns a value");
            using Out = Result<U, E>;

            if (!self.is_ok()) {
                return Out(std::in_place_index<1>, std::get<1>(std::forward<Self>(self).value_or_error));
            }
            return Out(std::in_place_index<0>,
                       std::invoke(std::forward<Func>(f), std::get<0>(std::forward<Self>(self).value_or_error)));
        }
    }

    template <typename Self, typename Func>
    static auto map_err_impl(Self&& self, [[maybe_unused]] Func&& f) {
        if constexpr (is_never_v<E>) {
            return Result(std::forward<Self>(self));
        } else {
            using Error = decltype(std::get<1>(std::forward<Self>(self).value_or_error));
            using F = std::decay_t<std::invoke_result_t<Func, Error>>;
            static_assert(!std::is_void_v<F>, "map_err() needs a function that returns a value");
            using Out = Result<T, F>;

            if (self.is_ok()) {
                return Out(std::in_place_index<0>, std::get<0>(std::forward<Self>(self).value_or_error));
            }
            return Out(std::in_place_index<1>,
                       std::invoke(std::forward<Func>(f), std::get<1>(std::forward<Self>(self).value_or_error)));
        }
    }

    template <typename Self, typename Func>
    static auto flat_map_impl(Self&& self, [[maybe_unused]] Func&& f) {
        if constexpr (is_never_v<T>) {
            return Result(std::forward<Self>(self));
        } else {
            using Value = decltype(std::get<0>(std::forward<Self>(self).value_or_error));
            using R = std::remove_cvref_t<std::invoke_result_t<Func, Value>>;
            static_assert(is_result_v<R>, "flat_map() needs a function that returns a Result");
            using Out = Result<typename R::value_type, detail::joined_error_t<E, typename R::error_type>>;
            static_assert(detail::SlotConvertible<typename Out::error_type, E>,
                          "the error type has to convert into the error type of the continuation");

            if constexpr (!is_never_v<E>) {
                if (!self.is_ok()) {
                    return Out(std::in_place_index<1>, std::get<1>(std::forward<Self>(self).value_or_error));
                }
            }
            return Out(std::invoke(std::forward<Func>(f), std::get<0>(std::forward<Self>(self).value_or_error)));
        }
    }

    template <typename Self, typename IfOk, typename IfErr>
    static auto match_impl(Self&& self, [[maybe_unused]] IfOk&& if_ok, [[maybe_unused]] IfErr&& if_err) {
        if constexpr (is_never_v<T>) {
            return std::invoke(std::forward<IfErr>(if_err), std::get<1>(std::forward<Self>(self).value_or_error));
        } else if constexpr (is_never_v<E>) {
            return std::invoke(std::forward<IfOk>(if_ok), std::get<0>(std::forward<Self>(self).value_or_error));
        } else {
            using Value = decltype(std::get<0>(std::forward<Self>(self).value_or_error));
            using Error = decltype(std::get<1>(std::forward<Self>(self).value_or_error));
            using R = std::common_type_t<std::invoke_result_t<IfOk, Value>, std::invoke_result_t<IfErr, Error>>;

            if (self.is_ok()) {
                return static_cast<R>(
                    std::invoke(std::forward<IfOk>(if_ok), std::get<0>(std::forward<Self>(self).value_or_error)));
            }
            return static_cast<R>(
                std::invoke(std::forward<IfErr>(if_err), std::get<1>(std::forward<Self>(self).value_or_error)));
        }
    }

    template <typename U, typename F>
    friend class Result;

    template <typename U>
    friend auto Ok(U&& value) -> Result<std::decay_t<U>, Never>;

    template <typename F>
    friend auto Err(F&& error) -> Result<Never, std::decay_t<F>>;

    template <typename T1, typename E1, typename T2, typename E2>
        requires PayloadComparable<T1, T2> && PayloadComparable<E1, E2>
    friend bool operator==(const Result<T1, E1>& lhs, const Result<T2, E2>& rhs);

    Storage value_or_error;
};

template <typename T>
auto Ok(T&& value) -> Result<std::decay_t<T>, Never> {
    return Result<std::decay_t<T>, Never>(std::in_place_index<0>, std::forward<T>(value));
}

template <typename E>
auto Err(E&& error) -> Result<Never, std::decay_t<E>> {
    return Result<Never, std::decay_t<E>>(std::in_place_index<1>, std::forward<E>(error));
}

// Ok(a) == Ok(b) iff a == b, Err(a) == Err(b) iff a == b. Ok never equals Err, whatever the payloads.
template <typename T1, typename E1, typename T2, typename E2>
    requires PayloadComparable<T1, T2> && PayloadComparable<E1, E2>
bool operator==(const Result<T1, E1>& lhs, const Result<T2, E2>& rhs) {
    if (lhs.is_ok() != rhs.is_ok()) {
        return false;
    }
    if (lhs.is_ok()) {
        if constexpr (is_never_v<T1> || is_never_v<T2>) {
            return false;
        } else {
            return static_cast<bool>(std::get<0>(lhs.value_or_error) == std::get<0>(rhs.value_or_error));
        }
    }
    if constexpr (is_never_v<E1> || is_never_v<E2>) {
        return false;
    } else {
        return static_cast<bool>(std::get<1>(lhs.value_or_error) == std::get<1>(rhs.value_or_error));
    }
}

} // namespace allusions

namespace std {

// Ok(v) hashes as v, Err(e) as e. Disabled unless both payloads are hashable.
// As with Maybe, equal results of different payload types may hash differently.
template <typename T, typename E>
    requires allusions::Hashable<T> && allusions::Hashable<E>
struct hash<allusions::Result<T, E>> {
    size_t operator()(const allusions::Result<T, E>& result) const {
        return result.match(
            [](const auto& value) -> size_t { return hash<remove_cvref_t<decltype(value)>>{}(value); },
            [](const auto& error) -> size_t { return hash<remove_cvref_t<decltype(error)>>{}(error); });
    }
};

} // namespace std
