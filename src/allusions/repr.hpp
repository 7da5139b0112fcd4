#pragma once
#include <charconv>
#include <concepts>
#include <cstddef>
#include <exception>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "maybe.hpp"
#include "result.hpp"
#include "types.hpp"

namespace allusions {

namespace detail {

template <typename T>
concept Streamable = requires(std::ostream& out, const T& value) { out << value; };

template <typename T>
concept Iterable = requires(const T& value) {
    std::begin(value);
    std::end(value);
};

template <typename T>
inline constexpr bool is_variant_v = false;

template <typename... Ts>
inline constexpr bool is_variant_v<std::variant<Ts...>> = true;

template <typename T>
inline constexpr bool is_pair_v = false;

template <typename A, typename B>
inline constexpr bool is_pair_v<std::pair<A, B>> = true;

template <typename>
inline constexpr bool dependent_false_v = false;

inline void write_quoted(std::ostream& out, std::string_view text, char quote) {
    out << quote;
    for (const char c : text) {
        if (c == quote || c == '\\') {
            out << '\\';
        }
        out << c;
    }
    out << quote;
}

// Shortest round-trip form, always recognisable as floating point: 1 -> 1.0
template <std::floating_point Float>
void write_floating(std::ostream& out, Float value) {
    char buffer[64];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        out << value;
        return;
    }
    const std::string_view text(buffer, static_cast<std::size_t>(end - buffer));
    out << text;
    if (text.find_first_of(".en") == std::string_view::npos) {
        out << ".0";
    }
}

template <typename T>
void write_repr(std::ostream& out, const T& value) {
    if constexpr (is_never_v<T>) {
        // no values to render
    } else if constexpr (std::is_same_v<T, bool>) {
        out << (value ? "true" : "false");
    } else if constexpr (std::is_same_v<T, char>) {
        write_quoted(out, std::string_view(&value, 1), '\'');
    } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
        out << "nullptr";
    } else if constexpr (std::is_same_v<T, std::monostate>) {
        out << "monostate";
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        write_quoted(out, value, '"');
    } else if constexpr (std::is_floating_point_v<T>) {
        write_floating(out, value);
    } else if constexpr (std::is_integral_v<T>) {
        out << +value;
    } else if constexpr (is_maybe_v<T>) {
        value.match([&out](const auto& inner) { out << "Some("; write_repr(out, inner); out << ')'; },
                    [&out] { out << "Empty()"; });
    } else if constexpr (is_result_v<T>) {
        value.match([&out](const auto& inner) { out << "Ok("; write_repr(out, inner); out << ')'; },
                    [&out](const auto& error) { out << "Err("; write_repr(out, error); out << ')'; });
    } else if constexpr (is_variant_v<T>) {
        if (value.valueless_by_exception()) {
            out << "valueless";
        } else {
            std::visit([&out](const auto& alternative) { write_repr(out, alternative); }, value);
        }
    } else if constexpr (is_pair_v<T>) {
        out << '(';
        write_repr(out, value.first);
        out << ", ";
        write_repr(out, value.second);
        out << ')';
    } else if constexpr (Iterable<T>) {
        out << "{";
        for (int i = 0; const auto& element : value) {
            out << (i++ ? ", " : "");
            write_repr(out, element);
        }
        out << "}";
    } else if constexpr (Streamable<T>) {
        out << value;
    } else if constexpr (std::is_base_of_v<std::exception, T>) {
        out << "exception(";
        write_quoted(out, value.what(), '"');
        out << ')';
    } else {
        static_assert(dependent_false_v<T>, "no diagnostic representation for this type, give it an operator<<");
    }
}

} // namespace detail

/// Human-readable rendering for diagnostics and test assertions, not a parseable format.
///   repr(Some(Some(1)))          == "Some(Some(1))"
///   repr(Empty())                == "Empty()"
///   repr(Ok(std::string("a")))   == "Ok(\"a\")"
///   repr(Err(1.0))               == "Err(1.0)"
template <typename T>
std::string repr(const T& value) {
    std::ostringstream out;
    detail::write_repr(out, value);
    return out.str();
}

template <typename T>
std::ostream& operator<<(std::ostream& out, const Maybe<T>& maybe) {
    detail::write_repr(out, maybe);
    return out;
}

template <typename T, typename E>
std::ostream& operator<<(std::ostream& out, const Result<T, E>& result) {
    detail::write_repr(out, result);
    return out;
}

} // namespace allusions
