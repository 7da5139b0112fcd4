#include "reciprocal.hpp"

#include <charconv>
#include <system_error>

#include "logging.hpp"
#include "repr.hpp"

using allusions::Err;
using allusions::Logger;
using allusions::Ok;

std::ostream& operator<<(std::ostream& out, const ParseError& error) {
    return out << "ParseError(" << allusions::repr(error.input) << ")";
}

std::ostream& operator<<(std::ostream& out, const ZeroDivisionError&) {
    return out << "ZeroDivisionError()";
}

auto to_int(const std::string& text) -> allusions::Result<int, ParseError> {
    int value = 0;
    const auto* const first = text.data();
    const auto* const last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return Err(ParseError{text});
    }
    return Ok(value);
}

auto inverse(int value) -> allusions::Result<double, CalcError> {
    if (value == 0) {
        return Err(CalcError{ZeroDivisionError{}});
    }
    return Ok(1. / value);
}

auto reciprocals(const std::vector<std::string>& inputs) -> std::vector<allusions::Result<double, CalcError>> {
    std::vector<allusions::Result<double, CalcError>> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        auto result = to_int(input).flat_map(inverse);
        Logger::debug("reciprocal of ", allusions::repr(input), ": ", result);
        results.push_back(std::move(result));
    }
    return results;
}
