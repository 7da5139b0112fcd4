#pragma once
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "result.hpp"

// Text that isn't a decimal integer.
struct ParseError {
    std::string input;

    bool operator==(const ParseError&) const = default;
    friend std::ostream& operator<<(std::ostream& out, const ParseError& error);
};

struct ZeroDivisionError {
    bool operator==(const ZeroDivisionError&) const = default;
    friend std::ostream& operator<<(std::ostream& out, const ZeroDivisionError& error);
};

using CalcError = std::variant<ParseError, ZeroDivisionError>;

/// "150" -> Ok(150), "x" -> Err(ParseError("x"))
auto to_int(const std::string& text) -> allusions::Result<int, ParseError>;

/// 5 -> Ok(0.2), 0 -> Err(ZeroDivisionError())
auto inverse(int value) -> allusions::Result<double, CalcError>;

/// to_int(input).flat_map(inverse) for every input, in order
auto reciprocals(const std::vector<std::string>& inputs) -> std::vector<allusions::Result<double, CalcError>>;
