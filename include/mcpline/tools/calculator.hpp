#pragma once

#include <mcpline/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace mcpline {

// Calculator value: integers stay exact, everything else is a double.
using Number = std::variant<std::int64_t, double>;

// ---------------------------------------------------------------------------
// EvaluateExpression — arithmetic over integers and decimals.
//
// Grammar (** is right-associative and binds tighter
// than a unary sign on its left):
//
//   sum     := term (('+' | '-') term)*
//   term    := unary (('*' | '/' | '//' | '%') unary)*
//   unary   := ('+' | '-') unary | power
//   power   := primary ('**' unary)?
//   primary := number | '(' sum ')'
//
// '/' always yields a double; '//' and '%' floor toward negative infinity.
// Errors are returned as a reason string ("division by zero",
// "invalid syntax", ...).
// ---------------------------------------------------------------------------
Result<Number, std::string> EvaluateExpression(std::string_view expression);

// Integers print as-is; doubles print their shortest
// round-tripping digits ("4.0", "1e+16", "1.5e-05").
std::string FormatNumber(const Number& value);
std::string FormatReal(double value);

} // namespace mcpline
