#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "pos.hpp"
#include "token_kind.hpp"

namespace ember {

// Runtime values. Construct string values from std::string, never from a raw
// string literal, which would pick the bool alternative.
using Value = std::variant<std::monostate, double, std::string, bool>;

enum class ValueKind : std::uint8_t { NULLV, NUMBER, STRING, BOOL };

ValueKind kind_of(const Value& value);

const char* kind_name(ValueKind kind);
const char* kind_name(const Value& value);

std::string format_number(double value);

// The text print writes: null, true/false, the number or the string itself
std::string to_display_string(const Value& value);

// Applies one of the binary operators PLUS, MINUS, STAR, SLASH, CARET, GT or LT.
// Throws TypeError for operand kinds the operator does not support and
// ArithmeticError when dividing by zero.
Value apply_binary(TokenKind op, const Value& lhs, const Value& rhs, const Pos& pos);

}  // namespace ember
