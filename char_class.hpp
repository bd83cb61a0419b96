#pragma once

namespace ember {

// Character classes used by the lexer. Every predicate takes the int returned by
// std::istream::get so that EOF can be passed in safely.

constexpr bool is_whitespace(int ch) {
    return ch == '\n' || ch == '\r' || ch == ' ' || ch == '\t' || ch == '\f' || ch == '\v';
}

constexpr bool is_letter(int ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

constexpr bool is_digit(int ch) { return ch >= '0' && ch <= '9'; }

constexpr bool is_decimal_point(int ch) { return ch == '.'; }

constexpr bool is_quote(int ch) { return ch == '\'' || ch == '"'; }

constexpr bool is_operator_char(int ch) {
    return ch == '=' || ch == '!' || ch == '+' || ch == '-' || ch == '*' || ch == '/' ||
           ch == '^' || ch == '>' || ch == '<';
}

constexpr bool is_separator_char(int ch) {
    return ch == '(' || ch == ')' || ch == '{' || ch == '}' || ch == '[' || ch == ']' ||
           ch == ';' || ch == ',';
}

}  // namespace ember
