#pragma once

#include <string>
#include <variant>

#include "pos.hpp"
#include "token_kind.hpp"

namespace ember {

struct Token {
    TokenKind kind = TokenKind::SUB;

    // Identifier and string text, number and bool literal values. Punctuation
    // and the end of input sentinel carry nothing.
    std::variant<std::monostate, bool, double, std::string> value;

    Pos pos;

    const std::string& str() const { return std::get<std::string>(value); }
    double number() const { return std::get<double>(value); }
    bool boolean() const { return std::get<bool>(value); }
};

// Renders a token for diagnostics and the --tokens dump, e.g. IDENT(x) or ';'
std::string describe(const Token& token);

}  // namespace ember
