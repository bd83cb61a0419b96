#pragma once

#include <cstdint>

namespace ember {

enum class TokenKind : std::uint8_t {
    OPENPAREN,
    CLOSEPAREN,
    OPENCURLY,
    CLOSECURLY,
    OPENSQUARE,
    CLOSESQUARE,

    SEMI,
    COMMA,

    EQUAL,
    NOT_EQUALS,
    BANG,

    PLUS,
    MINUS,
    STAR,
    SLASH,
    CARET,
    GT,
    LT,

    BOOL_VALUE,
    NUMBER_VALUE,
    STRING_VALUE,

    IDENT,

    SUB
};

// Returns the source spelling of the token kind, or a description for kinds
// that carry a value
const char* token_kind_name(TokenKind kind);

}  // namespace ember
