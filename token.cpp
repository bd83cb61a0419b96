#include "token.hpp"

#include "value.hpp"

namespace ember {

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::OPENPAREN:
            return "(";
        case TokenKind::CLOSEPAREN:
            return ")";
        case TokenKind::OPENCURLY:
            return "{";
        case TokenKind::CLOSECURLY:
            return "}";
        case TokenKind::OPENSQUARE:
            return "[";
        case TokenKind::CLOSESQUARE:
            return "]";
        case TokenKind::SEMI:
            return ";";
        case TokenKind::COMMA:
            return ",";
        case TokenKind::EQUAL:
            return "=";
        case TokenKind::NOT_EQUALS:
            return "!=";
        case TokenKind::BANG:
            return "!";
        case TokenKind::PLUS:
            return "+";
        case TokenKind::MINUS:
            return "-";
        case TokenKind::STAR:
            return "*";
        case TokenKind::SLASH:
            return "/";
        case TokenKind::CARET:
            return "^";
        case TokenKind::GT:
            return ">";
        case TokenKind::LT:
            return "<";
        case TokenKind::BOOL_VALUE:
            return "boolean literal";
        case TokenKind::NUMBER_VALUE:
            return "number literal";
        case TokenKind::STRING_VALUE:
            return "string literal";
        case TokenKind::IDENT:
            return "identifier";
        case TokenKind::SUB:
            return "end of input";
    }

    return "?";
}

std::string describe(const Token& token) {
    switch (token.kind) {
        case TokenKind::BOOL_VALUE:
            return token.boolean() ? "BOOL(true)" : "BOOL(false)";
        case TokenKind::NUMBER_VALUE:
            return "NUMBER(" + format_number(token.number()) + ")";
        case TokenKind::STRING_VALUE:
            return "STRING(" + token.str() + ")";
        case TokenKind::IDENT:
            return "IDENT(" + token.str() + ")";
        case TokenKind::SUB:
            return "EOF";
        default:
            break;
    }

    return std::string{"'"} + token_kind_name(token.kind) + "'";
}

}  // namespace ember
