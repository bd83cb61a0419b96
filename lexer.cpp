#include "lexer.hpp"

#include <array>
#include <charconv>
#include <istream>
#include <sstream>

#include "char_class.hpp"
#include "pos_error.hpp"

namespace {

struct Entity {
    std::string_view str;
    ember::TokenKind token_kind;
};

constexpr std::array<Entity, 8> SEPARATORS{{{"(", ember::TokenKind::OPENPAREN},
                                            {")", ember::TokenKind::CLOSEPAREN},
                                            {"{", ember::TokenKind::OPENCURLY},
                                            {"}", ember::TokenKind::CLOSECURLY},
                                            {",", ember::TokenKind::COMMA},
                                            {";", ember::TokenKind::SEMI},
                                            {"[", ember::TokenKind::OPENSQUARE},
                                            {"]", ember::TokenKind::CLOSESQUARE}}};

constexpr std::array<Entity, 10> OPERATORS{{{"=", ember::TokenKind::EQUAL},
                                            {"!", ember::TokenKind::BANG},
                                            {"!=", ember::TokenKind::NOT_EQUALS},

                                            {"+", ember::TokenKind::PLUS},
                                            {"-", ember::TokenKind::MINUS},
                                            {"*", ember::TokenKind::STAR},
                                            {"/", ember::TokenKind::SLASH},
                                            {"^", ember::TokenKind::CARET},

                                            {">", ember::TokenKind::GT},
                                            {"<", ember::TokenKind::LT}}};

constexpr bool is_sub(int ch) { return ch == std::istream::traits_type::eof(); }

}  // namespace

namespace ember {

Lexer::Lexer(std::istream& s, std::string filename) : m_s{s}, m_pos{1, 0, std::move(filename)} {}

void Lexer::advance() {
    if (m_last == '\n') {
        ++m_pos.line;
        m_pos.column = 1;
    } else {
        ++m_pos.column;
    }

    m_last = m_s.get();
}

void Lexer::push_advance() {
    m_str.push_back(static_cast<char>(m_last));
    advance();
}

Token Lexer::next_token() {
    m_str.clear();

    while (is_whitespace(m_last)) {
        advance();
    }

    Token token;
    token.pos = m_pos;

    if (is_letter(m_last)) {
        while (is_letter(m_last)) {
            push_advance();
        }

        if (m_str == "true" || m_str == "false") {
            token.kind = TokenKind::BOOL_VALUE;
            token.value = m_str == "true";
            return token;
        }

        token.kind = TokenKind::IDENT;
        token.value = m_str;
        return token;
    }

    if (is_digit(m_last) || (is_decimal_point(m_last) && is_digit(m_s.peek()))) {
        bool has_radix = false;

        while (is_digit(m_last) || is_decimal_point(m_last)) {
            if (is_decimal_point(m_last)) {
                if (has_radix) {
                    throw LexError{token.pos, "Malformed number " + m_str + "."};
                }

                has_radix = true;
            }

            push_advance();
        }

        // from_chars ignores the C locale, so the decimal point is always '.'
        double value = 0;
        const auto [end, ec] = std::from_chars(m_str.data(), m_str.data() + m_str.size(), value);

        if (ec != std::errc{} || end != m_str.data() + m_str.size()) {
            throw LexError{token.pos, "Malformed number " + m_str};
        }

        token.kind = TokenKind::NUMBER_VALUE;
        token.value = value;
        return token;
    }

    if (is_quote(m_last)) {
        const int quote = m_last;
        advance();

        while (!is_sub(m_last) && m_last != quote) {
            push_advance();
        }

        if (m_last != quote) {
            throw LexError{token.pos, std::string{"Expected "} + static_cast<char>(quote) +
                                          " to terminate string literal"};
        }

        advance();

        token.kind = TokenKind::STRING_VALUE;
        token.value = m_str;
        return token;
    }

    if (is_separator_char(m_last)) {
        for (const auto& sep : SEPARATORS) {
            if (m_last == sep.str[0]) {
                advance();
                token.kind = sep.token_kind;
                return token;
            }
        }
    }

    if (is_sub(m_last)) {
        token.kind = TokenKind::SUB;
        return token;
    }

    if (!is_operator_char(m_last)) {
        throw LexError{token.pos, std::string{"Unexpected character '"} +
                                      static_cast<char>(m_last) + "'"};
    }

    // We look for the longest operator that matches
    // the characters consumed so far exactly.
    const Entity* last_valid_operator = nullptr;

    for (;;) {
        // We stop as soon as there are no possible operators
        // that match the currently consumed sequence.
        const Entity* potential_operator = nullptr;

        m_str.push_back(static_cast<char>(m_last));

        for (const auto& op : OPERATORS) {
            if (op.str.substr(0, m_str.size()) == m_str) {
                potential_operator = &op;

                if (m_str == op.str) {
                    last_valid_operator = &op;
                }
            }
        }

        if (!potential_operator) {
            break;
        }

        advance();
    }

    if (last_valid_operator) {
        token.kind = last_valid_operator->token_kind;
        return token;
    }

    throw LexError{token.pos, "Unexpected character '" + m_str.substr(0, 1) + "'"};
}

std::vector<Token> tokenize(std::string_view text, std::string filename) {
    std::istringstream s{std::string{text}};

    Lexer lexer{s, std::move(filename)};

    std::vector<Token> tokens;

    for (;;) {
        tokens.push_back(lexer.next_token());

        if (tokens.back().kind == TokenKind::SUB) {
            break;
        }
    }

    return tokens;
}

}  // namespace ember
