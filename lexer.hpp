#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "pos.hpp"
#include "token.hpp"

namespace ember {

struct Lexer {
    Lexer(std::istream& s, std::string filename);

    // Throws LexError on an unrecognized character, an unterminated string or a
    // number with more than one decimal point. Once the input is exhausted this
    // keeps returning the SUB token.
    Token next_token();

private:
    std::istream& m_s;

    // Position of m_last. The column starts at 0 because the initial space
    // below is consumed before the first real character.
    Pos m_pos;

    // This initial empty space makes sure that the lexer
    // reads at least one character from the stream
    // since it is automatically skipped.
    int m_last = ' ';

    // The string buffer of the token
    std::string m_str;

    void advance();
    void push_advance();
};

// Lexes the whole text, the returned tokens always end with exactly one SUB token
std::vector<Token> tokenize(std::string_view text, std::string filename = "<string>");

}  // namespace ember
