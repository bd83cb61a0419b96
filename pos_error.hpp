#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

#include "pos.hpp"

namespace ember {

enum class ErrorKind : std::uint8_t { LEX, PARSE, NAME, ARITY, TYPE, ARITHMETIC };

const char* error_kind_name(ErrorKind kind);

struct PosError : public std::exception {
    PosError(ErrorKind kind, Pos pos, const std::string& message);

    const char* what() const noexcept override;

    ErrorKind kind() const;
    const Pos& pos() const;

    // The message without the position and kind prefix
    const std::string& message() const;

private:
    ErrorKind m_kind;
    Pos m_pos;
    std::string m_message;
    std::string m_what;
};

struct LexError final : PosError {
    LexError(Pos pos, const std::string& message)
        : PosError{ErrorKind::LEX, std::move(pos), message} {}
};

struct ParseError final : PosError {
    ParseError(Pos pos, const std::string& message)
        : PosError{ErrorKind::PARSE, std::move(pos), message} {}
};

struct NameError final : PosError {
    NameError(Pos pos, const std::string& message)
        : PosError{ErrorKind::NAME, std::move(pos), message} {}
};

struct ArityError final : PosError {
    ArityError(Pos pos, const std::string& message)
        : PosError{ErrorKind::ARITY, std::move(pos), message} {}
};

struct TypeError final : PosError {
    TypeError(Pos pos, const std::string& message)
        : PosError{ErrorKind::TYPE, std::move(pos), message} {}
};

struct ArithmeticError final : PosError {
    ArithmeticError(Pos pos, const std::string& message)
        : PosError{ErrorKind::ARITHMETIC, std::move(pos), message} {}
};

}  // namespace ember
