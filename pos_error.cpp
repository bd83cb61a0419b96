#include "pos_error.hpp"

namespace ember {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LEX:
            return "LexError";
        case ErrorKind::PARSE:
            return "ParseError";
        case ErrorKind::NAME:
            return "NameError";
        case ErrorKind::ARITY:
            return "ArityError";
        case ErrorKind::TYPE:
            return "TypeError";
        case ErrorKind::ARITHMETIC:
            return "ArithmeticError";
    }

    return "Error";
}

PosError::PosError(ErrorKind kind, Pos pos, const std::string& message)
    : m_kind{kind},
      m_pos{std::move(pos)},
      m_message{message},
      m_what{m_pos.filename + ":" + std::to_string(m_pos.line) + ":" +
             std::to_string(m_pos.column) + ": " + error_kind_name(kind) + ": " + message} {}

const char* PosError::what() const noexcept { return m_what.c_str(); }

ErrorKind PosError::kind() const { return m_kind; }

const Pos& PosError::pos() const { return m_pos; }

const std::string& PosError::message() const { return m_message; }

}  // namespace ember
