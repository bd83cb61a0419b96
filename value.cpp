#include "value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

#include "pos_error.hpp"

namespace {

// Upper bound on the length of a string produced by repetition
constexpr std::size_t MAX_REPEAT_BYTES = 16 * 1024 * 1024;

// Integral numbers below this print without a fractional part
constexpr double MAX_EXACT_INTEGER = 1e15;

std::string repeat_string(const std::string& str, double count, const ember::Pos& pos) {
    if (!std::isfinite(count)) {
        throw ember::TypeError{pos, "Cannot repeat a string " + ember::format_number(count) +
                                        " times"};
    }

    const double times = std::trunc(count);

    if (times < 0) {
        throw ember::TypeError{pos, "Cannot repeat a string a negative number of times (" +
                                        ember::format_number(count) + ")"};
    }

    if (str.empty()) {
        return {};
    }

    if (times > static_cast<double>(MAX_REPEAT_BYTES / str.size())) {
        throw ember::TypeError{pos, "String repetition of " + ember::format_number(count) +
                                        " times is too large"};
    }

    const auto n = static_cast<std::size_t>(times);

    std::string result;
    result.reserve(str.size() * n);

    for (std::size_t i = 0; i < n; ++i) {
        result += str;
    }

    return result;
}

}  // namespace

namespace ember {

ValueKind kind_of(const Value& value) { return static_cast<ValueKind>(value.index()); }

const char* kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::NULLV:
            return "Null";
        case ValueKind::NUMBER:
            return "Number";
        case ValueKind::STRING:
            return "String";
        case ValueKind::BOOL:
            return "Bool";
    }

    return "?";
}

const char* kind_name(const Value& value) { return kind_name(kind_of(value)); }

std::string format_number(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }

    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    if (value == std::trunc(value) && std::fabs(value) < MAX_EXACT_INTEGER) {
        return std::to_string(static_cast<long long>(value));
    }

    std::ostringstream s;
    s << std::setprecision(15) << value;

    return s.str();
}

std::string to_display_string(const Value& value) {
    return std::visit(
        [](auto&& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_number(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else {
                return v;
            }
        },
        value);
}

Value apply_binary(TokenKind op, const Value& lhs, const Value& rhs, const Pos& pos) {
    return std::visit(
        [&](auto&& a, auto&& b) -> Value {
            using A = std::decay_t<decltype(a)>;
            using B = std::decay_t<decltype(b)>;

            if constexpr (std::is_same_v<A, double> && std::is_same_v<B, double>) {
                switch (op) {
                    case TokenKind::PLUS:
                        return a + b;
                    case TokenKind::MINUS:
                        return a - b;
                    case TokenKind::STAR:
                        return a * b;
                    case TokenKind::SLASH:
                        if (b == 0.0) {
                            throw ArithmeticError{
                                pos, "Cannot divide by zero: " + format_number(a) + " / 0"};
                        }
                        return a / b;
                    case TokenKind::CARET:
                        return std::pow(a, b);
                    case TokenKind::GT:
                        return a > b;
                    case TokenKind::LT:
                        return a < b;
                    default:
                        break;
                }
            } else if constexpr (std::is_same_v<A, std::string> && std::is_same_v<B, std::string>) {
                switch (op) {
                    case TokenKind::PLUS:
                        return a + b;
                    case TokenKind::GT:
                        return a > b;
                    case TokenKind::LT:
                        return a < b;
                    default:
                        break;
                }
            } else if constexpr (std::is_same_v<A, std::string> && std::is_same_v<B, double>) {
                switch (op) {
                    case TokenKind::PLUS:
                        return a + format_number(b);
                    case TokenKind::STAR:
                        return repeat_string(a, b, pos);
                    default:
                        break;
                }
            } else if constexpr (std::is_same_v<A, double> && std::is_same_v<B, std::string>) {
                switch (op) {
                    case TokenKind::PLUS:
                        return format_number(a) + b;
                    case TokenKind::STAR:
                        return repeat_string(b, a, pos);
                    default:
                        break;
                }
            }

            throw TypeError{pos, std::string{"Cannot apply operator "} + token_kind_name(op) +
                                     " to " + kind_name(lhs) + " and " + kind_name(rhs)};
        },
        lhs, rhs);
}

}  // namespace ember
