#include "parser.hpp"

#include <algorithm>

#include "pos_error.hpp"

namespace {

// Adds levels to the parser depth and removes them again on scope exit
struct DepthGuard {
    explicit DepthGuard(std::size_t& depth) : m_depth{depth} {}
    ~DepthGuard() { m_depth -= m_added; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

    void add(const ember::Pos& pos) {
        if (m_depth >= ember::Parser::MAX_DEPTH) {
            throw ember::ParseError{pos, "Expression is nested too deeply"};
        }

        ++m_depth;
        ++m_added;
    }

private:
    std::size_t& m_depth;
    std::size_t m_added = 0;
};

}  // namespace

namespace ember {

Parser::Parser(std::vector<Token> tokens) : m_tokens{std::move(tokens)} {
    if (m_tokens.empty() || m_tokens.back().kind != TokenKind::SUB) {
        Token sub;
        sub.kind = TokenKind::SUB;

        if (!m_tokens.empty()) {
            sub.pos = m_tokens.back().pos;
        }

        m_tokens.push_back(std::move(sub));
    }
}

void Parser::parse_until_eof(const FunctionView<void(ASTPtr)>& ast_handler) {
    while (cur().kind != TokenKind::SUB) {
        auto ast = parse_statement();

        eat_token(TokenKind::SEMI);

        ast_handler(std::move(ast));
    }
}

std::vector<ASTPtr> Parser::parse() {
    std::vector<ASTPtr> program;

    parse_until_eof([&](ASTPtr ast) { program.push_back(std::move(ast)); });

    return program;
}

const Token& Parser::cur() const { return m_tokens[m_index]; }

const Token& Parser::peek() const { return m_tokens[std::min(m_index + 1, m_tokens.size() - 1)]; }

void Parser::next_token() {
    if (m_index + 1 < m_tokens.size()) {
        ++m_index;
    }
}

void Parser::expect_token(TokenKind kind) const {
    if (cur().kind != kind) {
        throw ParseError{cur().pos, std::string{"Expected '"} + token_kind_name(kind) +
                                        "' but found " + describe(cur())};
    }
}

void Parser::eat_token(TokenKind kind) {
    expect_token(kind);
    next_token();
}

ASTPtr Parser::parse_statement() {
    if (cur().kind == TokenKind::IDENT) {
        if (cur().str() == "let") {
            return parse_var_decl();
        }

        if (cur().str() == "if") {
            return parse_if();
        }

        if (peek().kind == TokenKind::EQUAL) {
            return parse_assign();
        }
    }

    return parse_expr();
}

ASTPtr Parser::parse_var_decl() {
    auto ast = make_ast<VarDeclAST>();

    next_token();

    expect_token(TokenKind::IDENT);

    ast->name = cur().str();
    next_token();

    eat_token(TokenKind::EQUAL);

    ast->value = parse_expr();

    return ast;
}

ASTPtr Parser::parse_assign() {
    auto ast = make_ast<AssignAST>();

    ast->name = cur().str();
    next_token();

    eat_token(TokenKind::EQUAL);

    ast->value = parse_expr();

    return ast;
}

ASTPtr Parser::parse_if() {
    DepthGuard depth{m_depth};
    depth.add(cur().pos);

    auto ast = make_ast<IfAST>();

    next_token();

    ast->condition = parse_expr();

    eat_token(TokenKind::OPENCURLY);

    while (cur().kind != TokenKind::CLOSECURLY) {
        if (cur().kind == TokenKind::SUB) {
            expect_token(TokenKind::CLOSECURLY);
        }

        ast->body.push_back(parse_statement());

        eat_token(TokenKind::SEMI);
    }

    eat_token(TokenKind::CLOSECURLY);

    return ast;
}

ASTPtr Parser::parse_left_assoc(ASTPtr (Parser::*operand)(), std::initializer_list<TokenKind> ops) {
    // Each wrapping node deepens the left spine, and the right operands are
    // parsed below all of them
    DepthGuard depth{m_depth};

    auto ast = (this->*operand)();

    while (std::find(ops.begin(), ops.end(), cur().kind) != ops.end()) {
        depth.add(cur().pos);

        auto bin_ast = make_ast<BinAST>();

        bin_ast->op = cur().kind;
        next_token();

        bin_ast->lhs = std::move(ast);
        bin_ast->rhs = (this->*operand)();

        ast = std::move(bin_ast);
    }

    return ast;
}

ASTPtr Parser::parse_expr() {
    return parse_left_assoc(&Parser::parse_sum, {TokenKind::GT, TokenKind::LT});
}

ASTPtr Parser::parse_sum() {
    return parse_left_assoc(&Parser::parse_product, {TokenKind::PLUS, TokenKind::MINUS});
}

ASTPtr Parser::parse_product() {
    return parse_left_assoc(&Parser::parse_power, {TokenKind::STAR, TokenKind::SLASH});
}

ASTPtr Parser::parse_power() {
    return parse_left_assoc(&Parser::parse_primary, {TokenKind::CARET});
}

ASTPtr Parser::parse_primary() {
    DepthGuard depth{m_depth};
    depth.add(cur().pos);

    switch (cur().kind) {
        case TokenKind::OPENPAREN: {
            next_token();

            auto ast = parse_expr();

            eat_token(TokenKind::CLOSEPAREN);

            return ast;
        } break;

        case TokenKind::NUMBER_VALUE: {
            auto ast = make_ast<LiteralAST>();

            ast->value = cur().number();
            next_token();

            return ast;
        } break;

        case TokenKind::BOOL_VALUE: {
            auto ast = make_ast<LiteralAST>();

            ast->value = cur().boolean();
            next_token();

            return ast;
        } break;

        case TokenKind::STRING_VALUE: {
            auto ast = make_ast<LiteralAST>();

            ast->value = cur().str();
            next_token();

            return ast;
        } break;

        case TokenKind::PLUS:
        case TokenKind::MINUS: {
            auto ast = make_ast<UnaryAST>();

            ast->sign = cur().kind;
            next_token();

            ast->operand = parse_primary();

            return ast;
        } break;

        case TokenKind::IDENT: {
            if (peek().kind == TokenKind::OPENPAREN) {
                return parse_call();
            }

            auto ast = make_ast<IdAST>();

            ast->name = cur().str();
            next_token();

            return ast;
        } break;

        default:
            break;
    }

    throw ParseError{cur().pos, "Expected expression but found " + describe(cur())};
}

ASTPtr Parser::parse_call() {
    auto ast = make_ast<CallAST>();

    ast->name = cur().str();
    next_token();

    eat_token(TokenKind::OPENPAREN);

    if (cur().kind != TokenKind::CLOSEPAREN) {
        for (;;) {
            // Arguments bind at sum precedence, comparisons need parentheses
            ast->args.push_back(parse_sum());

            if (cur().kind != TokenKind::COMMA) {
                break;
            }

            next_token();
        }
    }

    eat_token(TokenKind::CLOSEPAREN);

    return ast;
}

}  // namespace ember
