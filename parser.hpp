#pragma once

#include <initializer_list>
#include <type_traits>
#include <vector>

#include "ast.hpp"
#include "function_view.hpp"
#include "token.hpp"

namespace ember {

struct Parser {
    // Deepest syntax tree the parser builds. Evaluation and destruction recurse
    // over the tree, so this also bounds their stack use.
    static constexpr std::size_t MAX_DEPTH = 256;

    // A SUB token is appended if the sequence does not already end with one
    explicit Parser(std::vector<Token> tokens);

    // Parses statements one at a time and hands each to the handler. Throws
    // ParseError on the first mismatch; statements already handed out stay valid.
    void parse_until_eof(const FunctionView<void(ASTPtr)>& ast_handler);

    // Parses the whole program. Throws ParseError, in which case nothing is returned.
    std::vector<ASTPtr> parse();

private:
    std::vector<Token> m_tokens;
    std::size_t m_index = 0;

    // Nesting of the node being parsed: primaries, wrapping binary nodes and if bodies
    std::size_t m_depth = 0;

    const Token& cur() const;

    // The token after the current one, or the SUB token at the end
    const Token& peek() const;

    void next_token();

    // Throws an error if the current token is not equal to kind
    void expect_token(TokenKind kind) const;

    // Throws an error if the current token is not equal to the kind, or consumes
    // the token if it is
    void eat_token(TokenKind kind);

    ASTPtr parse_statement();
    ASTPtr parse_var_decl();
    ASTPtr parse_assign();
    ASTPtr parse_if();

    ASTPtr parse_left_assoc(ASTPtr (Parser::*operand)(), std::initializer_list<TokenKind> ops);

    ASTPtr parse_expr();
    ASTPtr parse_sum();
    ASTPtr parse_product();
    ASTPtr parse_power();
    ASTPtr parse_primary();
    ASTPtr parse_call();

    template <typename T>
    std::unique_ptr<T> make_ast() {
        static_assert(std::is_base_of_v<AST, T>);

        auto ast = std::make_unique<T>();

        ast->pos = cur().pos;

        return ast;
    }
};

}  // namespace ember
