#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "pos.hpp"
#include "token_kind.hpp"

namespace ember {

struct ASTVisitor;

struct AST {
    Pos pos;

    virtual ~AST() = default;

    // Dispatches to the matching ASTVisitor::visit overload. Children are not
    // visited; visitors decide if and when to descend.
    virtual void visit(ASTVisitor&) = 0;
};

using ASTPtr = std::unique_ptr<AST>;

struct LiteralAST final : AST {
    std::variant<double, bool, std::string> value;

    void visit(ASTVisitor& v) override;
};

struct IdAST final : AST {
    std::string name;

    void visit(ASTVisitor& v) override;
};

struct CallAST final : AST {
    std::string name;
    std::vector<ASTPtr> args;

    void visit(ASTVisitor& v) override;
};

struct BinAST final : AST {
    TokenKind op;

    ASTPtr lhs;
    ASTPtr rhs;

    void visit(ASTVisitor& v) override;
};

struct UnaryAST final : AST {
    // Either PLUS or MINUS
    TokenKind sign;

    ASTPtr operand;

    void visit(ASTVisitor& v) override;
};

struct VarDeclAST final : AST {
    std::string name;
    ASTPtr value;

    void visit(ASTVisitor& v) override;
};

struct AssignAST final : AST {
    std::string name;
    ASTPtr value;

    void visit(ASTVisitor& v) override;
};

struct IfAST final : AST {
    ASTPtr condition;
    std::vector<ASTPtr> body;

    void visit(ASTVisitor& v) override;
};

}  // namespace ember
