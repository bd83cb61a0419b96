#pragma once

namespace ember {

struct LiteralAST;
struct IdAST;
struct CallAST;
struct BinAST;
struct UnaryAST;
struct VarDeclAST;
struct AssignAST;
struct IfAST;

struct ASTVisitor {
    virtual ~ASTVisitor() = default;

    virtual void visit(LiteralAST&);
    virtual void visit(IdAST&);
    virtual void visit(CallAST&);
    virtual void visit(BinAST&);
    virtual void visit(UnaryAST&);
    virtual void visit(VarDeclAST&);
    virtual void visit(AssignAST&);
    virtual void visit(IfAST&);
};

}  // namespace ember
