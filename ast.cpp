#include "ast.hpp"

#include "ast_visitor.hpp"

namespace ember {

void LiteralAST::visit(ASTVisitor& v) { v.visit(*this); }

void IdAST::visit(ASTVisitor& v) { v.visit(*this); }

void CallAST::visit(ASTVisitor& v) { v.visit(*this); }

void BinAST::visit(ASTVisitor& v) { v.visit(*this); }

void UnaryAST::visit(ASTVisitor& v) { v.visit(*this); }

void VarDeclAST::visit(ASTVisitor& v) { v.visit(*this); }

void AssignAST::visit(ASTVisitor& v) { v.visit(*this); }

void IfAST::visit(ASTVisitor& v) { v.visit(*this); }

}  // namespace ember
