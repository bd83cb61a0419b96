#include "ast_visitor.hpp"

namespace ember {

void ASTVisitor::visit(LiteralAST&) {}
void ASTVisitor::visit(IdAST&) {}
void ASTVisitor::visit(CallAST&) {}
void ASTVisitor::visit(BinAST&) {}
void ASTVisitor::visit(UnaryAST&) {}
void ASTVisitor::visit(VarDeclAST&) {}
void ASTVisitor::visit(AssignAST&) {}
void ASTVisitor::visit(IfAST&) {}

}  // namespace ember
