#pragma once

#include <string>
#include <vector>

#include "ast.hpp"

namespace ember {

// Renders the tree as an indented outline, one node per line, two spaces per level.
std::string dump_ast(AST& ast);
std::string dump_ast(const std::vector<ASTPtr>& program);

}  // namespace ember
