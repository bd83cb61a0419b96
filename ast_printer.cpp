#include "ast_printer.hpp"

#include <sstream>
#include <type_traits>

#include "ast_visitor.hpp"
#include "value.hpp"

namespace {

struct Printer final : ember::ASTVisitor {
    explicit Printer(std::ostream& out) : m_out{out} {}

    void print(ember::AST& ast) {
        ++m_depth;
        ast.visit(*this);
        --m_depth;
    }

    void visit(ember::LiteralAST& ast) override {
        std::visit(
            [&](auto&& value) {
                using T = std::decay_t<decltype(value)>;

                if constexpr (std::is_same_v<T, double>) {
                    line() << "Number " << ember::format_number(value) << '\n';
                } else if constexpr (std::is_same_v<T, bool>) {
                    line() << "Bool " << (value ? "true" : "false") << '\n';
                } else {
                    line() << "String \"" << value << "\"\n";
                }
            },
            ast.value);
    }

    void visit(ember::IdAST& ast) override { line() << "Identifier " << ast.name << '\n'; }

    void visit(ember::CallAST& ast) override {
        line() << "Call " << ast.name << '\n';

        for (auto& arg : ast.args) {
            print(*arg);
        }
    }

    void visit(ember::BinAST& ast) override {
        line() << "Binary " << ember::token_kind_name(ast.op) << '\n';

        print(*ast.lhs);
        print(*ast.rhs);
    }

    void visit(ember::UnaryAST& ast) override {
        line() << "Unary " << ember::token_kind_name(ast.sign) << '\n';

        print(*ast.operand);
    }

    void visit(ember::VarDeclAST& ast) override {
        line() << "VarDecl " << ast.name << '\n';

        print(*ast.value);
    }

    void visit(ember::AssignAST& ast) override {
        line() << "Assign " << ast.name << '\n';

        print(*ast.value);
    }

    void visit(ember::IfAST& ast) override {
        line() << "If\n";

        print(*ast.condition);

        for (auto& statement : ast.body) {
            print(*statement);
        }
    }

private:
    std::ostream& m_out;

    // Starts below zero so the outermost node is not indented
    int m_depth = -1;

    std::ostream& line() { return m_out << std::string(static_cast<std::size_t>(m_depth) * 2, ' '); }
};

}  // namespace

namespace ember {

std::string dump_ast(AST& ast) {
    std::ostringstream s;

    Printer printer{s};
    printer.print(ast);

    return s.str();
}

std::string dump_ast(const std::vector<ASTPtr>& program) {
    std::string result;

    for (const auto& ast : program) {
        result += dump_ast(*ast);
    }

    return result;
}

}  // namespace ember
