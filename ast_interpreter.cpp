#include "ast_interpreter.hpp"

#include <iostream>
#include <random>
#include <vector>

#include "ast.hpp"
#include "ast_visitor.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "pos_error.hpp"

namespace {

struct ScopeGuard {
    explicit ScopeGuard(ember::Environment& env) : m_env{env} { m_env.push_scope(); }
    ~ScopeGuard() { m_env.pop_scope(); }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    ember::Environment& m_env;
};

struct Evaluator final : ember::ASTVisitor {
    Evaluator(ember::Environment& env, ember::FunctionRegistry& functions)
        : m_env{env}, m_functions{functions} {}

    ember::Value eval(ember::AST& ast) {
        ast.visit(*this);
        return std::move(m_value);
    }

    void visit(ember::LiteralAST& ast) override {
        std::visit([&](auto&& value) { m_value = value; }, ast.value);
    }

    void visit(ember::IdAST& ast) override { m_value = m_env.resolve(ast.name, ast.pos); }

    void visit(ember::VarDeclAST& ast) override {
        auto value = eval(*ast.value);

        m_env.declare(ast.name, std::move(value), ast.pos);
        m_value = std::monostate{};
    }

    void visit(ember::AssignAST& ast) override {
        auto value = eval(*ast.value);

        m_env.assign(ast.name, std::move(value), ast.pos);
        m_value = std::monostate{};
    }

    void visit(ember::UnaryAST& ast) override {
        auto value = eval(*ast.operand);

        // Unary signs go through multiplication, so they apply to anything
        // multiplication accepts.
        const double sign = ast.sign == ember::TokenKind::MINUS ? -1.0 : 1.0;

        m_value = ember::apply_binary(ember::TokenKind::STAR, value, sign, ast.pos);
    }

    void visit(ember::BinAST& ast) override {
        auto lhs_value = eval(*ast.lhs);
        auto rhs_value = eval(*ast.rhs);

        m_value = ember::apply_binary(ast.op, lhs_value, rhs_value, ast.pos);
    }

    void visit(ember::CallAST& ast) override {
        std::vector<ember::Value> args;
        args.reserve(ast.args.size());

        for (auto& arg : ast.args) {
            args.push_back(eval(*arg));
        }

        m_value = m_functions.call(ast.name, args, ast.pos);
    }

    void visit(ember::IfAST& ast) override {
        auto condition = eval(*ast.condition);

        const auto* taken = std::get_if<bool>(&condition);

        if (!taken) {
            throw ember::TypeError{ast.condition->pos,
                                   std::string{"Condition of if must be a Bool, got "} +
                                       ember::kind_name(condition)};
        }

        if (*taken) {
            ScopeGuard scope{m_env};

            for (auto& statement : ast.body) {
                eval(*statement);
            }
        }

        m_value = std::monostate{};
    }

private:
    ember::Environment& m_env;
    ember::FunctionRegistry& m_functions;

    ember::Value m_value;
};

}  // namespace

namespace ember {

Interpreter::Interpreter() : Interpreter{std::cin, std::cout} {}

Interpreter::Interpreter(std::istream& in, std::ostream& out)
    : m_host{in, out, std::mt19937{std::random_device{}()}} {
    load_builtins(functions, m_host);
}

Value Interpreter::run(std::string_view source, std::string filename) {
    Parser parser{tokenize(source, std::move(filename))};

    auto program = parser.parse();

    Value last_value;

    for (auto& ast : program) {
        last_value = eval(*ast);
    }

    return last_value;
}

Value Interpreter::eval(AST& ast) {
    Evaluator evaluator{env, functions};

    return evaluator.eval(ast);
}

void Interpreter::seed_random(std::uint32_t seed) { m_host.random_engine.seed(seed); }

}  // namespace ember
