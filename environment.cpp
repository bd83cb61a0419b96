#include "environment.hpp"

#include <stdexcept>

#include "pos_error.hpp"

namespace ember {

Environment::Environment() : m_scopes(1) {}

const Value* Environment::find(const std::string& name) const {
    std::optional<std::size_t> index = m_current;

    while (index) {
        const auto& scope = m_scopes[*index];

        auto found = scope.vars.find(name);

        if (found != scope.vars.end()) {
            return &found->second;
        }

        index = scope.parent;
    }

    return nullptr;
}

Value* Environment::find(const std::string& name) {
    return const_cast<Value*>(static_cast<const Environment&>(*this).find(name));
}

void Environment::declare(const std::string& name, Value value, const Pos& pos) {
    auto& vars = m_scopes[m_current].vars;

    if (vars.count(name) != 0) {
        throw NameError{pos, "Variable " + name + " was already declared"};
    }

    vars.emplace(name, std::move(value));
}

void Environment::assign(const std::string& name, Value value, const Pos& pos) {
    auto* found = find(name);

    if (!found) {
        throw NameError{pos, "Attempted to assign to undeclared variable " + name};
    }

    *found = std::move(value);
}

const Value& Environment::resolve(const std::string& name, const Pos& pos) const {
    const auto* found = find(name);

    if (!found) {
        throw NameError{pos, "Variable " + name + " does not exist"};
    }

    return *found;
}

bool Environment::contains(const std::string& name) const { return find(name) != nullptr; }

void Environment::push_scope() {
    Scope scope;
    scope.parent = m_current;

    m_scopes.push_back(std::move(scope));
    m_current = m_scopes.size() - 1;
}

void Environment::pop_scope() {
    const auto parent = m_scopes[m_current].parent;

    if (!parent) {
        throw std::logic_error{"Attempted to pop the root scope"};
    }

    m_scopes.pop_back();
    m_current = *parent;
}

std::size_t Environment::depth() const { return m_scopes.size(); }

}  // namespace ember
