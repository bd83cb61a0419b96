#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pos.hpp"
#include "value.hpp"

namespace ember {

// Lexical scopes stored in an arena and addressed by index. Scopes are entered
// and left in stack order, so leaving a scope simply discards the last one.
struct Environment {
    Environment();

    // Throws NameError if name already exists in the current scope
    void declare(const std::string& name, Value value, const Pos& pos = {});

    // Overwrites the nearest binding of name. Throws NameError if there is none.
    void assign(const std::string& name, Value value, const Pos& pos = {});

    // Throws NameError if name is not bound in any enclosing scope
    const Value& resolve(const std::string& name, const Pos& pos = {}) const;

    // Whether name is bound in any enclosing scope
    bool contains(const std::string& name) const;

    void push_scope();

    // Throws std::logic_error when called on the root scope
    void pop_scope();

    // Number of live scopes, 1 when only the root scope exists
    std::size_t depth() const;

private:
    struct Scope {
        std::unordered_map<std::string, Value> vars;
        std::optional<std::size_t> parent;
    };

    std::vector<Scope> m_scopes;
    std::size_t m_current = 0;

    const Value* find(const std::string& name) const;
    Value* find(const std::string& name);
};

}  // namespace ember
