#include "function_registry.hpp"

#include <stdexcept>

#include "pos_error.hpp"

namespace ember {

const char* param_kind_name(ParamKind kind) {
    switch (kind) {
        case ParamKind::NUMBER:
            return "Number";
        case ParamKind::STRING:
            return "String";
        case ParamKind::BOOL:
            return "Bool";
        case ParamKind::ANY:
            return "Any";
        case ParamKind::NULLV:
            return "Null";
    }

    return "?";
}

bool matches(ParamKind kind, const Value& value) {
    switch (kind) {
        case ParamKind::NUMBER:
            return std::holds_alternative<double>(value);
        case ParamKind::STRING:
            return std::holds_alternative<std::string>(value);
        case ParamKind::BOOL:
            return std::holds_alternative<bool>(value);
        case ParamKind::ANY:
            return true;
        case ParamKind::NULLV:
            return std::holds_alternative<std::monostate>(value);
    }

    return false;
}

Arity Arity::exact(std::size_t count) { return Arity{count, false}; }

Arity Arity::at_least(std::size_t count) { return Arity{count, true}; }

bool Arity::accepts(std::size_t arg_count) const {
    return variadic ? arg_count >= count : arg_count == count;
}

ParamKind Signature::param(std::size_t i) const {
    if (i < params.size()) {
        return params[i];
    }

    return params.empty() ? ParamKind::ANY : params.back();
}

Arguments::Arguments(const std::vector<Value>& values, const std::string& function_name, Pos pos)
    : m_values{values}, m_function_name{function_name}, m_pos{std::move(pos)} {}

std::size_t Arguments::size() const { return m_values.size(); }

bool Arguments::has(std::size_t i) const { return i < m_values.size(); }

template <typename T>
const T& Arguments::get(std::size_t i, ValueKind expected) const {
    if (!has(i)) {
        throw ArityError{m_pos, "Missing argument at position " + std::to_string(i) +
                                    " of function " + m_function_name};
    }

    const auto* value = std::get_if<T>(&m_values[i]);

    if (!value) {
        throw TypeError{m_pos, "Expected argument at position " + std::to_string(i) +
                                   " of function " + m_function_name + " to be a " +
                                   kind_name(expected) + " but got " + kind_name(m_values[i])};
    }

    return *value;
}

double Arguments::as_number(std::size_t i) const { return get<double>(i, ValueKind::NUMBER); }

const std::string& Arguments::as_string(std::size_t i) const {
    return get<std::string>(i, ValueKind::STRING);
}

bool Arguments::as_bool(std::size_t i) const { return get<bool>(i, ValueKind::BOOL); }

const Value& Arguments::as_any(std::size_t i) const {
    if (!has(i)) {
        throw ArityError{m_pos, "Missing argument at position " + std::to_string(i) +
                                    " of function " + m_function_name};
    }

    return m_values[i];
}

const Pos& Arguments::pos() const { return m_pos; }

LambdaFunction::LambdaFunction(std::string name, Signature signature, Callback callback)
    : m_name{std::move(name)},
      m_signature{std::move(signature)},
      m_callback{std::move(callback)} {}

const std::string& LambdaFunction::name() const { return m_name; }

const Signature& LambdaFunction::signature() const { return m_signature; }

Value LambdaFunction::invoke(const Arguments& args) { return m_callback(args); }

void FunctionRegistry::add_function(std::unique_ptr<NativeFunction> function) {
    const auto& signature = function->signature();

    if (!signature.arity.variadic && signature.params.size() != signature.arity.count) {
        throw std::invalid_argument{"Function " + function->name() + " declares " +
                                    std::to_string(signature.params.size()) +
                                    " parameter kinds for an arity of " +
                                    std::to_string(signature.arity.count)};
    }

    if (contains(function->name())) {
        throw NameError{{}, "Function " + function->name() + " is already registered"};
    }

    auto name = function->name();
    m_functions.emplace(std::move(name), std::move(function));
}

void FunctionRegistry::add_function(std::string name, Arity arity, std::vector<ParamKind> params,
                                    LambdaFunction::Callback callback) {
    add_function(std::make_unique<LambdaFunction>(
        std::move(name), Signature{arity, std::move(params)}, std::move(callback)));
}

bool FunctionRegistry::contains(const std::string& name) const {
    return m_functions.find(name) != m_functions.end();
}

Value FunctionRegistry::call(const std::string& name, const std::vector<Value>& args,
                             const Pos& pos) {
    auto found = m_functions.find(name);

    if (found == m_functions.end()) {
        throw NameError{pos, "Function " + name + " does not exist"};
    }

    auto& function = *found->second;
    const auto& signature = function.signature();

    if (!signature.arity.accepts(args.size())) {
        throw ArityError{pos, "Function " + name + " expects " +
                                  (signature.arity.variadic ? "at least " : "") +
                                  std::to_string(signature.arity.count) + " arguments, got " +
                                  std::to_string(args.size())};
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto expected = signature.param(i);

        if (!matches(expected, args[i])) {
            throw TypeError{pos, "Argument " + std::to_string(i) + " of function " + name +
                                     " expected " + param_kind_name(expected) + ", got " +
                                     kind_name(args[i])};
        }
    }

    return function.invoke(Arguments{args, function.name(), pos});
}

}  // namespace ember
