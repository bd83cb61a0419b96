#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "pos.hpp"
#include "value.hpp"

namespace ember {

enum class ParamKind : std::uint8_t { NUMBER, STRING, BOOL, ANY, NULLV };

const char* param_kind_name(ParamKind kind);

bool matches(ParamKind kind, const Value& value);

struct Arity {
    std::size_t count = 0;

    // When set, count is a minimum rather than an exact number of arguments
    bool variadic = false;

    static Arity exact(std::size_t count);
    static Arity at_least(std::size_t count);

    bool accepts(std::size_t arg_count) const;
};

struct Signature {
    Arity arity;
    std::vector<ParamKind> params;

    // Kind expected at position i. Positions past the declared list reuse the
    // last declared kind, or ANY if nothing is declared.
    ParamKind param(std::size_t i) const;
};

// Read-only view of the evaluated arguments of a call
struct Arguments {
    Arguments(const std::vector<Value>& values, const std::string& function_name, Pos pos);

    std::size_t size() const;
    bool has(std::size_t i) const;

    // Each of these throws ArityError if there is no argument at position i and
    // TypeError if it holds a different kind of value.
    double as_number(std::size_t i) const;
    const std::string& as_string(std::size_t i) const;
    bool as_bool(std::size_t i) const;
    const Value& as_any(std::size_t i) const;

    // Where the call appeared in the script
    const Pos& pos() const;

private:
    const std::vector<Value>& m_values;
    const std::string& m_function_name;
    Pos m_pos;

    template <typename T>
    const T& get(std::size_t i, ValueKind expected) const;
};

struct NativeFunction {
    virtual ~NativeFunction() = default;

    virtual const std::string& name() const = 0;
    virtual const Signature& signature() const = 0;

    // Called only with arguments that already satisfy signature()
    virtual Value invoke(const Arguments& args) = 0;
};

// Adapts any callable to the NativeFunction interface
struct LambdaFunction final : NativeFunction {
    using Callback = std::function<Value(const Arguments&)>;

    LambdaFunction(std::string name, Signature signature, Callback callback);

    const std::string& name() const override;
    const Signature& signature() const override;
    Value invoke(const Arguments& args) override;

private:
    std::string m_name;
    Signature m_signature;
    Callback m_callback;
};

struct FunctionRegistry {
    // Throws NameError if the name is taken and std::invalid_argument if an exact
    // arity does not match the number of declared parameter kinds.
    void add_function(std::unique_ptr<NativeFunction> function);
    void add_function(std::string name, Arity arity, std::vector<ParamKind> params,
                      LambdaFunction::Callback callback);

    bool contains(const std::string& name) const;

    // Resolves, checks the arguments against the signature and invokes.
    // Throws NameError, ArityError or TypeError.
    Value call(const std::string& name, const std::vector<Value>& args, const Pos& pos = {});

private:
    std::unordered_map<std::string, std::unique_ptr<NativeFunction>> m_functions;
};

}  // namespace ember
