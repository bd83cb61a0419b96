#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "builtins.hpp"
#include "environment.hpp"
#include "function_registry.hpp"
#include "value.hpp"

namespace ember {

struct AST;

struct Interpreter {
    // Built-ins read from std::cin and print to std::cout
    Interpreter();
    Interpreter(std::istream& in, std::ostream& out);

    // The built-ins hold a reference to m_host
    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Lexes, parses and evaluates the whole source and returns the value of the
    // last top-level statement, or null if there is none. Nothing is evaluated
    // when lexing or parsing fails. Throws PosError subclasses.
    Value run(std::string_view source, std::string filename = "<string>");

    Value eval(AST& ast);

    void seed_random(std::uint32_t seed);

    Environment env;
    FunctionRegistry functions;

private:
    Host m_host;
};

}  // namespace ember
