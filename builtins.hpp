#pragma once

#include <iosfwd>
#include <random>

#include "function_registry.hpp"

namespace ember {

// State the built-in functions operate on. Owned by the interpreter, which must
// outlive every registry the built-ins were loaded into.
struct Host {
    std::istream& in;
    std::ostream& out;
    std::mt19937 random_engine;
};

// Registers print, read, random, toNumber, toString, substring, writeFile,
// readFile, deleteFile and exists.
void load_builtins(FunctionRegistry& registry, Host& host);

}  // namespace ember
