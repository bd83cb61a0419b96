#include <charconv>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include "ast_interpreter.hpp"
#include "ast_printer.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "pos_error.hpp"

namespace {

enum class Mode { RUN, TOKENS, AST };

void print_help() {
    std::cout << "Ember, an embeddable expression scripting language\n"
                 "Usage:\n"
                 "  ember [--seed <n>] <script>   Run a script\n"
                 "  ember [--seed <n>]            Start interactive mode\n"
                 "  ember --tokens <script>       Print the token stream of a script\n"
                 "  ember --ast <script>          Print the syntax tree of a script\n"
                 "  ember --version, -v           Show version information\n"
                 "  ember --help, -h              Show this help message\n";
}

void start_repl(ember::Interpreter& interp) {
    std::cout << "Ember " << EMBER_VERSION << " interactive mode\n";
    std::cout << "Type 'exit' or press Ctrl+D to quit.\n";

    std::string line;

    while (true) {
        std::cout << "ember> " << std::flush;

        if (!std::getline(std::cin, line)) {
            break;
        }

        if (line == "exit") {
            break;
        }

        try {
            auto value = interp.run(line, "<repl>");

            if (!std::holds_alternative<std::monostate>(value)) {
                std::cout << ember::to_display_string(value) << '\n';
            }
        } catch (const ember::PosError& e) {
            std::cerr << "[Error] " << e.what() << std::endl;
        }
    }
}

std::optional<std::string> read_source(const std::string& path) {
    std::ifstream ifs{path};

    if (!ifs) {
        return std::nullopt;
    }

    return std::string{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
}

}  // namespace

int main(int argc, char** argv) {
    Mode mode = Mode::RUN;
    std::optional<std::uint32_t> seed;
    std::optional<std::string> script;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--version" || arg == "-v") {
            std::cout << "Ember version " << EMBER_VERSION << std::endl;
            return 0;
        }

        if (arg == "--help" || arg == "-h") {
            print_help();
            return 0;
        }

        if (arg == "--tokens") {
            mode = Mode::TOKENS;
        } else if (arg == "--ast") {
            mode = Mode::AST;
        } else if (arg == "--seed") {
            if (i + 1 >= argc) {
                std::cerr << "--seed requires a value" << std::endl;
                return 1;
            }

            const char* first = argv[++i];
            const char* last = first + std::strlen(first);
            std::uint32_t value = 0;
            const auto [end, ec] = std::from_chars(first, last, value);

            if (ec != std::errc{} || end != last || first == last) {
                std::cerr << "--seed expects an unsigned 32-bit integer, got '" << first << "'"
                          << std::endl;
                return 1;
            }

            seed = value;
        } else if (!script) {
            script = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    ember::Interpreter interp;

    if (seed) {
        interp.seed_random(*seed);
    }

    if (!script) {
        if (mode != Mode::RUN) {
            std::cerr << "--tokens and --ast require a script" << std::endl;
            return 1;
        }

        start_repl(interp);
        return 0;
    }

    auto src = read_source(*script);

    if (!src) {
        std::cerr << "Unable to open file: " << *script << std::endl;
        return 1;
    }

    try {
        switch (mode) {
            case Mode::TOKENS:
                for (const auto& token : ember::tokenize(*src, *script)) {
                    std::cout << token.pos.line << ":" << token.pos.column << " "
                              << ember::describe(token) << '\n';
                }
                break;

            case Mode::AST: {
                ember::Parser parser{ember::tokenize(*src, *script)};
                std::cout << ember::dump_ast(parser.parse());
            } break;

            case Mode::RUN:
                interp.run(*src, *script);
                break;
        }
    } catch (const ember::PosError& e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
