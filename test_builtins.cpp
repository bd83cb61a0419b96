#include <cassert>
#include <clocale>
#include <filesystem>
#include <sstream>
#include <string>

#include "ast_interpreter.hpp"
#include "pos_error.hpp"

namespace {

template <typename E, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }

    return false;
}

// Quotes a path for use as a string literal in a script
std::string quoted(const std::filesystem::path& path) { return "\"" + path.string() + "\""; }

}  // namespace

int main() {
    using namespace ember;

    {
        std::istringstream in;
        std::ostringstream out;

        Interpreter interp{in, out};

        auto value = interp.run("print(1); print(2.5); print('text'); print(true); print(print(0));");

        assert(std::holds_alternative<std::monostate>(value));
        assert(out.str() == "1\n2.5\ntext\ntrue\n0\nnull\n");

        assert(throws<ArityError>([&] { interp.run("print();"); }));
        assert(throws<ArityError>([&] { interp.run("print(1, 2);"); }));
    }

    {
        std::istringstream in{"hello\r\nworld\nlast"};
        std::ostringstream out;

        Interpreter interp{in, out};

        assert(std::get<std::string>(interp.run("read();")) == "hello");
        assert(std::get<std::string>(interp.run("read();")) == "world");
        assert(std::get<std::string>(interp.run("read();")) == "last");
        assert(std::get<std::string>(interp.run("read();")).empty());
        assert(throws<ArityError>([&] { interp.run("read(1);"); }));
    }

    {
        std::istringstream in;
        std::ostringstream out;

        Interpreter a{in, out};
        Interpreter b{in, out};

        a.seed_random(42);
        b.seed_random(42);

        for (int i = 0; i < 100; ++i) {
            const double x = std::get<double>(a.run("random();"));
            const double y = std::get<double>(b.run("random();"));

            assert(x >= 0.0 && x < 1.0);
            assert(x == y);
        }
    }

    {
        std::istringstream in;
        std::ostringstream out;

        Interpreter interp{in, out};

        assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\"abc\");")));
        assert(std::get<double>(interp.run("toNumber(\"3.5\");")) == 3.5);
        assert(std::get<double>(interp.run("toNumber(\"-12\");")) == -12.0);
        assert(std::get<double>(interp.run("toNumber(\"1e3\");")) == 1000.0);
        assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\"\");")));
        assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\" 3\");")));
        assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\"3 \");")));
        assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\"0x10\");")));
        assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\"3,5\");")));
        assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\"+3\");")));
        assert(throws<TypeError>([&] { interp.run("toNumber(3);"); }));

        if (std::setlocale(LC_NUMERIC, "de_DE.UTF-8")) {
            assert(std::get<double>(interp.run("toNumber(\"3.5\");")) == 3.5);
            assert(std::holds_alternative<std::monostate>(interp.run("toNumber(\"3,5\");")));
            std::setlocale(LC_NUMERIC, "C");
        }

        assert(std::get<std::string>(interp.run("toString(8);")) == "8");
        assert(std::get<std::string>(interp.run("toString(3.5);")) == "3.5");
        assert(std::get<std::string>(interp.run("toString(0.1 + 0.2);")) == "0.3");
        // The textual form keeps 15 significant digits, so it does not round trip
        assert(std::get<double>(interp.run("toNumber(toString(0.1 + 0.2));")) == 0.3);
        assert(std::get<bool>(interp.run("toNumber(toString(0.1 + 0.2)) < 0.1 + 0.2;")));
        assert(std::get<std::string>(interp.run("toString(-2);")) == "-2");
        assert(throws<TypeError>([&] { interp.run("toString('8');"); }));

        assert(std::get<std::string>(interp.run("substring(\"hello\", 1, 3);")) == "ell");
        assert(std::get<std::string>(interp.run("substring(\"hello\", 0, 4);")) == "hello");
        assert(std::get<std::string>(interp.run("substring(\"hello\", 2, 2);")) == "l");
        assert(throws<TypeError>([&] { interp.run("substring(\"hello\", 3, 1);"); }));
        assert(throws<TypeError>([&] { interp.run("substring(\"hello\", 0, 5);"); }));
        assert(throws<TypeError>([&] { interp.run("substring(\"hello\", -1, 2);"); }));
        assert(throws<TypeError>([&] { interp.run("substring(\"hello\", 0.5, 2);"); }));
        assert(throws<TypeError>([&] { interp.run("substring(\"\", 0, 0);"); }));
        assert(throws<TypeError>([&] { interp.run("substring(1, 2, 3);"); }));
        assert(throws<ArityError>([&] { interp.run("substring(\"hello\", 1);"); }));
    }

    {
        std::istringstream in;
        std::ostringstream out;

        Interpreter interp{in, out};

        const auto dir = std::filesystem::temp_directory_path();
        const auto file = quoted(dir / "ember_test_builtins.txt");
        const auto missing_dir = quoted(dir / "ember_no_such_dir" / "file.txt");

        std::filesystem::remove(dir / "ember_test_builtins.txt");

        assert(!std::get<bool>(interp.run("exists(" + file + ");")));
        assert(std::holds_alternative<std::monostate>(interp.run("readFile(" + file + ");")));
        assert(!std::get<bool>(interp.run("deleteFile(" + file + ");")));

        auto value = interp.run("writeFile(" + file + ", \"hi\"); readFile(" + file + ");");
        assert(std::get<std::string>(value) == "hi");

        assert(std::get<bool>(interp.run("exists(" + file + ");")));

        // Writing replaces the previous contents
        assert(std::get<bool>(interp.run("writeFile(" + file + ", 'line one\nline two');")));
        assert(std::get<std::string>(interp.run("readFile(" + file + ");")) ==
               "line one\nline two");

        assert(std::get<bool>(interp.run("writeFile(" + file + ", '');")));
        assert(std::get<std::string>(interp.run("readFile(" + file + ");")).empty());

        assert(std::get<bool>(interp.run("deleteFile(" + file + ");")));
        assert(!std::get<bool>(interp.run("exists(" + file + ");")));

        assert(!std::get<bool>(interp.run("writeFile(" + missing_dir + ", 'x');")));
        assert(std::holds_alternative<std::monostate>(
            interp.run("readFile(" + quoted(dir) + ");")));
        assert(!std::get<bool>(interp.run("deleteFile(" + quoted(dir) + ");")));
        assert(std::get<bool>(interp.run("exists(" + quoted(dir) + ");")));

        assert(throws<TypeError>([&] { interp.run("writeFile(" + file + ", 1);"); }));
        assert(throws<TypeError>([&] { interp.run("exists(true);"); }));
    }

    return 0;
}
