#include "builtins.hpp"

#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

#include "pos_error.hpp"

namespace fs = std::filesystem;

namespace {

using ember::Arguments;
using ember::Arity;
using ember::ParamKind;
using ember::Value;

Value parse_number(const std::string& str) {
    // Unlike strtod, from_chars takes no whitespace, no hexadecimal and no
    // locale specific decimal point
    double value = 0;
    const auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{} || end != str.data() + str.size()) {
        return {};
    }

    return value;
}

Value substring(const Arguments& args) {
    const auto& str = args.as_string(0);
    const double start = args.as_number(1);
    const double end = args.as_number(2);

    if (start != std::trunc(start) || end != std::trunc(end) || start < 0 || start > end ||
        end >= static_cast<double>(str.size())) {
        throw ember::TypeError{args.pos(), "substring indices " + ember::format_number(start) +
                                               ".." + ember::format_number(end) +
                                               " are out of range for a string of length " +
                                               std::to_string(str.size())};
    }

    const auto first = static_cast<std::size_t>(start);
    const auto last = static_cast<std::size_t>(end);

    return str.substr(first, last - first + 1);
}

Value write_file(const Arguments& args) {
    std::ofstream f{args.as_string(0), std::ios::binary | std::ios::trunc};

    if (!f) {
        return false;
    }

    f << args.as_string(1);
    f.close();

    return !f.fail();
}

Value read_file(const Arguments& args) {
    const auto& path = args.as_string(0);

    std::error_code ec;

    if (!fs::is_regular_file(path, ec)) {
        return {};
    }

    std::ifstream f{path, std::ios::binary};

    if (!f) {
        return {};
    }

    std::ostringstream contents;
    contents << f.rdbuf();

    if (f.bad()) {
        return {};
    }

    return contents.str();
}

Value delete_file(const Arguments& args) {
    const auto& path = args.as_string(0);

    std::error_code ec;

    if (fs::is_directory(path, ec)) {
        return false;
    }

    return fs::remove(path, ec) && !ec;
}

Value exists(const Arguments& args) {
    std::error_code ec;

    return fs::exists(args.as_string(0), ec) && !ec;
}

}  // namespace

namespace ember {

void load_builtins(FunctionRegistry& registry, Host& host) {
    registry.add_function("print", Arity::exact(1), {ParamKind::ANY},
                          [&host](const Arguments& args) -> Value {
                              host.out << to_display_string(args.as_any(0)) << std::endl;
                              return {};
                          });

    registry.add_function("read", Arity::exact(0), {}, [&host](const Arguments&) -> Value {
        std::string line;

        if (!std::getline(host.in, line)) {
            return std::string{};
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        return line;
    });

    registry.add_function("random", Arity::exact(0), {}, [&host](const Arguments&) -> Value {
        std::uniform_real_distribution<double> dist{0.0, 1.0};
        return dist(host.random_engine);
    });

    registry.add_function(
        "toNumber", Arity::exact(1), {ParamKind::STRING},
        [](const Arguments& args) -> Value { return parse_number(args.as_string(0)); });

    registry.add_function(
        "toString", Arity::exact(1), {ParamKind::NUMBER},
        [](const Arguments& args) -> Value { return format_number(args.as_number(0)); });

    registry.add_function("substring", Arity::exact(3),
                          {ParamKind::STRING, ParamKind::NUMBER, ParamKind::NUMBER}, substring);

    registry.add_function("writeFile", Arity::exact(2), {ParamKind::STRING, ParamKind::STRING},
                          write_file);

    registry.add_function("readFile", Arity::exact(1), {ParamKind::STRING}, read_file);

    registry.add_function("deleteFile", Arity::exact(1), {ParamKind::STRING}, delete_file);

    registry.add_function("exists", Arity::exact(1), {ParamKind::STRING}, exists);
}

}  // namespace ember
