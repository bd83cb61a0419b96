#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "function_registry.hpp"
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

// Counts how many times it has been invoked
struct Counter final : ember::NativeFunction {
    const std::string& name() const override { return m_name; }
    const ember::Signature& signature() const override { return m_signature; }

    ember::Value invoke(const ember::Arguments&) override { return static_cast<double>(++m_count); }

private:
    std::string m_name = "counter";
    ember::Signature m_signature{ember::Arity::exact(0), {}};
    int m_count = 0;
};

}  // namespace

int main() {
    using namespace ember;

    FunctionRegistry registry;

    registry.add_function("sum", Arity::exact(2), {ParamKind::NUMBER, ParamKind::NUMBER},
                          [](const Arguments& args) -> Value {
                              return args.as_number(0) + args.as_number(1);
                          });

    registry.add_function("concat", Arity::exact(2), {ParamKind::STRING, ParamKind::STRING},
                          [](const Arguments& args) -> Value {
                              return args.as_string(0) + args.as_string(1);
                          });

    assert(registry.contains("sum"));
    assert(!registry.contains("product"));

    assert(std::get<double>(registry.call("sum", {5.0, 2.0})) == 7.0);
    assert(std::get<std::string>(registry.call(
               "concat", {std::string{"hello "}, std::string{"world"}})) == "hello world");

    assert(throws<NameError>([&] { registry.call("product", {1.0}); }));
    assert(throws<ArityError>([&] { registry.call("sum", {1.0}); }));
    assert(throws<ArityError>([&] { registry.call("sum", {1.0, 2.0, 3.0}); }));
    assert(throws<TypeError>([&] { registry.call("sum", {1.0, std::string{"2"}}); }));
    assert(throws<TypeError>([&] { registry.call("sum", {Value{}, 2.0}); }));

    // Names are unique and the registry keeps the first entry
    assert(throws<NameError>([&] {
        registry.add_function("sum", Arity::exact(0), {},
                              [](const Arguments&) -> Value { return {}; });
    }));
    assert(std::get<double>(registry.call("sum", {1.0, 1.0})) == 2.0);

    // An exact arity must declare a kind for every parameter
    assert(throws<std::invalid_argument>([&] {
        registry.add_function("broken", Arity::exact(2), {ParamKind::ANY},
                              [](const Arguments&) -> Value { return {}; });
    }));
    assert(!registry.contains("broken"));

    // Variadic arguments past the declared list reuse the last declared kind
    registry.add_function("join", Arity::at_least(1), {ParamKind::STRING, ParamKind::NUMBER},
                          [](const Arguments& args) -> Value {
                              auto result = args.as_string(0);

                              for (std::size_t i = 1; args.has(i); ++i) {
                                  result += format_number(args.as_number(i));
                              }

                              return result;
                          });

    assert(std::get<std::string>(registry.call("join", {std::string{"n"}})) == "n");
    assert(std::get<std::string>(registry.call("join", {std::string{"n"}, 1.0, 2.0, 3.5})) ==
           "n123.5");
    assert(throws<ArityError>([&] { registry.call("join", {}); }));
    assert(throws<TypeError>([&] { registry.call("join", {std::string{"n"}, 1.0, true}); }));
    assert(throws<TypeError>([&] { registry.call("join", {1.0, 1.0}); }));

    // A variadic entry without declared kinds accepts anything
    registry.add_function("count", Arity::at_least(0), {}, [](const Arguments& args) -> Value {
        return static_cast<double>(args.size());
    });

    assert(std::get<double>(registry.call("count", {})) == 0.0);
    assert(std::get<double>(registry.call("count", {true, Value{}, std::string{"x"}})) == 3.0);

    // Null parameters only accept null
    registry.add_function("isNull", Arity::exact(1), {ParamKind::NULLV},
                          [](const Arguments&) -> Value { return true; });

    assert(std::get<bool>(registry.call("isNull", {Value{}})));
    assert(throws<TypeError>([&] { registry.call("isNull", {false}); }));

    // Extraction checks the position and the kind even for Any parameters
    registry.add_function("loose", Arity::exact(1), {ParamKind::ANY},
                          [](const Arguments& args) -> Value {
                              assert(args.size() == 1);
                              assert(args.has(0));
                              assert(!args.has(1));
                              assert(throws<ArityError>([&] { args.as_any(1); }));
                              assert(throws<ArityError>([&] { args.as_bool(1); }));
                              return args.as_number(0);
                          });

    assert(std::get<double>(registry.call("loose", {4.0})) == 4.0);
    assert(throws<TypeError>([&] { registry.call("loose", {std::string{"4"}}); }));

    registry.add_function(std::make_unique<Counter>());

    assert(std::get<double>(registry.call("counter", {})) == 1.0);
    assert(std::get<double>(registry.call("counter", {})) == 2.0);
    assert(throws<ArityError>([&] { registry.call("counter", {1.0}); }));

    try {
        registry.call("sum", {1.0, true}, Pos{2, 4, "script"});
        assert(false);
    } catch (const TypeError& e) {
        assert(e.pos().line == 2);
        assert(e.message() == "Argument 1 of function sum expected Number, got Bool");
    }

    try {
        registry.call("sum", {}, Pos{1, 1, "script"});
        assert(false);
    } catch (const ArityError& e) {
        assert(e.message() == "Function sum expects 2 arguments, got 0");
    }

    return 0;
}
