// demo_calculator.cpp
//
// A standalone program that drives the Coordinator through a small calculator
// suite spread over three files, with function, module, package and session
// fixtures, a parametrized test and an expected failure. Run it with:
//
//     ./demo_calculator                      # one worker, default config
//     ./demo_calculator run.toml             # settings from a config file
//     ./demo_calculator --broken             # adds a fixture with a bad scope
//     ./demo_calculator run.toml --clear-cache
//
// With `[cache] enabled = true` in the config file, the run is recorded in the
// result store: the previous run's failures are listed before running and
// the store totals after. --clear-cache empties the store first.
//
// The exit code is the run's: 0 when everything passed, 1 otherwise.

#include <trellis/check.hpp>
#include <trellis/coordinator.hpp>
#include <trellis/log.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace trellis;

// ---------------------------------------------------------------------------
// The code under test
// ---------------------------------------------------------------------------

class Calculator {
public:
    int add(int a, int b) { return remember(a + b); }
    int sub(int a, int b) { return remember(a - b); }
    int div(int a, int b) {
        if (b == 0) throw std::domain_error("division by zero");
        return remember(a / b);
    }
    int last() const { return last_; }
    int calls() const { return calls_; }

private:
    int remember(int v) { ++calls_; return last_ = v; }

    int last_ = 0;
    int calls_ = 0;
};

// ---------------------------------------------------------------------------
// Suite registration
// ---------------------------------------------------------------------------

Status register_fixtures(Coordinator& c, bool broken) {
    TRELLIS_TRY(c.add_fixture(make_generator_fixture(
        "session_calculator", "tests/conftest.cpp", "session", {},
        [](const Arguments&) {
            log::info("session_calculator: starting up");
            return FixtureYield{Value::of(Calculator{}),
                                []() { log::info("session_calculator: shut down"); }};
        })));

    TRELLIS_TRY(c.add_fixture(make_fixture(
        "calculator", "tests/conftest.cpp", "function", {},
        [](const Arguments&) { return Value::of(Calculator{}); })));

    TRELLIS_TRY(c.add_fixture(make_fixture(
        "operands", "tests/arith/test_basic.cpp", "module", {},
        [](const Arguments&) { return Value::of(std::vector<int>{2, 3, 5, 7}); })));

    TRELLIS_TRY(c.add_fixture(make_generator_fixture(
        "journal", "tests/arith/conftest.cpp", "package", {"session_calculator"},
        [](const Arguments& args) {
            int before = args.get<Calculator>("session_calculator").calls();
            return FixtureYield{Value::of(before), [before]() {
                log::debug("journal: package closed (%d calls before it)", before);
            }};
        })));

    if (broken) {
        auto bad = c.add_fixture(make_fixture(
            "precision", "tests/conftest.cpp", "invalid_scope", {},
            [](const Arguments&) { return Value::of(2); }));
        if (bad.is_err()) log::warn("%s", bad.error().message.c_str());
    }
    return ok_status();
}

TestItem make_test(const std::string& location, const std::string& name,
                   std::vector<std::string> parameters, TestBody body) {
    TestItem t;
    t.location = location;
    t.name = name;
    t.parameters = std::move(parameters);
    t.body = std::move(body);
    return t;
}

Status register_tests(Coordinator& c, bool broken) {
    TRELLIS_TRY(c.add_test(make_test("tests/arith/test_basic.cpp", "test_add", {"calculator"},
        [](const Arguments& args) {
            auto& calc = args.get<Calculator>("calculator");
            TRELLIS_CHECK(calc.add(1, 2) == 3);
            TRELLIS_CHECK(calc.calls() == 1);
        })));

    TRELLIS_TRY(c.add_test(make_test("tests/arith/test_basic.cpp", "test_sub", {"calculator"},
        [](const Arguments& args) {
            auto& calc = args.get<Calculator>("calculator");
            TRELLIS_CHECK(calc.sub(5, 3) == 2);
            TRELLIS_CHECK(calc.calls() == 1);
        })));

    TestItem sum = make_test("tests/arith/test_basic.cpp", "test_sum_operands",
        {"calculator", "operands", "offset"},
        [](const Arguments& args) {
            auto& calc = args.get<Calculator>("calculator");
            int total = args.get<int>("offset");
            for (int v : args.get<std::vector<int>>("operands")) total = calc.add(total, v);
            TRELLIS_CHECK(total == 17 + args.get<int>("offset"));
        });
    sum.parametrize.push_back(ParametrizeSpec{{"offset"}, {params(0), params(10), params(-17)}});
    TRELLIS_TRY(c.add_test(std::move(sum)));

    TRELLIS_TRY(c.add_test(make_test("tests/arith/test_shared.cpp", "test_shared_add",
        {"session_calculator", "journal"},
        [](const Arguments& args) {
            auto& calc = args.get<Calculator>("session_calculator");
            calc.add(40, 2);
            TRELLIS_CHECK(calc.last() == 42);
        })));

    TestItem divide = make_test("tests/test_edge.cpp", "test_divide_by_zero",
        {"session_calculator"},
        [](const Arguments& args) {
            args.get<Calculator>("session_calculator").div(1, 0);
        });
    divide.tags.expect_fail("division by zero raises");
    TRELLIS_TRY(c.add_test(std::move(divide)));

    TestItem slow = make_test("tests/test_edge.cpp", "test_large_factorial", {}, [](const Arguments&) {});
    slow.tags.skip("too slow for the demo");
    TRELLIS_TRY(c.add_test(std::move(slow)));

    if (broken) {
        TRELLIS_TRY(c.add_test(make_test("tests/test_edge.cpp", "test_precision",
            {"calculator", "precision"}, [](const Arguments&) {})));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// main -- configure, collect, run and print the summary
// ---------------------------------------------------------------------------
int main(int argc, char** argv) {
    bool broken = false;
    bool clear_cache = false;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--broken") {
            broken = true;
        } else if (arg == "--clear-cache") {
            clear_cache = true;
        } else {
            config_path = arg;
        }
    }

    RunOptions options;
    ResultStore store;
    if (!config_path.empty()) {
        auto config = RunConfig::load(config_path);
        if (config.is_err()) {
            std::cerr << config.error().format() << "\n";
            return 2;
        }
        config.value().apply_logging();
        options = RunOptions::from_config(config.value());
    }

    if (!options.store_path.empty()) {
        auto opened = store.open(options.store_path);
        if (opened.is_err()) {
            std::cerr << opened.error().format() << "\n";
            return 2;
        }
        if (clear_cache) {
            auto cleared = store.clear();
            if (cleared.is_err()) {
                std::cerr << cleared.error().format() << "\n";
                return 2;
            }
        }
        auto failed = store.last_failed();
        if (failed.is_ok() && !failed.value().empty()) {
            std::cout << "failed last time:\n";
            for (const auto& id : failed.value()) std::cout << "  " << id << "\n";
            std::cout << "\n";
        } else if (failed.is_err()) {
            log::warn("%s", failed.error().message.c_str());
        }
    }

    Coordinator coordinator(options);
    if (store.is_open()) coordinator.attach_store(&store);
    auto fixtures = register_fixtures(coordinator, broken);
    if (fixtures.is_err()) {
        std::cerr << fixtures.error().format() << "\n";
        return 2;
    }
    auto tests = register_tests(coordinator, broken);
    if (tests.is_err()) {
        std::cerr << tests.error().format() << "\n";
        return 2;
    }

    auto summary = coordinator.run();
    if (summary.is_err()) {
        std::cerr << summary.error().format() << "\n";
        return 2;
    }

    for (const auto& o : summary.value().outcomes) {
        std::cout << status_name(o.status) << "  " << o.location << "::" << o.name;
        if (!o.message.empty() && o.status != TestStatus::Passed) {
            std::cout << "  (" << o.message << ")";
        }
        std::cout << "\n";
    }
    for (const auto& e : summary.value().errors) {
        std::cout << "\n" << e.format() << "\n";
    }
    std::cout << "\n" << summary.value().format() << "\n";

    if (store.is_open()) {
        auto stats = store.get_stats();
        if (stats.is_ok()) {
            std::cout << "result store: " << stats.value().run_count << " run(s), "
                      << stats.value().result_count << " result(s)\n";
        } else {
            log::warn("%s", stats.error().message.c_str());
        }
    }
    return summary.value().exit_code();
}
