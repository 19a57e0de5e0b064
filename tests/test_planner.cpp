#include <catch2/catch.hpp>
#include <trellis/planner.hpp>
#include <trellis/parametrize.hpp>
#include <trellis/log.hpp>

using namespace trellis;

static const FixtureDefinition* fixture(FixtureTable& table, const std::string& name,
                                        const std::string& location,
                                        std::vector<std::string> deps = {},
                                        const std::string& scope = "function") {
    auto r = table.add(make_fixture(name, location, scope, std::move(deps),
                                    [](const Arguments&) { return Value::of(0); }));
    REQUIRE(r.is_ok());
    return r.value();
}

static TestItem item(const std::string& location, const std::string& name,
                     std::vector<std::string> parameters) {
    TestItem t;
    t.location = location;
    t.name = name;
    t.line = 10;
    t.parameters = std::move(parameters);
    t.body = [](const Arguments&) {};
    return t;
}

static std::vector<std::string> step_names(const ResolutionPlan& plan) {
    std::vector<std::string> names;
    for (const auto& step : plan.steps) names.push_back(step.definition->name);
    return names;
}

// ===== Ordering =====

TEST_CASE("dependencies precede dependents", "[planner]") {
    FixtureTable table;
    fixture(table, "config", "conftest.cpp");
    fixture(table, "db", "conftest.cpp", {"config"});
    fixture(table, "user", "conftest.cpp", {"db"});
    PlanBuilder builder(table);

    auto t = item("tests/test_a.cpp", "test_user", {"user"});
    auto plan = builder.build(expand(t)[0]);
    REQUIRE(plan.is_ok());
    REQUIRE(step_names(plan.value()) == std::vector<std::string>{"config", "db", "user"});
    REQUIRE(plan.value().test_arguments.size() == 1);
    REQUIRE(plan.value().test_arguments[0].first == "user");
}

TEST_CASE("diamond dependency is planned once", "[planner]") {
    FixtureTable table;
    auto base = fixture(table, "base", "conftest.cpp");
    fixture(table, "left", "conftest.cpp", {"base"});
    fixture(table, "right", "conftest.cpp", {"base"});
    PlanBuilder builder(table);

    auto t = item("test_d.cpp", "test_diamond", {"left", "right"});
    auto plan = builder.build(expand(t)[0]).value();
    REQUIRE(step_names(plan) == std::vector<std::string>{"base", "left", "right"});

    // Both dependents are wired to the same definition
    REQUIRE(plan.steps[1].arguments[0].second == base);
    REQUIRE(plan.steps[2].arguments[0].second == base);
}

TEST_CASE("plan tree names the test and its fixtures", "[planner]") {
    FixtureTable table;
    fixture(table, "db", "conftest.cpp", {}, "session");
    PlanBuilder builder(table);

    auto t = item("test_a.cpp", "test_db", {"db"});
    auto plan = builder.build(expand(t)[0]).value();
    REQUIRE(plan.tree.find("test_db") == 0);
    REQUIRE(plan.tree.find("db [session]") != std::string::npos);
}

TEST_CASE("parametrize-supplied names are not resolved as fixtures", "[planner]") {
    FixtureTable table;
    fixture(table, "db", "conftest.cpp");
    PlanBuilder builder(table);

    auto t = item("test_a.cpp", "test_p", {"db", "n"});
    t.parametrize.push_back(ParametrizeSpec{{"n"}, {params(1)}});
    auto plan = builder.build(expand(t)[0]);
    REQUIRE(plan.is_ok());
    REQUIRE(step_names(plan.value()) == std::vector<std::string>{"db"});
}

TEST_CASE("dependencies resolve from the requesting test's location", "[planner]") {
    FixtureTable table;
    fixture(table, "wrapper", "conftest.cpp", {"value"});
    auto outer = fixture(table, "value", "conftest.cpp");
    auto inner = fixture(table, "value", "sub/conftest.cpp");
    PlanBuilder builder(table);

    auto top = builder.build(expand(item("test_top.cpp", "t", {"wrapper"}))[0]).value();
    REQUIRE(top.steps[0].definition == outer);

    auto sub = builder.build(expand(item("sub/test_sub.cpp", "t", {"wrapper"}))[0]).value();
    REQUIRE(sub.steps[0].definition == inner);
}

TEST_CASE("overriding fixture can extend the one it shadows", "[planner]") {
    FixtureTable table;
    auto outer = fixture(table, "db", "conftest.cpp");
    auto inner = fixture(table, "db", "tests/conftest.cpp", {"db"});
    PlanBuilder builder(table);

    auto plan = builder.build(expand(item("tests/test_a.cpp", "t", {"db"}))[0]).value();
    REQUIRE(plan.steps.size() == 2);
    REQUIRE(plan.steps[0].definition == outer);
    REQUIRE(plan.steps[1].definition == inner);
}

TEST_CASE("autouse and use_fixtures are planned but not passed", "[planner]") {
    FixtureTable table;
    auto autouse = make_fixture("env", "conftest.cpp", "session", {},
                                [](const Arguments&) { return Value::of(0); });
    autouse.autouse = true;
    REQUIRE(table.add(std::move(autouse)).is_ok());
    fixture(table, "marker", "conftest.cpp");
    fixture(table, "db", "conftest.cpp");
    PlanBuilder builder(table);

    auto t = item("test_a.cpp", "t", {"db"});
    t.tags.use({"marker"});
    auto plan = builder.build(expand(t)[0]).value();
    REQUIRE(step_names(plan) == std::vector<std::string>{"env", "marker", "db"});
    REQUIRE(plan.test_arguments.size() == 1);
    REQUIRE(plan.contains("marker"));
}

// ===== Errors =====

TEST_CASE("every missing name is reported", "[planner]") {
    FixtureTable table;
    fixture(table, "f", "conftest.cpp", {"dep"});
    PlanBuilder builder(table);

    auto t = item("tests/test_a.cpp", "test_missing", {"a", "f", "b"});
    auto plan = builder.build(expand(t)[0]);
    REQUIRE(plan.is_err());
    const auto& err = plan.error();
    REQUIRE(err.code == TrellisError::NotFound);
    REQUIRE(err.message.find("a, dep (required by f), b") != std::string::npos);
    REQUIRE(err.file == "tests/test_a.cpp");
    REQUIRE(err.line == 10);
}

TEST_CASE("a cycle is named", "[planner]") {
    FixtureTable table;
    fixture(table, "a", "conftest.cpp", {"b"});
    fixture(table, "b", "conftest.cpp", {"a"});
    PlanBuilder builder(table);

    auto plan = builder.build(expand(item("test_c.cpp", "test_cycle", {"a"}))[0]);
    REQUIRE(plan.is_err());
    REQUIRE(plan.error().code == TrellisError::Cycle);
    REQUIRE(plan.error().message.find("a -> b -> a") != std::string::npos);
}

TEST_CASE("self dependency without an outer definition is missing", "[planner]") {
    FixtureTable table;
    fixture(table, "a", "conftest.cpp", {"a"});
    PlanBuilder builder(table);

    auto plan = builder.build(expand(item("test_c.cpp", "t", {"a"}))[0]);
    REQUIRE(plan.is_err());
    REQUIRE(plan.error().code == TrellisError::NotFound);
}

TEST_CASE("a fixture cannot depend on a narrower scope", "[planner]") {
    FixtureTable table;
    fixture(table, "per_test", "conftest.cpp", {}, "function");
    fixture(table, "shared", "conftest.cpp", {"per_test"}, "session");
    PlanBuilder builder(table);

    auto plan = builder.build(expand(item("test_s.cpp", "t", {"shared"}))[0]);
    REQUIRE(plan.is_err());
    REQUIRE(plan.error().code == TrellisError::ScopeMismatch);
    REQUIRE(plan.error().message ==
            "session-scoped fixture 'shared' cannot depend on function-scoped fixture 'per_test'");
}

TEST_CASE("a use of an invalid definition is reported as missing", "[planner]") {
    log::set_level(log::Error);
    FixtureTable table;
    auto broken = make_fixture("broken", "conftest.cpp", "invalid_scope", {},
                               [](const Arguments&) { return Value::of(0); });
    REQUIRE(table.add(std::move(broken)).is_err());
    log::set_level(log::Info);
    PlanBuilder builder(table);

    auto plan = builder.build(expand(item("test_b.cpp", "t", {"broken"}))[0]);
    REQUIRE(plan.is_err());
    REQUIRE(plan.error().code == TrellisError::NotFound);
}
