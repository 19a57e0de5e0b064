#include <catch2/catch.hpp>
#include <trellis/scope_cache.hpp>
#include <trellis/parametrize.hpp>
#include <trellis/log.hpp>

#include <stdexcept>

using namespace trellis;

namespace {

// Records setup/teardown events in order.
struct Journal {
    std::vector<std::string> events;
    int setups(const std::string& name) const {
        int n = 0;
        for (const auto& e : events) if (e == "setup " + name) ++n;
        return n;
    }
};

const FixtureDefinition* tracked(FixtureTable& table, Journal& journal,
                                 const std::string& name, const std::string& scope,
                                 std::vector<std::string> deps = {},
                                 const std::string& location = "conftest.cpp") {
    auto decl = make_generator_fixture(name, location, scope, std::move(deps),
        [&journal, name](const Arguments&) {
            journal.events.push_back("setup " + name);
            return FixtureYield{Value::of(name),
                                [&journal, name]() { journal.events.push_back("teardown " + name); }};
        });
    auto r = table.add(std::move(decl));
    REQUIRE(r.is_ok());
    return r.value();
}

InvocationScope where(const std::string& inv, const std::string& module = "tests/test_a.cpp") {
    return InvocationScope{inv, module};
}

} // namespace

TEST_CASE("scope_key_for maps each scope to its instance", "[scope_cache]") {
    FixtureTable table;
    Journal j;
    auto fn = tracked(table, j, "fn", "function");
    auto mod = tracked(table, j, "mod", "module");
    auto pkg = tracked(table, j, "pkg", "package", {}, "tests/db/conftest.cpp");
    auto ses = tracked(table, j, "ses", "session");

    auto w = where("tests/test_a.cpp::t#0");
    REQUIRE(scope_key_for(*fn, w) == ScopeKey{FixtureScope::Function, "tests/test_a.cpp::t#0"});
    REQUIRE(scope_key_for(*mod, w) == ScopeKey{FixtureScope::Module, "tests/test_a.cpp"});
    REQUIRE(scope_key_for(*pkg, w) == ScopeKey{FixtureScope::Package, "tests/db"});
    REQUIRE(scope_key_for(*ses, w) == ScopeKey::session());
}

TEST_CASE("acquire reuses an instance within its scope", "[scope_cache]") {
    FixtureTable table;
    Journal j;
    auto mod = tracked(table, j, "mod", "module");
    SessionContext session;
    ScopeCache cache(session);
    Arguments none;

    auto first = cache.acquire(*mod, none, where("t1"));
    auto second = cache.acquire(*mod, none, where("t2"));
    REQUIRE(first.is_ok());
    REQUIRE(first.value().same_instance(second.value()));
    REQUIRE(j.setups("mod") == 1);

    auto other_module = cache.acquire(*mod, none, where("t3", "tests/test_b.cpp"));
    REQUIRE_FALSE(other_module.value().same_instance(first.value()));
    REQUIRE(j.setups("mod") == 2);
}

TEST_CASE("close_scope tears down in reverse acquisition order", "[scope_cache]") {
    FixtureTable table;
    Journal j;
    auto a = tracked(table, j, "a", "module");
    auto b = tracked(table, j, "b", "module");
    auto c = tracked(table, j, "c", "module");
    SessionContext session;
    ScopeCache cache(session);
    Arguments none;

    for (auto* def : {a, b, c}) REQUIRE(cache.acquire(*def, none, where("t")).is_ok());
    REQUIRE(cache.live_count(ScopeKey{FixtureScope::Module, "tests/test_a.cpp"}) == 3);

    auto failures = cache.close_scope(FixtureScope::Module, "tests/test_a.cpp");
    REQUIRE(failures.empty());
    REQUIRE(j.events == std::vector<std::string>{
        "setup a", "setup b", "setup c", "teardown c", "teardown b", "teardown a"});
    REQUIRE(cache.open_keys().empty());

    // Closing twice is a no-op
    REQUIRE(cache.close_scope(FixtureScope::Module, "tests/test_a.cpp").empty());
    REQUIRE(j.events.size() == 6);
}

TEST_CASE("a failing teardown does not stop its siblings", "[scope_cache]") {
    log::set_level(log::Error);
    FixtureTable table;
    Journal j;
    auto first = tracked(table, j, "first", "module");
    auto bad = make_generator_fixture("bad", "conftest.cpp", "module", {},
        [](const Arguments&) {
            return FixtureYield{Value::of(0), []() { throw std::runtime_error("disk gone"); }};
        });
    auto bad_def = table.add(std::move(bad)).value();
    SessionContext session;
    ScopeCache cache(session);
    Arguments none;

    REQUIRE(cache.acquire(*first, none, where("t")).is_ok());
    REQUIRE(cache.acquire(*bad_def, none, where("t")).is_ok());

    auto failures = cache.close_scope(FixtureScope::Module, "tests/test_a.cpp");
    log::set_level(log::Info);
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].fixture == "bad");
    REQUIRE(failures[0].message.find("disk gone") != std::string::npos);
    REQUIRE(j.events.back() == "teardown first");
}

TEST_CASE("a failed setup is retried by the next consumer", "[scope_cache]") {
    FixtureTable table;
    int calls = 0;
    auto decl = make_fixture("flaky", "conftest.cpp", "module", {},
        [&calls](const Arguments&) -> Value {
            if (++calls == 1) throw std::runtime_error("connection refused");
            return Value::of(calls);
        });
    auto def = table.add(std::move(decl)).value();
    SessionContext session;
    ScopeCache cache(session);
    Arguments none;

    auto r1 = cache.acquire(*def, none, where("t1"));
    REQUIRE(r1.is_err());
    REQUIRE(r1.error().code == TrellisError::Fixture);
    REQUIRE(r1.error().message == "fixture 'flaky' failed: connection refused");
    REQUIRE(cache.live_count(ScopeKey{FixtureScope::Module, "tests/test_a.cpp"}) == 0);
    REQUIRE(cache.open_keys().empty());

    auto r2 = cache.acquire(*def, none, where("t2"));
    REQUIRE(r2.is_ok());
    REQUIRE(calls == 2);

    // The successful instance is now shared by the rest of the module
    auto r3 = cache.acquire(*def, none, where("t3"));
    REQUIRE(r3.value().same_instance(r2.value()));
    REQUIRE(calls == 2);
}

TEST_CASE("session fixtures are delegated to the session context", "[scope_cache]") {
    FixtureTable table;
    Journal j;
    auto ses = tracked(table, j, "ses", "session");
    SessionContext session;
    ScopeCache a(session);
    ScopeCache b(session);
    Arguments none;

    auto va = a.acquire(*ses, none, where("t1"));
    auto vb = b.acquire(*ses, none, where("t2", "tests/test_b.cpp"));
    REQUIRE(va.value().same_instance(vb.value()));
    REQUIRE(j.setups("ses") == 1);
    REQUIRE(a.live_count(ScopeKey::session()) == 1);

    REQUIRE(a.close_scope(FixtureScope::Session, "").empty());
    REQUIRE(j.events.back() == "teardown ses");
}

TEST_CASE("acquire_plan wires dependency values into arguments", "[scope_cache]") {
    FixtureTable table;
    REQUIRE(table.add(make_fixture("base", "conftest.cpp", "module", {},
        [](const Arguments&) { return Value::of(20); })).is_ok());
    REQUIRE(table.add(make_fixture("doubled", "conftest.cpp", "function", {"base"},
        [](const Arguments& args) { return Value::of(args.get<int>("base") * 2); })).is_ok());
    REQUIRE(table.add(make_fixture("who", "conftest.cpp", "function", {},
        [](const Arguments& args) { return Value::of(args.request()->test_name); })).is_ok());

    TestItem t;
    t.location = "tests/test_a.cpp";
    t.name = "test_math";
    t.parameters = {"doubled", "who"};
    t.body = [](const Arguments&) {};
    auto inv = expand(t)[0];

    PlanBuilder builder(table);
    auto plan = builder.build(inv).value();

    SessionContext session;
    ScopeCache cache(session);
    RequestInfo request{inv.id, t.name, t.location, ""};
    auto args = cache.acquire_plan(plan, where("inv"), &request);
    REQUIRE(args.is_ok());
    REQUIRE(args.value().names() == std::vector<std::string>{"doubled", "who"});
    REQUIRE(args.value().get<int>("doubled") == 40);
    REQUIRE(args.value().get<std::string>("who") == "test_math");
    REQUIRE(args.value().request() == &request);
}

TEST_CASE("acquire_plan stops at the first failing step", "[scope_cache]") {
    FixtureTable table;
    Journal j;
    REQUIRE(table.add(make_fixture("broken", "conftest.cpp", "function", {},
        [](const Arguments&) -> Value { throw std::runtime_error("boom"); })).is_ok());
    tracked(table, j, "after", "function");

    TestItem t;
    t.location = "tests/test_a.cpp";
    t.name = "t";
    t.parameters = {"broken", "after"};
    t.body = [](const Arguments&) {};
    auto inv = expand(t)[0];
    auto plan = PlanBuilder(table).build(inv).value();

    SessionContext session;
    ScopeCache cache(session);
    auto args = cache.acquire_plan(plan, where("inv"), nullptr);
    REQUIRE(args.is_err());
    REQUIRE(args.error().message.find("boom") != std::string::npos);
    REQUIRE(j.setups("after") == 0);
}
