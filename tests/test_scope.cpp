#include <catch2/catch.hpp>
#include <trellis/scope.hpp>

using namespace trellis;

TEST_CASE("parse_scope accepts the four scopes", "[scope]") {
    REQUIRE(parse_scope("function").value() == FixtureScope::Function);
    REQUIRE(parse_scope("module").value() == FixtureScope::Module);
    REQUIRE(parse_scope("package").value() == FixtureScope::Package);
    REQUIRE(parse_scope("session").value() == FixtureScope::Session);
}

TEST_CASE("parse_scope rejects anything else", "[scope]") {
    for (const char* text : {"invalid_scope", "Session", "", " module", "class"}) {
        auto r = parse_scope(text);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TrellisError::InvalidFixture);
        REQUIRE_FALSE(r.error().hint.empty());
    }
}

TEST_CASE("scope_name round-trips through parse_scope", "[scope]") {
    for (auto s : {FixtureScope::Function, FixtureScope::Module,
                   FixtureScope::Package, FixtureScope::Session}) {
        REQUIRE(parse_scope(scope_name(s)).value() == s);
    }
}

TEST_CASE("scope ranks order narrow to broad", "[scope]") {
    REQUIRE(scope_rank(FixtureScope::Function) < scope_rank(FixtureScope::Module));
    REQUIRE(scope_rank(FixtureScope::Module) < scope_rank(FixtureScope::Package));
    REQUIRE(scope_rank(FixtureScope::Package) < scope_rank(FixtureScope::Session));
}

TEST_CASE("fixtures may only depend on equal or broader scopes", "[scope]") {
    REQUIRE(scope_can_depend_on(FixtureScope::Function, FixtureScope::Session));
    REQUIRE(scope_can_depend_on(FixtureScope::Module, FixtureScope::Module));
    REQUIRE(scope_can_depend_on(FixtureScope::Package, FixtureScope::Session));
    REQUIRE_FALSE(scope_can_depend_on(FixtureScope::Session, FixtureScope::Function));
    REQUIRE_FALSE(scope_can_depend_on(FixtureScope::Module, FixtureScope::Function));
    REQUIRE_FALSE(scope_can_depend_on(FixtureScope::Session, FixtureScope::Package));
}

TEST_CASE("ScopeKey equality and ordering", "[scope]") {
    ScopeKey m1{FixtureScope::Module, "tests/test_a.cpp"};
    ScopeKey m2{FixtureScope::Module, "tests/test_b.cpp"};
    ScopeKey f1{FixtureScope::Function, "tests/test_a.cpp"};

    REQUIRE(m1 == ScopeKey{FixtureScope::Module, "tests/test_a.cpp"});
    REQUIRE(m1 != m2);
    REQUIRE(m1 != f1);
    REQUIRE(f1 < m1);
    REQUIRE(m1 < m2);
    REQUIRE(m2 < ScopeKey::session());
}

TEST_CASE("ScopeKey str", "[scope]") {
    REQUIRE(ScopeKey::session().str() == "session");
    REQUIRE(ScopeKey{FixtureScope::Package, "tests/db"}.str() == "package:tests/db");
}
