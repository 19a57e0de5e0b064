#include <catch2/catch.hpp>
#include <trellis/parametrize.hpp>

using namespace trellis;

static TestItem item_with(std::vector<ParametrizeSpec> specs) {
    TestItem t;
    t.location = "tests/test_math.cpp";
    t.name = "test_add";
    t.parametrize = std::move(specs);
    t.body = [](const Arguments&) {};
    return t;
}

TEST_CASE("a test without specs yields one plain invocation", "[parametrize]") {
    auto t = item_with({});
    auto invs = expand(t);
    REQUIRE(invs.size() == 1);
    REQUIRE(invs[0].id == "test_add");
    REQUIRE(invs[0].param_id.empty());
    REQUIRE(invs[0].params.empty());
    REQUIRE(invs[0].item == &t);
}

TEST_CASE("params() builds rows with readable ids", "[parametrize]") {
    auto row = params(1, 2.5, "x", true);
    REQUIRE(row.values.size() == 4);
    REQUIRE(row.id == "1-2.5-x-true");
    REQUIRE(*row.values[2].get_if<std::string>() == "x");
}

TEST_CASE("one parametrize list yields one invocation per row", "[parametrize]") {
    auto t = item_with({ParametrizeSpec{{"a", "b"}, {params(1, 2), params(3, 4), params(5, 6)}}});
    auto invs = expand(t);
    REQUIRE(invs.size() == 3);
    REQUIRE(invs[0].id == "test_add[1-2]");
    REQUIRE(invs[2].id == "test_add[5-6]");
    REQUIRE(invs[1].param_id == "3-4");
    REQUIRE(invs[1].params.get<int>("a") == 3);
    REQUIRE(invs[1].params.get<int>("b") == 4);
}

TEST_CASE("multiple specs form a Cartesian product, first spec slowest", "[parametrize]") {
    auto t = item_with({
        ParametrizeSpec{{"x"}, {params(1), params(2)}},
        ParametrizeSpec{{"y"}, {params("a"), params("b"), params("c")}},
    });
    auto invs = expand(t);
    REQUIRE(invs.size() == 6);

    std::vector<std::string> ids;
    for (const auto& inv : invs) ids.push_back(inv.id);
    REQUIRE(ids == std::vector<std::string>{
        "test_add[1-a]", "test_add[1-b]", "test_add[1-c]",
        "test_add[2-a]", "test_add[2-b]", "test_add[2-c]"});
    REQUIRE(invs[4].params.get<int>("x") == 2);
    REQUIRE(invs[4].params.get<std::string>("y") == "b");
}

TEST_CASE("rows of values without a printable id get positional ids", "[parametrize]") {
    struct Point { int x; int y; };
    ParamSet row;
    row.values.push_back(Value::of(Point{1, 2}));
    auto t = item_with({ParametrizeSpec{{"p"}, {row, row}}});
    auto invs = expand(t);
    REQUIRE(invs[0].id == "test_add[p0]");
    REQUIRE(invs[1].id == "test_add[p1]");
}

TEST_CASE("explicit row ids are kept", "[parametrize]") {
    ParamSet row = params(0);
    row.id = "zero";
    auto t = item_with({ParametrizeSpec{{"n"}, {row}}});
    REQUIRE(expand(t)[0].id == "test_add[zero]");
}

TEST_CASE("an empty parameter set yields one skipped invocation", "[parametrize]") {
    auto t = item_with({ParametrizeSpec{{"a", "b"}, {}}});
    auto invs = expand(t);
    REQUIRE(invs.size() == 1);
    REQUIRE(invs[0].skip_reason);
    REQUIRE(invs[0].skip_reason->find("empty parameter set") != std::string::npos);
    REQUIRE_FALSE(invs[0].error);
}

TEST_CASE("a row with the wrong number of values is an error", "[parametrize]") {
    auto t = item_with({ParametrizeSpec{{"a", "b"}, {params(1, 2), params(3)}}});
    auto invs = expand(t);
    REQUIRE(invs.size() == 2);
    REQUIRE_FALSE(invs[0].error);
    REQUIRE(invs[1].error);
    REQUIRE(invs[1].error->find("has 1 value(s), expected 2") != std::string::npos);
}

TEST_CASE("parameter values are shared, not copied, across lookups", "[parametrize]") {
    auto t = item_with({ParametrizeSpec{{"v"}, {params(std::string("payload"))}}});
    auto invs = expand(t);
    REQUIRE(invs[0].params.raw("v").same_instance(t.parametrize[0].rows[0].values[0]));
}
