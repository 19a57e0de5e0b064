#include <catch2/catch.hpp>
#include <trellis/result_store.hpp>
#include <trellis/uuid.hpp>

#include <algorithm>
#include <filesystem>

using namespace trellis;
namespace fs = std::filesystem;

namespace {

// Store in a scratch directory, removed on scope exit
struct TempStore {
    fs::path dir;
    ResultStore store;

    TempStore() {
        dir = fs::temp_directory_path() / ("trellis_store_test_" + Uuid::v4().short_id());
        REQUIRE(store.open((dir / "results.db").string()).is_ok());
    }

    ~TempStore() {
        store.close();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

Outcome outcome(const std::string& name, TestStatus status, double ms) {
    Outcome o;
    o.location = "tests/test_a.cpp";
    o.name = name;
    o.status = status;
    o.duration_ms = ms;
    return o;
}

RunSummary summary_of(std::vector<Outcome> outcomes) {
    RunSummary s;
    for (auto& o : outcomes) s.record(std::move(o));
    return s;
}

} // namespace

TEST_CASE("open creates the database and its directory", "[result_store]") {
    TempStore t;
    REQUIRE(t.store.is_open());
    REQUIRE(fs::exists(t.dir / "results.db"));

    auto stats = t.store.get_stats();
    REQUIRE(stats.is_ok());
    REQUIRE(stats.value().run_count == 0);
}

TEST_CASE("operations on a closed store fail", "[result_store]") {
    ResultStore store;
    REQUIRE_FALSE(store.is_open());
    auto r = store.last_failed();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TrellisError::Database);
}

TEST_CASE("record_run stores every outcome", "[result_store]") {
    TempStore t;
    auto run = t.store.record_run(summary_of({
        outcome("test_ok", TestStatus::Passed, 5.0),
        outcome("test_bad", TestStatus::Failed, 7.0),
        outcome("test_skip", TestStatus::Skipped, 0.0),
    }));
    REQUIRE(run.is_ok());
    REQUIRE(run.value() == 1);

    auto stats = t.store.get_stats().value();
    REQUIRE(stats.run_count == 1);
    REQUIRE(stats.result_count == 3);

    auto latest = t.store.latest().value();
    REQUIRE(latest.size() == 3);
    auto bad = std::find_if(latest.begin(), latest.end(),
        [](const StoredResult& r) { return r.name == "test_bad"; });
    REQUIRE(bad != latest.end());
    REQUIRE(bad->status == TestStatus::Failed);
    REQUIRE(bad->duration_ms == Approx(7.0));
}

TEST_CASE("last_failed follows the most recent run of each test", "[result_store]") {
    TempStore t;
    REQUIRE(t.store.record_run(summary_of({
        outcome("test_a", TestStatus::Failed, 1.0),
        outcome("test_b", TestStatus::Errored, 1.0),
        outcome("test_c", TestStatus::Passed, 1.0),
    })).is_ok());
    REQUIRE(t.store.record_run(summary_of({
        outcome("test_a", TestStatus::Passed, 1.0),
        outcome("test_c", TestStatus::Failed, 1.0),
    })).is_ok());

    auto failed = t.store.last_failed().value();
    REQUIRE(failed == std::vector<std::string>{
        "tests/test_a.cpp::test_b", "tests/test_a.cpp::test_c"});
}

TEST_CASE("durations keep the latest non-skipped timing", "[result_store]") {
    TempStore t;
    REQUIRE(t.store.record_run(summary_of({
        outcome("test_a", TestStatus::Passed, 10.0),
        outcome("test_s", TestStatus::Skipped, 0.0),
    })).is_ok());
    REQUIRE(t.store.record_run(summary_of({
        outcome("test_a", TestStatus::Passed, 30.0),
    })).is_ok());

    auto durations = t.store.durations().value();
    REQUIRE(durations.size() == 1);
    REQUIRE(durations.at("tests/test_a.cpp::test_a") == Approx(30.0));
}

TEST_CASE("prune keeps only the newest runs", "[result_store]") {
    TempStore t;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(t.store.record_run(summary_of({
            outcome("test_" + std::to_string(i), TestStatus::Passed, 1.0),
        })).is_ok());
    }
    REQUIRE(t.store.prune(2).is_ok());

    auto stats = t.store.get_stats().value();
    REQUIRE(stats.run_count == 2);
    REQUIRE(stats.result_count == 2);

    auto latest = t.store.latest().value();
    REQUIRE(latest.size() == 2);
    REQUIRE(latest[0].name == "test_3");
    REQUIRE(latest[1].name == "test_4");
}

TEST_CASE("history survives reopening", "[result_store]") {
    TempStore t;
    REQUIRE(t.store.record_run(summary_of({
        outcome("test_a", TestStatus::Failed, 1.0),
    })).is_ok());
    t.store.close();

    REQUIRE(t.store.open((t.dir / "results.db").string()).is_ok());
    REQUIRE(t.store.last_failed().value().size() == 1);

    REQUIRE(t.store.clear().is_ok());
    REQUIRE(t.store.last_failed().value().empty());
}
