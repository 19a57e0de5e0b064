#pragma once

#include <trellis/config.hpp>
#include <trellis/fixture_table.hpp>
#include <trellis/outcome.hpp>
#include <trellis/result.hpp>
#include <trellis/result_store.hpp>
#include <trellis/test_item.hpp>
#include <deque>
#include <string>
#include <vector>

namespace trellis {

enum class RunState {
    Collecting,
    Running,
    Closing,
    Done
};

const char* run_state_name(RunState state);

struct RunOptions {
    size_t workers = 1;
    bool fail_fast = false;     // stop starting invocations after the first failure
    bool builtins = true;       // register tmp_path, temp_dir and request
    TableOptions table;
    std::string store_path;     // result store opened by run(); empty: none
    size_t keep_runs = 20;      // runs kept in the store after recording

    static RunOptions from_config(const RunConfig& config);
};

// Drives one run: Collecting -> Running -> Closing -> Done.
//
// Fixtures and tests are registered while collecting. run() expands
// parametrized tests, groups invocations into the package/module tree,
// hands disjoint parts of it to workers and closes every scope instance
// as soon as it has no further consumers. Session fixtures are torn down on
// the calling thread after all workers finish.
class Coordinator {
public:
    explicit Coordinator(RunOptions options = {});

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Registers a fixture. A definition with an unrecognized scope is kept
    // (it still shades outer definitions), reported as an invalid-fixture
    // structural error and returned as an error.
    Status add_fixture(FixtureDecl decl);
    Status add_test(TestItem item);

    // Non-owning; the store must stay open until run() returns. Takes
    // precedence over RunOptions::store_path.
    void attach_store(ResultStore* store) { store_ = store; }

    // Runs everything collected. Fails only when called twice; test and
    // fixture problems are reported through the summary.
    Result<RunSummary> run();

    RunState state() const { return state_; }
    const FixtureTable& table() const { return table_; }
    const RunOptions& options() const { return options_; }

private:
    RunOptions options_;
    RunState state_ = RunState::Collecting;
    FixtureTable table_;
    std::deque<TestItem> items_;
    std::vector<StructuralError> registration_errors_;
    ResultStore* store_ = nullptr;
    ResultStore owned_store_;
};

} // namespace trellis
