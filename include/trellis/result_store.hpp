#pragma once

#include <trellis/outcome.hpp>
#include <trellis/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

struct StoreStats {
    int64_t run_count = 0;
    int64_t result_count = 0;
};

// Latest recorded outcome of one invocation.
struct StoredResult {
    std::string location;
    std::string name;
    TestStatus status = TestStatus::Passed;
    double duration_ms = 0.0;
};

// Per-run outcome history in an SQLite database. Feeds the last-failed
// selection and the duration weights used to balance workers.
class ResultStore {
public:
    ResultStore();
    ~ResultStore();
    ResultStore(ResultStore&&) noexcept;
    ResultStore& operator=(ResultStore&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Records every outcome of a finished run; returns the run number.
    Result<int64_t> record_run(const RunSummary& summary);

    // Latest outcome per (location, name)
    Result<std::vector<StoredResult>> latest();

    // "location::name" of invocations whose latest outcome was failed or
    // errored, sorted.
    Result<std::vector<std::string>> last_failed();

    // Latest non-skipped duration per "location::name", in milliseconds.
    Result<std::unordered_map<std::string, double>> durations();

    // Maintenance
    Status prune(size_t keep_runs);
    Status clear();
    Result<StoreStats> get_stats();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace trellis
