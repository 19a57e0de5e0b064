#pragma once

#include <string>
#include <vector>

namespace trellis {

enum class TestStatus {
    Passed,
    Failed,
    Errored,
    Skipped
};

const char* status_name(TestStatus status);

// Per-invocation record handed to the reporting side.
struct Outcome {
    std::string location;
    std::string name;          // invocation id
    TestStatus status = TestStatus::Passed;
    std::string message;
    double duration_ms = 0.0;
};

// Problems with the fixture graph itself rather than with a test body.
struct StructuralError {
    enum Kind {
        FixtureNotFound,
        InvalidFixture,
        CyclicDependency,
        ScopeMismatch,
        FixtureTeardown
    };

    Kind kind;
    std::string location;
    int line = 0;
    std::string detail;

    static const char* kind_name(Kind k);   // "fixture-not-found", ...
    std::string format() const;
};

struct RunCounts {
    size_t passed = 0;
    size_t failed = 0;
    size_t errored = 0;
    size_t skipped = 0;

    size_t total() const { return passed + failed + errored + skipped; }
};

struct RunSummary {
    std::vector<Outcome> outcomes;
    std::vector<StructuralError> errors;
    RunCounts counts;
    double duration_ms = 0.0;

    void record(Outcome outcome);
    void add_error(StructuralError error);

    size_t error_count(StructuralError::Kind kind) const;

    // Finds the outcome of an invocation; nullptr when it never ran.
    const Outcome* find(const std::string& name) const;

    // No failed or errored outcome and no structural error.
    bool success() const;
    int exit_code() const { return success() ? 0 : 1; }

    // "test result: FAILED. 0 passed; 1 failed; 1 errored; 0 skipped; 2 error(s)"
    std::string format() const;
};

} // namespace trellis
