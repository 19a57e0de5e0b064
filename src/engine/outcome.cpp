#include <trellis/outcome.hpp>

#include <cstdio>

namespace trellis {

const char* status_name(TestStatus status) {
    switch (status) {
        case TestStatus::Passed:  return "passed";
        case TestStatus::Failed:  return "failed";
        case TestStatus::Errored: return "errored";
        case TestStatus::Skipped: return "skipped";
    }
    return "unknown";
}

const char* StructuralError::kind_name(Kind k) {
    switch (k) {
        case FixtureNotFound:  return "fixture-not-found";
        case InvalidFixture:   return "invalid-fixture";
        case CyclicDependency: return "cyclic-dependency";
        case ScopeMismatch:    return "scope-mismatch";
        case FixtureTeardown:  return "fixture-teardown-error";
    }
    return "unknown";
}

std::string StructuralError::format() const {
    std::string result = kind_name(kind);
    result += ": ";
    result += detail;
    if (!location.empty()) {
        result += "\n  --> ";
        result += location;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }
    return result;
}

void RunSummary::record(Outcome outcome) {
    switch (outcome.status) {
        case TestStatus::Passed:  ++counts.passed; break;
        case TestStatus::Failed:  ++counts.failed; break;
        case TestStatus::Errored: ++counts.errored; break;
        case TestStatus::Skipped: ++counts.skipped; break;
    }
    outcomes.push_back(std::move(outcome));
}

void RunSummary::add_error(StructuralError error) {
    errors.push_back(std::move(error));
}

size_t RunSummary::error_count(StructuralError::Kind kind) const {
    size_t n = 0;
    for (const auto& e : errors) {
        if (e.kind == kind) ++n;
    }
    return n;
}

const Outcome* RunSummary::find(const std::string& name) const {
    for (const auto& o : outcomes) {
        if (o.name == name) return &o;
    }
    return nullptr;
}

bool RunSummary::success() const {
    return counts.failed == 0 && counts.errored == 0 && errors.empty();
}

std::string RunSummary::format() const {
    char timing[32];
    std::snprintf(timing, sizeof(timing), "%.2fs", duration_ms / 1000.0);

    std::string out = "test result: ";
    out += success() ? "ok" : "FAILED";
    out += ". " + std::to_string(counts.passed) + " passed; ";
    out += std::to_string(counts.failed) + " failed; ";
    out += std::to_string(counts.errored) + " errored; ";
    out += std::to_string(counts.skipped) + " skipped";
    if (!errors.empty()) {
        out += "; " + std::to_string(errors.size()) + " error(s)";
    }
    out += "; finished in ";
    out += timing;
    return out;
}

} // namespace trellis
