#pragma once

#include <trellis/instance.hpp>
#include <trellis/result.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace trellis {

// Run-wide session scope, shared by every worker and passed to them
// explicitly.
//
// The first caller for a definition sets it up while other callers for the
// same definition wait. A published value is returned to everyone without
// further setup. A setup failure goes to the callers that waited on that
// attempt only; the next caller starts a new attempt.
class SessionContext {
public:
    SessionContext() = default;
    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;

    Result<Value> acquire(const FixtureDefinition& def, const Arguments& args);

    // Tears down every session instance, last acquired first. Further
    // acquisitions fail.
    std::vector<TeardownFailure> close();

    size_t live_count() const;
    bool is_closed() const;

private:
    // One in-flight setup, shared with the callers waiting on it.
    struct Attempt {
        bool done = false;
        bool failed = false;
        TrellisError error;
    };

    struct Entry {
        std::unique_ptr<FixtureInstance> instance;
        std::shared_ptr<Attempt> attempt;
    };

    mutable std::mutex mtx_;
    std::condition_variable published_;
    std::unordered_map<size_t, Entry> entries_;
    std::vector<size_t> order_;
    bool closed_ = false;
};

} // namespace trellis
