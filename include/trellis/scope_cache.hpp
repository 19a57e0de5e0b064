#pragma once

#include <trellis/instance.hpp>
#include <trellis/planner.hpp>
#include <trellis/session.hpp>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

// Where an invocation sits in the scope nesting.
struct InvocationScope {
    std::string invocation_id;
    std::string module;
};

ScopeKey scope_key_for(const FixtureDefinition& def, const InvocationScope& where);

// Live fixture instances of one worker, keyed by scope instance, plus the
// finalizers that tear them down.
//
// Session-scoped definitions are delegated to the shared SessionContext;
// everything else is private to the worker and needs no locking.
class ScopeCache {
public:
    explicit ScopeCache(SessionContext& session);

    ScopeCache(const ScopeCache&) = delete;
    ScopeCache& operator=(const ScopeCache&) = delete;

    // Cached value for (def, key) or a fresh setup. A failed setup is not
    // cached: the next consumer in the same scope instance runs it again.
    Result<Value> acquire(const FixtureDefinition& def, const Arguments& args,
                          const InvocationScope& where);

    // Acquires every step in plan order and returns the test's arguments.
    // Stops at the first failing step.
    Result<Arguments> acquire_plan(const ResolutionPlan& plan,
                                   const InvocationScope& where,
                                   const RequestInfo* request);

    // Tears down the instances of one scope instance, last acquired first.
    // A throwing teardown is reported and the remaining ones still run.
    std::vector<TeardownFailure> close_scope(FixtureScope level, const std::string& id);

    size_t live_count(const ScopeKey& key) const;
    std::vector<ScopeKey> open_keys() const;

    SessionContext& session() { return session_; }

private:
    struct Frame {
        std::vector<std::unique_ptr<FixtureInstance>> order;
        std::unordered_map<size_t, FixtureInstance*> by_def;
    };

    SessionContext& session_;
    std::map<ScopeKey, Frame> frames_;
};

} // namespace trellis
