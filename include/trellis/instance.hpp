#pragma once

#include <trellis/fixture.hpp>
#include <trellis/result.hpp>
#include <trellis/scope.hpp>
#include <functional>
#include <string>

namespace trellis {

// A teardown that raised while its scope was closing.
struct TeardownFailure {
    std::string fixture;
    std::string location;
    int line = 0;
    ScopeKey key;
    std::string message;
};

// Live value of one (definition, scope key) pair.
//
// Pending -> Acquired -> TornDown. The teardown continuation of a generator
// fixture runs exactly once, on the transition to TornDown.
class FixtureInstance {
public:
    enum class State { Pending, Acquired, TornDown };

    FixtureInstance(const FixtureDefinition& def, ScopeKey key);

    // Runs the setup half of the body. Anything the body throws becomes a
    // Fixture error naming the fixture; the instance stays Pending.
    Status setup(const Arguments& args);

    // Runs the pending continuation, if any. Only the first call does work.
    Status teardown();

    State state() const { return state_; }
    const Value& value() const { return value_; }
    const FixtureDefinition& definition() const { return def_; }
    const ScopeKey& key() const { return key_; }

private:
    const FixtureDefinition& def_;
    ScopeKey key_;
    State state_ = State::Pending;
    Value value_;
    std::function<void()> teardown_;
};

// Runs fn, turning any exception into a message. Returns true when fn
// completed normally.
bool run_guarded(const std::function<void()>& fn, std::string& error_out);

} // namespace trellis
