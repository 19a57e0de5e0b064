#pragma once

#include <trellis/fixture_table.hpp>
#include <trellis/graph.hpp>
#include <trellis/test_item.hpp>
#include <trellis/visibility.hpp>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

using NamedFixture = std::pair<std::string, const FixtureDefinition*>;

// One fixture to acquire, with the definitions its dependency names
// resolved to.
struct PlanStep {
    const FixtureDefinition* definition = nullptr;
    std::vector<NamedFixture> arguments;
};

// Acquisition order for one invocation: every dependency precedes its
// dependents; autouse fixtures come first.
struct ResolutionPlan {
    std::vector<PlanStep> steps;
    std::vector<NamedFixture> test_arguments;   // declared parameters only
    std::string tree;                           // rendered dependency tree

    bool contains(const std::string& fixture_name) const;
};

// Builds resolution plans. Errors:
//   NotFound      - one or more names resolve to nothing; every missing name
//                   is listed, not just the first
//   Cycle         - a fixture transitively requires itself; the message
//                   names the cycle ("a -> b -> a")
//   ScopeMismatch - a fixture depends on a narrower-scoped fixture
class PlanBuilder {
public:
    explicit PlanBuilder(const FixtureTable& table);

    Result<ResolutionPlan> build(const TestInvocation& invocation) const;

    const VisibilityResolver& resolver() const { return resolver_; }

private:
    VisibilityResolver resolver_;
};

} // namespace trellis
