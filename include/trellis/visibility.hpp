#pragma once

#include <trellis/fixture_table.hpp>
#include <trellis/result.hpp>
#include <string>
#include <vector>

namespace trellis {

// Closest-definition-wins lookup over the FixtureTable's levels.
class VisibilityResolver {
public:
    explicit VisibilityResolver(const FixtureTable& table);

    // Finds the nearest definition of `name` visible from `requesting_file`.
    // NotFound when nothing is visible, or when the nearest definition is
    // invalid (an outer definition is never used in its place).
    //
    // `exclude` is the fixture doing the requesting: when it asks for its
    // own name the search resumes beyond its level, which lets an inner
    // fixture extend the outer fixture it overrides.
    Result<const FixtureDefinition*> resolve(
        const std::string& name,
        const std::string& requesting_file,
        const FixtureDefinition* exclude = nullptr) const;

    // Autouse fixtures visible from `requesting_file`: broadest scope first,
    // then outer levels before inner ones, then registration order.
    std::vector<const FixtureDefinition*> autouse_for(
        const std::string& requesting_file) const;

private:
    // First definition of `name` over `levels`, including invalid ones.
    const FixtureDefinition* nearest(const std::string& name,
                                     const std::vector<std::string>& levels) const;

    const FixtureTable& table_;
};

} // namespace trellis
