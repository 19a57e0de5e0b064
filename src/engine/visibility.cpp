#include <trellis/visibility.hpp>
#include <algorithm>

namespace trellis {

VisibilityResolver::VisibilityResolver(const FixtureTable& table)
    : table_(table) {}

Result<const FixtureDefinition*> VisibilityResolver::resolve(
    const std::string& name,
    const std::string& requesting_file,
    const FixtureDefinition* exclude) const
{
    bool skipping = exclude != nullptr && exclude->name == name;

    for (const auto& level : table_.search_levels(requesting_file)) {
        const FixtureDefinition* def = table_.find_at(level, name);
        if (!def) continue;

        if (skipping) {
            // Levels up to and including the requester's own are passed over
            if (def == exclude) skipping = false;
            continue;
        }

        if (!def->valid) {
            return TrellisError{TrellisError::NotFound,
                "fixture '" + name + "' not found",
                "nearest definition " + def->display() + " is invalid: " +
                    def->invalid_reason};
        }
        return Result<const FixtureDefinition*>::ok(def);
    }

    return TrellisError{TrellisError::NotFound,
        "fixture '" + name + "' not found"};
}

const FixtureDefinition* VisibilityResolver::nearest(
    const std::string& name, const std::vector<std::string>& levels) const
{
    for (const auto& level : levels) {
        if (const FixtureDefinition* def = table_.find_at(level, name)) return def;
    }
    return nullptr;
}

std::vector<const FixtureDefinition*> VisibilityResolver::autouse_for(
    const std::string& requesting_file) const
{
    auto levels = table_.search_levels(requesting_file);

    // Outer levels first
    std::vector<const FixtureDefinition*> out;
    for (auto it = levels.rbegin(); it != levels.rend(); ++it) {
        for (const auto* def : table_.autouse_at(*it)) {
            // A nearer same-named definition shadows this one, valid or not
            if (nearest(def->name, levels) != def || !def->valid) continue;
            out.push_back(def);
        }
    }

    std::stable_sort(out.begin(), out.end(),
        [](const FixtureDefinition* a, const FixtureDefinition* b) {
            return scope_rank(a->scope) > scope_rank(b->scope);
        });
    return out;
}

} // namespace trellis
