#pragma once

#include <trellis/fixture.hpp>
#include <trellis/result.hpp>
#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace trellis {

// Which of two same-named definitions at one visibility level stays
// reachable; the other one is registered but never resolved.
enum class DuplicatePolicy {
    FirstWins,
    LastWins
};

Result<DuplicatePolicy> parse_duplicate_policy(const std::string& text);
const char* duplicate_policy_name(DuplicatePolicy policy);

struct TableOptions {
    // Files whose stem matches are directory-level definition files: their
    // fixtures are visible to the whole directory subtree.
    std::string definition_stem = "conftest";
    DuplicatePolicy duplicates = DuplicatePolicy::FirstWins;
};

// Arena of fixture definitions indexed by visibility level.
//
// A level is either one ordinary file (fixtures declared next to tests are
// private to that file) or one directory (fixtures from the directory's
// definition files). Builtins form a last, global level.
class FixtureTable {
public:
    explicit FixtureTable(TableOptions options = {});

    FixtureTable(const FixtureTable&) = delete;
    FixtureTable& operator=(const FixtureTable&) = delete;

    // Registers a discovered fixture. An unrecognized scope still registers
    // the definition (marked invalid) and returns an InvalidFixture error.
    Result<const FixtureDefinition*> add(FixtureDecl decl);

    // Registers an engine-provided fixture in the builtin level.
    const FixtureDefinition* add_builtin(FixtureDecl decl);

    bool is_definition_file(const std::string& path) const;

    // Level a definition declared in `location` belongs to.
    std::string level_of(const std::string& location) const;

    // Levels consulted for a request made from `requesting_file`, nearest
    // first, builtin level last.
    std::vector<std::string> search_levels(const std::string& requesting_file) const;

    // Reachable definition of `name` at `level`, or nullptr.
    const FixtureDefinition* find_at(const std::string& level,
                                     const std::string& name) const;

    // Reachable autouse definitions at `level` in registration order.
    std::vector<const FixtureDefinition*> autouse_at(const std::string& level) const;

    // True if a valid package-scoped fixture is keyed to `dir`.
    bool declares_package_scope(const std::string& dir) const;

    size_t size() const { return defs_.size(); }
    const FixtureDefinition& at(size_t id) const { return defs_.at(id); }
    const TableOptions& options() const { return options_; }

    static const char* builtin_level();

private:
    struct Level {
        std::vector<std::pair<std::string, size_t>> by_name;
    };

    TableOptions options_;
    std::deque<FixtureDefinition> defs_;
    std::unordered_map<std::string, Level> levels_;
    std::unordered_set<std::string> package_dirs_;

    const FixtureDefinition* index(const std::string& level, size_t id);
};

} // namespace trellis
