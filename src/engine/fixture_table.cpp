#include <trellis/fixture_table.hpp>
#include <trellis/source_path.hpp>
#include <trellis/log.hpp>

namespace trellis {

// ---------------------------------------------------------------------------
// DuplicatePolicy
// ---------------------------------------------------------------------------

Result<DuplicatePolicy> parse_duplicate_policy(const std::string& text) {
    if (text == "first") return Result<DuplicatePolicy>::ok(DuplicatePolicy::FirstWins);
    if (text == "last") return Result<DuplicatePolicy>::ok(DuplicatePolicy::LastWins);
    return TrellisError{TrellisError::Config,
        "invalid duplicate policy '" + text + "'",
        "expected \"first\" or \"last\""};
}

const char* duplicate_policy_name(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::FirstWins: return "first";
        case DuplicatePolicy::LastWins:  return "last";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// FixtureTable
// ---------------------------------------------------------------------------

FixtureTable::FixtureTable(TableOptions options)
    : options_(std::move(options)) {}

const char* FixtureTable::builtin_level() {
    return "builtin:";
}

bool FixtureTable::is_definition_file(const std::string& path) const {
    return !options_.definition_stem.empty() &&
           file_stem(path) == options_.definition_stem;
}

std::string FixtureTable::level_of(const std::string& location) const {
    std::string path = normalize_path(location);
    if (is_definition_file(path)) {
        return "dir:" + parent_dir(path);
    }
    return "file:" + path;
}

std::vector<std::string> FixtureTable::search_levels(
    const std::string& requesting_file) const
{
    std::string path = normalize_path(requesting_file);
    std::vector<std::string> levels;
    if (!is_definition_file(path)) {
        levels.push_back("file:" + path);
    }
    for (const auto& dir : ancestor_dirs(parent_dir(path))) {
        levels.push_back("dir:" + dir);
    }
    levels.push_back(builtin_level());
    return levels;
}

const FixtureDefinition* FixtureTable::index(const std::string& level, size_t id) {
    FixtureDefinition& def = defs_[id];
    auto& entries = levels_[level].by_name;

    for (auto& entry : entries) {
        if (entry.first != def.name) continue;

        const FixtureDefinition& existing = defs_[entry.second];
        if (options_.duplicates == DuplicatePolicy::FirstWins) {
            log::warn("fixture %s is unreachable: %s wins at the same level",
                      def.display().c_str(), existing.display().c_str());
        } else {
            log::warn("fixture %s is unreachable: %s wins at the same level",
                      existing.display().c_str(), def.display().c_str());
            entry.second = id;
        }
        return &def;
    }

    entries.emplace_back(def.name, id);
    return &def;
}

Result<const FixtureDefinition*> FixtureTable::add(FixtureDecl decl) {
    FixtureDefinition def;
    def.id = defs_.size();
    def.name = std::move(decl.name);
    def.location = normalize_path(decl.location);
    def.line = decl.line;
    def.dependencies = std::move(decl.dependencies);
    def.is_generator = decl.is_generator;
    def.autouse = decl.autouse;
    def.body = std::move(decl.body);

    auto scope = parse_scope(decl.scope);
    if (scope.is_err()) {
        def.valid = false;
        def.invalid_reason = scope.error().message;
    } else {
        def.scope = scope.value();
    }

    std::string level = level_of(def.location);
    defs_.push_back(std::move(def));
    const FixtureDefinition* added = index(level, defs_.back().id);

    if (!added->valid) {
        log::warn("invalid fixture %s: %s",
                  added->display().c_str(), added->invalid_reason.c_str());
        return TrellisError{TrellisError::InvalidFixture,
            "invalid fixture '" + added->name + "': " + added->invalid_reason,
            scope.error().hint, added->location, added->line};
    }

    if (added->scope == FixtureScope::Package) {
        package_dirs_.insert(added->directory());
    }
    log::trace("registered fixture %s [%s]",
               added->display().c_str(), scope_name(added->scope));
    return Result<const FixtureDefinition*>::ok(added);
}

const FixtureDefinition* FixtureTable::add_builtin(FixtureDecl decl) {
    FixtureDefinition def;
    def.id = defs_.size();
    def.name = std::move(decl.name);
    def.location = std::move(decl.location);
    def.dependencies = std::move(decl.dependencies);
    def.is_generator = decl.is_generator;
    def.builtin = true;
    def.body = std::move(decl.body);

    auto scope = parse_scope(decl.scope);
    def.scope = scope.is_ok() ? scope.value() : FixtureScope::Function;

    defs_.push_back(std::move(def));
    return index(builtin_level(), defs_.back().id);
}

const FixtureDefinition* FixtureTable::find_at(const std::string& level,
                                               const std::string& name) const {
    auto it = levels_.find(level);
    if (it == levels_.end()) return nullptr;
    for (const auto& entry : it->second.by_name) {
        if (entry.first == name) return &defs_[entry.second];
    }
    return nullptr;
}

std::vector<const FixtureDefinition*> FixtureTable::autouse_at(
    const std::string& level) const
{
    std::vector<const FixtureDefinition*> out;
    auto it = levels_.find(level);
    if (it == levels_.end()) return out;
    for (const auto& entry : it->second.by_name) {
        const FixtureDefinition& def = defs_[entry.second];
        if (def.autouse && def.valid) out.push_back(&def);
    }
    return out;
}

bool FixtureTable::declares_package_scope(const std::string& dir) const {
    return package_dirs_.count(dir) > 0;
}

} // namespace trellis
