#pragma once

#include <trellis/result.hpp>
#include <string>

namespace trellis {

// Cache lifetime of a fixture instance, narrowest first.
enum class FixtureScope {
    Function,
    Module,
    Package,
    Session
};

// Accepts exactly "function", "module", "package" and "session".
Result<FixtureScope> parse_scope(const std::string& text);
const char* scope_name(FixtureScope scope);

// 0 for Function up to 3 for Session
int scope_rank(FixtureScope scope);

// A fixture may only depend on fixtures living at least as long as itself.
bool scope_can_depend_on(FixtureScope dependent, FixtureScope dependency);

// One live instance of a scope level:
//   Function -> invocation id
//   Module   -> test file path
//   Package  -> declaring directory of the fixture
//   Session  -> empty id, one per run
struct ScopeKey {
    FixtureScope level = FixtureScope::Function;
    std::string id;

    static ScopeKey session() { return ScopeKey{FixtureScope::Session, ""}; }

    std::string str() const;

    bool operator==(const ScopeKey& o) const {
        return level == o.level && id == o.id;
    }
    bool operator!=(const ScopeKey& o) const { return !(*this == o); }
    bool operator<(const ScopeKey& o) const {
        if (level != o.level) return scope_rank(level) < scope_rank(o.level);
        return id < o.id;
    }
};

} // namespace trellis
