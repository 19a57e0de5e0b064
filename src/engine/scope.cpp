#include <trellis/scope.hpp>

namespace trellis {

Result<FixtureScope> parse_scope(const std::string& text) {
    if (text == "function") return Result<FixtureScope>::ok(FixtureScope::Function);
    if (text == "module")   return Result<FixtureScope>::ok(FixtureScope::Module);
    if (text == "package")  return Result<FixtureScope>::ok(FixtureScope::Package);
    if (text == "session")  return Result<FixtureScope>::ok(FixtureScope::Session);
    return TrellisError{TrellisError::InvalidFixture,
        "invalid fixture scope '" + text + "'",
        "expected one of: function, module, package, session"};
}

const char* scope_name(FixtureScope scope) {
    switch (scope) {
        case FixtureScope::Function: return "function";
        case FixtureScope::Module:   return "module";
        case FixtureScope::Package:  return "package";
        case FixtureScope::Session:  return "session";
    }
    return "unknown";
}

int scope_rank(FixtureScope scope) {
    switch (scope) {
        case FixtureScope::Function: return 0;
        case FixtureScope::Module:   return 1;
        case FixtureScope::Package:  return 2;
        case FixtureScope::Session:  return 3;
    }
    return 0;
}

bool scope_can_depend_on(FixtureScope dependent, FixtureScope dependency) {
    return scope_rank(dependency) >= scope_rank(dependent);
}

std::string ScopeKey::str() const {
    if (level == FixtureScope::Session) return "session";
    return std::string(scope_name(level)) + ":" + id;
}

} // namespace trellis
