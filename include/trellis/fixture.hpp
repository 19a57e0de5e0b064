#pragma once

#include <trellis/scope.hpp>
#include <trellis/value.hpp>
#include <functional>
#include <string>
#include <vector>

namespace trellis {

// What a fixture body produces: the value, and for generator fixtures the
// code that runs after the yield (invoked once when the scope closes).
struct FixtureYield {
    Value value;
    std::function<void()> teardown;
};

using FixtureBody = std::function<FixtureYield(const Arguments& args)>;

// A fixture as reported by discovery, scope still in textual form.
struct FixtureDecl {
    std::string name;
    std::string location;                  // declaring file
    int line = 0;
    std::string scope = "function";
    std::vector<std::string> dependencies;
    bool is_generator = false;
    bool autouse = false;
    FixtureBody body;
};

// Registered, immutable fixture definition owned by the FixtureTable.
// Identity is (location, name); `id` is the arena index.
struct FixtureDefinition {
    size_t id = 0;
    std::string name;
    std::string location;
    int line = 0;
    FixtureScope scope = FixtureScope::Function;
    std::vector<std::string> dependencies;
    bool is_generator = false;
    bool autouse = false;
    bool builtin = false;
    FixtureBody body;

    // Invalid definitions stay registered so they keep shadowing outer
    // definitions of the same name.
    bool valid = true;
    std::string invalid_reason;

    std::string directory() const;
    std::string display() const;   // "name (location:line)"
};

// Declares a plain fixture: the body returns the value.
FixtureDecl make_fixture(std::string name, std::string location,
                         std::string scope,
                         std::vector<std::string> dependencies,
                         std::function<Value(const Arguments&)> body);

// Declares a generator fixture: the body returns value + teardown.
FixtureDecl make_generator_fixture(std::string name, std::string location,
                                   std::string scope,
                                   std::vector<std::string> dependencies,
                                   FixtureBody body);

} // namespace trellis
