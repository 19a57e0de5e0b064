#pragma once

#include <trellis/fixture_table.hpp>
#include <trellis/test_item.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

// Invocations collected from one test file, in collection order.
struct ModuleNode {
    std::string path;
    std::vector<const TestInvocation*> invocations;
};

// One directory. Traversal visits the package's own modules before its
// subpackages, both in first-appearance order.
struct PackageNode {
    std::string dir;
    std::vector<std::unique_ptr<ModuleNode>> modules;
    std::vector<std::unique_ptr<PackageNode>> subpackages;

    size_t invocation_count() const;
};

// Package -> module -> invocation nesting used to decide when module and
// package scopes close.
class ExecutionTree {
public:
    // Invocations must outlive the tree.
    static ExecutionTree build(const std::vector<TestInvocation>& invocations);

    ExecutionTree(ExecutionTree&&) = default;
    ExecutionTree& operator=(ExecutionTree&&) = default;

    const PackageNode& root() const { return *root_; }
    size_t module_count() const { return module_count_; }
    size_t invocation_count() const { return root_->invocation_count(); }

    // Modules in traversal order.
    std::vector<const ModuleNode*> modules() const;

    // Indented outline, one line per package and module.
    std::string display() const;

private:
    ExecutionTree();

    std::unique_ptr<PackageNode> root_;
    size_t module_count_ = 0;
};

// A piece of the tree run start to finish by one worker. Either a whole
// package subtree, or one module whose enclosing packages own no
// package-scoped fixtures.
struct WorkUnit {
    const PackageNode* package = nullptr;   // set for a subtree unit
    const ModuleNode* module = nullptr;     // set for a module unit
    double weight = 0.0;
    size_t first_ordinal = 0;

    std::string label() const;
};

// Splits the tree into at most `workers` buckets of work units. A package
// whose directory declares package-scoped fixtures is never split across
// buckets. Units are weighted by recorded durations (milliseconds, keyed by
// "location::invocation id"), falling back to `default_weight` per
// invocation, and assigned heaviest first to the lightest bucket.
std::vector<std::vector<WorkUnit>> partition(
    const ExecutionTree& tree,
    const FixtureTable& table,
    size_t workers,
    const std::unordered_map<std::string, double>& durations = {},
    double default_weight = 1.0);

// Key under which the duration of an invocation is recorded.
std::string duration_key(const TestInvocation& invocation);

} // namespace trellis
