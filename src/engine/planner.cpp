#include <trellis/planner.hpp>
#include <trellis/parametrize.hpp>
#include <trellis/log.hpp>

#include <algorithm>
#include <optional>
#include <unordered_map>

namespace trellis {

bool ResolutionPlan::contains(const std::string& fixture_name) const {
    for (const auto& step : steps) {
        if (step.definition->name == fixture_name) return true;
    }
    return false;
}

namespace {

struct PlanNode {
    const FixtureDefinition* def = nullptr;   // nullptr for the test itself
    std::vector<NamedFixture> args;
};

using PlanGraph = Graph<PlanNode>;

// Depth-first resolution of one invocation's fixture closure.
class PlanWalk {
public:
    PlanWalk(const VisibilityResolver& resolver, const std::string& file)
        : resolver_(resolver), file_(file) {}

    PlanGraph graph;
    std::vector<std::string> missing;
    std::vector<std::string> mismatches;
    std::optional<std::string> cycle;

    std::optional<PlanGraph::NodeId> visit(const FixtureDefinition* def) {
        auto it = done_.find(def);
        if (it != done_.end()) return it->second;

        auto on_stack = std::find(stack_.begin(), stack_.end(), def);
        if (on_stack != stack_.end()) {
            if (!cycle) {
                std::string path;
                for (auto p = on_stack; p != stack_.end(); ++p) {
                    path += (*p)->name + " -> ";
                }
                cycle = path + def->name;
            }
            return std::nullopt;
        }

        stack_.push_back(def);
        PlanGraph::NodeId id = graph.add_node(PlanNode{def, {}});

        for (const auto& dep_name : def->dependencies) {
            auto found = resolver_.resolve(dep_name, file_, def);
            if (found.is_err()) {
                missing.push_back(dep_name + " (required by " + def->name + ")");
                continue;
            }
            const FixtureDefinition* dep = found.value();
            if (!scope_can_depend_on(def->scope, dep->scope)) {
                mismatches.push_back(std::string(scope_name(def->scope)) +
                    "-scoped fixture '" + def->name + "' cannot depend on " +
                    scope_name(dep->scope) + "-scoped fixture '" + dep->name + "'");
            }
            auto child = visit(dep);
            if (!child) continue;
            graph.add_edge(id, *child);
            graph.node(id).args.emplace_back(dep_name, dep);
        }

        stack_.pop_back();
        done_[def] = id;
        return id;
    }

private:
    const VisibilityResolver& resolver_;
    const std::string& file_;
    std::unordered_map<const FixtureDefinition*, PlanGraph::NodeId> done_;
    std::vector<const FixtureDefinition*> stack_;
};

} // namespace

PlanBuilder::PlanBuilder(const FixtureTable& table)
    : resolver_(table) {}

Result<ResolutionPlan> PlanBuilder::build(const TestInvocation& invocation) const {
    const TestItem& item = *invocation.item;
    PlanWalk walk(resolver_, item.location);
    auto root = walk.graph.add_node(PlanNode{});

    ResolutionPlan plan;

    auto link = [&](PlanGraph::NodeId child) {
        if (!walk.graph.has_edge(root, child)) {
            walk.graph.add_edge(root, child);
        }
    };

    for (const auto* def : resolver_.autouse_for(item.location)) {
        auto child = walk.visit(def);
        if (child) link(*child);
    }

    auto request = [&](const std::string& name, bool is_argument) {
        auto found = resolver_.resolve(name, item.location);
        if (found.is_err()) {
            walk.missing.push_back(name);
            return;
        }
        auto child = walk.visit(found.value());
        if (!child) return;
        link(*child);
        if (is_argument) {
            plan.test_arguments.emplace_back(name, found.value());
        }
    };

    for (const auto& name : item.tags.use_fixtures) {
        request(name, false);
    }
    for (const auto& name : item.parameters) {
        if (invocation.params.has(name)) continue;
        request(name, true);
    }

    if (walk.cycle) {
        return TrellisError{TrellisError::Cycle,
            "cyclic fixture dependency: " + *walk.cycle,
            "", item.location, item.line};
    }
    if (!walk.missing.empty()) {
        return TrellisError{TrellisError::NotFound,
            "missing fixtures for test '" + invocation.id + "': " +
                join_names(walk.missing),
            "", item.location, item.line};
    }
    if (!walk.mismatches.empty()) {
        return TrellisError{TrellisError::ScopeMismatch,
            join_names(walk.mismatches, "; "),
            "", item.location, item.line};
    }

    for (auto id : walk.graph.postorder_from(root)) {
        if (id == root) continue;
        const PlanNode& node = walk.graph.node(id);
        plan.steps.push_back(PlanStep{node.def, node.args});
    }

    plan.tree = walk.graph.tree_display(root, [&](const PlanNode& node) {
        if (!node.def) return invocation.id;
        return node.def->name + " [" + scope_name(node.def->scope) + "]";
    });
    log::debug("fixture plan for %s:\n%s", invocation.id.c_str(), plan.tree.c_str());

    return Result<ResolutionPlan>::ok(std::move(plan));
}

} // namespace trellis
