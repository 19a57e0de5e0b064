#include <trellis/execution_tree.hpp>
#include <trellis/source_path.hpp>

#include <algorithm>
#include <cstdint>

namespace trellis {

size_t PackageNode::invocation_count() const {
    size_t n = 0;
    for (const auto& m : modules) n += m->invocations.size();
    for (const auto& p : subpackages) n += p->invocation_count();
    return n;
}

std::string duration_key(const TestInvocation& invocation) {
    return normalize_path(invocation.item->location) + "::" + invocation.id;
}

// ---- Tree construction ----

ExecutionTree::ExecutionTree()
    : root_(std::make_unique<PackageNode>()) {}

static PackageNode* child_package(PackageNode& parent, const std::string& dir) {
    for (auto& sub : parent.subpackages) {
        if (sub->dir == dir) return sub.get();
    }
    parent.subpackages.push_back(std::make_unique<PackageNode>());
    parent.subpackages.back()->dir = dir;
    return parent.subpackages.back().get();
}

ExecutionTree ExecutionTree::build(const std::vector<TestInvocation>& invocations) {
    ExecutionTree tree;
    std::unordered_map<std::string, ModuleNode*> by_path;

    for (const auto& inv : invocations) {
        std::string path = normalize_path(inv.item->location);

        auto found = by_path.find(path);
        if (found != by_path.end()) {
            found->second->invocations.push_back(&inv);
            continue;
        }

        // Walk down from the root creating the directory chain
        std::vector<std::string> chain = ancestor_dirs(parent_dir(path));
        PackageNode* pkg = tree.root_.get();
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            if (it->empty()) continue;
            pkg = child_package(*pkg, *it);
        }

        pkg->modules.push_back(std::make_unique<ModuleNode>());
        ModuleNode* mod = pkg->modules.back().get();
        mod->path = path;
        mod->invocations.push_back(&inv);
        by_path[path] = mod;
        ++tree.module_count_;
    }
    return tree;
}

static void collect_modules(const PackageNode& pkg, std::vector<const ModuleNode*>& out) {
    for (const auto& m : pkg.modules) out.push_back(m.get());
    for (const auto& p : pkg.subpackages) collect_modules(*p, out);
}

std::vector<const ModuleNode*> ExecutionTree::modules() const {
    std::vector<const ModuleNode*> out;
    collect_modules(*root_, out);
    return out;
}

static void display_package(const PackageNode& pkg, int depth, std::string& out) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    out += indent + (pkg.dir.empty() ? "<root>" : pkg.dir) + "/\n";
    for (const auto& m : pkg.modules) {
        out += indent + "  " + m->path + " (" +
               std::to_string(m->invocations.size()) + ")\n";
    }
    for (const auto& p : pkg.subpackages) display_package(*p, depth + 1, out);
}

std::string ExecutionTree::display() const {
    std::string out;
    display_package(*root_, 0, out);
    return out;
}

// ---- Partitioning ----

std::string WorkUnit::label() const {
    if (module) return module->path;
    if (package) return (package->dir.empty() ? "<root>" : package->dir) + "/";
    return "<empty>";
}

namespace {

struct Weigher {
    const std::unordered_map<std::string, double>& durations;
    double default_weight;

    double invocation(const TestInvocation& inv) const {
        auto it = durations.find(duration_key(inv));
        return it != durations.end() ? it->second : default_weight;
    }

    double module(const ModuleNode& m) const {
        double w = 0.0;
        for (const auto* inv : m.invocations) w += invocation(*inv);
        return w;
    }

    double package(const PackageNode& p) const {
        double w = 0.0;
        for (const auto& m : p.modules) w += module(*m);
        for (const auto& s : p.subpackages) w += package(*s);
        return w;
    }
};

size_t first_ordinal(const PackageNode& pkg) {
    size_t best = SIZE_MAX;
    for (const auto& m : pkg.modules) {
        if (!m->invocations.empty()) best = std::min(best, m->invocations.front()->ordinal);
    }
    for (const auto& p : pkg.subpackages) best = std::min(best, first_ordinal(*p));
    return best;
}

void split(const PackageNode& pkg, const FixtureTable& table, const Weigher& weigh,
           std::vector<WorkUnit>& out) {
    if (table.declares_package_scope(pkg.dir)) {
        WorkUnit unit;
        unit.package = &pkg;
        unit.weight = weigh.package(pkg);
        unit.first_ordinal = first_ordinal(pkg);
        out.push_back(unit);
        return;
    }
    for (const auto& m : pkg.modules) {
        if (m->invocations.empty()) continue;
        WorkUnit unit;
        unit.module = m.get();
        unit.weight = weigh.module(*m);
        unit.first_ordinal = m->invocations.front()->ordinal;
        out.push_back(unit);
    }
    for (const auto& p : pkg.subpackages) split(*p, table, weigh, out);
}

} // namespace

std::vector<std::vector<WorkUnit>> partition(
    const ExecutionTree& tree,
    const FixtureTable& table,
    size_t workers,
    const std::unordered_map<std::string, double>& durations,
    double default_weight) {
    Weigher weigh{durations, default_weight};
    std::vector<std::vector<WorkUnit>> buckets;

    if (tree.invocation_count() == 0) return buckets;

    if (workers <= 1) {
        WorkUnit whole;
        whole.package = &tree.root();
        whole.weight = weigh.package(tree.root());
        whole.first_ordinal = first_ordinal(tree.root());
        buckets.push_back({whole});
        return buckets;
    }

    std::vector<WorkUnit> units;
    split(tree.root(), table, weigh, units);

    std::stable_sort(units.begin(), units.end(),
        [](const WorkUnit& a, const WorkUnit& b) { return a.weight > b.weight; });

    buckets.resize(std::min(workers, units.size()));
    std::vector<double> load(buckets.size(), 0.0);
    for (const auto& unit : units) {
        size_t lightest = 0;
        for (size_t i = 1; i < load.size(); ++i) {
            if (load[i] < load[lightest]) lightest = i;
        }
        buckets[lightest].push_back(unit);
        load[lightest] += unit.weight;
    }

    // Within a bucket, run in collection order
    for (auto& bucket : buckets) {
        std::sort(bucket.begin(), bucket.end(),
            [](const WorkUnit& a, const WorkUnit& b) {
                return a.first_ordinal < b.first_ordinal;
            });
    }
    return buckets;
}

} // namespace trellis
