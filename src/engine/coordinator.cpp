#include <trellis/coordinator.hpp>
#include <trellis/builtins.hpp>
#include <trellis/check.hpp>
#include <trellis/execution_tree.hpp>
#include <trellis/log.hpp>
#include <trellis/parametrize.hpp>
#include <trellis/planner.hpp>
#include <trellis/scope_cache.hpp>
#include <trellis/source_path.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace trellis {

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::Collecting: return "collecting";
        case RunState::Running:    return "running";
        case RunState::Closing:    return "closing";
        case RunState::Done:       return "done";
    }
    return "unknown";
}

RunOptions RunOptions::from_config(const RunConfig& config) {
    RunOptions opts;
    opts.workers = config.workers;
    opts.fail_fast = config.fail_fast;
    opts.table = config.table_options();
    if (config.cache_enabled) opts.store_path = config.cache_path;
    opts.keep_runs = config.cache_keep_runs;
    return opts;
}

static StructuralError::Kind kind_for(const TrellisError& err) {
    switch (err.code) {
        case TrellisError::Cycle:          return StructuralError::CyclicDependency;
        case TrellisError::ScopeMismatch:  return StructuralError::ScopeMismatch;
        case TrellisError::InvalidFixture: return StructuralError::InvalidFixture;
        default:                           return StructuralError::FixtureNotFound;
    }
}

static double elapsed_ms(std::chrono::steady_clock::time_point since) {
    auto d = std::chrono::steady_clock::now() - since;
    return std::chrono::duration<double, std::milli>(d).count();
}

// ---------------------------------------------------------------------------
// Worker: one sequential stream over its share of the execution tree
// ---------------------------------------------------------------------------

namespace {

struct RunShared {
    const PlanBuilder& planner;
    SessionContext& session;
    bool fail_fast;
    std::atomic<bool> stop{false};

    RunShared(const PlanBuilder& p, SessionContext& s, bool ff)
        : planner(p), session(s), fail_fast(ff) {}
};

struct WorkerReport {
    std::vector<std::pair<size_t, Outcome>> outcomes;   // keyed by ordinal
    std::vector<StructuralError> errors;
};

class Worker {
public:
    explicit Worker(RunShared& shared)
        : shared_(shared), cache_(shared.session) {}

    void run_units(const std::vector<WorkUnit>& units) {
        for (const auto& unit : units) {
            log::debug("worker starting %s", unit.label().c_str());
            if (unit.package) {
                run_package(*unit.package);
            } else if (unit.module) {
                run_module(*unit.module);
            }
        }
        // Instances whose scope never closed through the tree
        for (const auto& key : cache_.open_keys()) {
            if (key.level == FixtureScope::Session) continue;
            close_broad(key.level, key.id);
        }
    }

    WorkerReport take_report() { return std::move(report_); }

private:
    RunShared& shared_;
    ScopeCache cache_;
    WorkerReport report_;

    void run_package(const PackageNode& pkg) {
        for (const auto& mod : pkg.modules) run_module(*mod);
        for (const auto& sub : pkg.subpackages) run_package(*sub);
        close_broad(FixtureScope::Package, pkg.dir);
    }

    void run_module(const ModuleNode& mod) {
        for (const auto* inv : mod.invocations) {
            if (shared_.stop.load()) break;
            run_invocation(*inv, mod.path);
        }
        close_broad(FixtureScope::Module, mod.path);
    }

    void close_broad(FixtureScope level, const std::string& id) {
        for (auto& f : cache_.close_scope(level, id)) {
            report_.errors.push_back(StructuralError{StructuralError::FixtureTeardown,
                f.location, f.line, f.message + " [" + f.key.str() + "]"});
        }
    }

    void record(const TestInvocation& inv, Outcome outcome) {
        log::trace("%s %s", status_name(outcome.status), outcome.name.c_str());
        if (shared_.fail_fast && (outcome.status == TestStatus::Failed ||
                                  outcome.status == TestStatus::Errored)) {
            if (!shared_.stop.exchange(true)) {
                log::info("stopping after first failure: %s", outcome.name.c_str());
            }
        }
        report_.outcomes.emplace_back(inv.ordinal, std::move(outcome));
    }

    void run_invocation(const TestInvocation& inv, const std::string& module) {
        const TestItem& item = *inv.item;
        auto start = std::chrono::steady_clock::now();

        Outcome outcome;
        outcome.location = module;
        outcome.name = inv.id;

        if (inv.error) {
            outcome.status = TestStatus::Errored;
            outcome.message = *inv.error;
            record(inv, std::move(outcome));
            return;
        }
        const std::optional<std::string>& skip_reason =
            inv.skip_reason ? inv.skip_reason : item.tags.skip_reason;
        if (skip_reason) {
            outcome.status = TestStatus::Skipped;
            outcome.message = *skip_reason;
            record(inv, std::move(outcome));
            return;
        }

        auto plan = shared_.planner.build(inv);
        if (plan.is_err()) {
            const TrellisError& err = plan.error();
            report_.errors.push_back(StructuralError{kind_for(err), err.file,
                                                     err.line, err.message});
            outcome.status = TestStatus::Errored;
            outcome.message = err.message;
            outcome.duration_ms = elapsed_ms(start);
            record(inv, std::move(outcome));
            return;
        }

        RequestInfo request{inv.id, item.name, module, inv.param_id};
        InvocationScope where{module + "::" + inv.id + "#" + std::to_string(inv.ordinal),
                              module};

        auto args = cache_.acquire_plan(plan.value(), where, &request);
        if (args.is_err()) {
            outcome.status = TestStatus::Errored;
            outcome.message = args.error().message;
        } else {
            Arguments merged = std::move(args).value();
            merged.merge(inv.params);
            invoke(item, merged, outcome);
        }

        // The function scope closes with its invocation
        for (auto& f : cache_.close_scope(FixtureScope::Function, where.invocation_id)) {
            if (outcome.status == TestStatus::Passed || outcome.status == TestStatus::Skipped) {
                outcome.status = TestStatus::Errored;
            }
            if (!outcome.message.empty()) outcome.message += "\n";
            outcome.message += f.message;
        }

        outcome.duration_ms = elapsed_ms(start);
        record(inv, std::move(outcome));
    }

    static void invoke(const TestItem& item, const Arguments& args, Outcome& outcome) {
        bool raised = false;
        try {
            item.body(args);
            outcome.status = TestStatus::Passed;
        } catch (const SkipTest& e) {
            outcome.status = TestStatus::Skipped;
            outcome.message = e.what();
            return;
        } catch (const AssertionFailure& e) {
            raised = true;
            outcome.status = TestStatus::Failed;
            outcome.message = e.what();
        } catch (const std::exception& e) {
            raised = true;
            outcome.status = TestStatus::Errored;
            outcome.message = e.what();
        } catch (...) {
            raised = true;
            outcome.status = TestStatus::Errored;
            outcome.message = "unknown exception";
        }

        if (!item.tags.expect_fail_reason) return;
        const std::string& reason = *item.tags.expect_fail_reason;
        if (raised) {
            outcome.status = TestStatus::Passed;
            outcome.message = "expected failure" +
                (reason.empty() ? std::string() : " (" + reason + ")") +
                ": " + outcome.message;
        } else {
            outcome.status = TestStatus::Failed;
            outcome.message = "expected failure" +
                (reason.empty() ? std::string() : " (" + reason + ")") +
                " but the test passed";
        }
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Coordinator
// ---------------------------------------------------------------------------

Coordinator::Coordinator(RunOptions options)
    : options_(std::move(options)), table_(options_.table) {
    if (options_.builtins) register_builtins(table_);
}

Status Coordinator::add_fixture(FixtureDecl decl) {
    if (state_ != RunState::Collecting) {
        return TrellisError{TrellisError::InvalidArg,
            "cannot add fixture '" + decl.name + "' while " + run_state_name(state_)};
    }
    auto added = table_.add(std::move(decl));
    if (added.is_err()) {
        const TrellisError& err = added.error();
        registration_errors_.push_back(StructuralError{StructuralError::InvalidFixture,
                                                       err.file, err.line, err.message});
        return err;
    }
    return ok_status();
}

Status Coordinator::add_test(TestItem item) {
    if (state_ != RunState::Collecting) {
        return TrellisError{TrellisError::InvalidArg,
            "cannot add test '" + item.name + "' while " + run_state_name(state_)};
    }
    if (!item.body) {
        return TrellisError{TrellisError::InvalidArg,
            "test '" + item.name + "' has no body", "", item.location, item.line};
    }
    items_.push_back(std::move(item));
    return ok_status();
}

Result<RunSummary> Coordinator::run() {
    if (state_ != RunState::Collecting) {
        return TrellisError{TrellisError::InvalidArg,
            std::string("run() called while ") + run_state_name(state_)};
    }
    state_ = RunState::Running;
    auto start = std::chrono::steady_clock::now();

    std::vector<TestInvocation> invocations;
    for (const auto& item : items_) {
        for (auto& inv : expand(item)) {
            inv.ordinal = invocations.size();
            invocations.push_back(std::move(inv));
        }
    }

    ExecutionTree tree = ExecutionTree::build(invocations);
    log::debug("collected %zu invocation(s) in %zu module(s)\n%s",
               invocations.size(), tree.module_count(), tree.display().c_str());

    if (!store_ && !options_.store_path.empty()) {
        auto opened = owned_store_.open(options_.store_path);
        if (opened.is_ok()) {
            store_ = &owned_store_;
        } else {
            log::warn("result store disabled: %s", opened.error().message.c_str());
        }
    }

    std::unordered_map<std::string, double> durations;
    if (store_ && store_->is_open()) {
        auto stored = store_->durations();
        if (stored.is_ok()) {
            durations = std::move(stored).value();
        } else {
            log::warn("ignoring stored durations: %s", stored.error().message.c_str());
        }
    }

    auto buckets = partition(tree, table_, std::max<size_t>(options_.workers, 1), durations);

    SessionContext session;
    PlanBuilder planner(table_);
    RunShared shared(planner, session, options_.fail_fast);

    std::vector<WorkerReport> reports(buckets.size());
    if (buckets.size() == 1) {
        Worker worker(shared);
        worker.run_units(buckets[0]);
        reports[0] = worker.take_report();
    } else if (buckets.size() > 1) {
        log::debug("running %zu worker(s)", buckets.size());
        std::vector<std::thread> threads;
        for (size_t i = 0; i < buckets.size(); ++i) {
            threads.emplace_back([&shared, &buckets, &reports, i]() {
                Worker worker(shared);
                worker.run_units(buckets[i]);
                reports[i] = worker.take_report();
            });
        }
        for (auto& t : threads) t.join();
    }

    state_ = RunState::Closing;

    RunSummary summary;
    for (auto& e : registration_errors_) summary.add_error(std::move(e));
    registration_errors_.clear();

    std::vector<std::pair<size_t, Outcome>> outcomes;
    for (auto& report : reports) {
        for (auto& o : report.outcomes) outcomes.push_back(std::move(o));
        for (auto& e : report.errors) summary.add_error(std::move(e));
    }
    std::sort(outcomes.begin(), outcomes.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    for (auto& o : outcomes) summary.record(std::move(o.second));

    for (auto& f : session.close()) {
        summary.add_error(StructuralError{StructuralError::FixtureTeardown,
            f.location, f.line, f.message + " [" + f.key.str() + "]"});
    }

    summary.duration_ms = elapsed_ms(start);
    state_ = RunState::Done;

    if (store_ && store_->is_open()) {
        auto recorded = store_->record_run(summary);
        if (recorded.is_err()) {
            log::warn("could not record run: %s", recorded.error().message.c_str());
        } else {
            auto pruned = store_->prune(std::max<size_t>(options_.keep_runs, 1));
            if (pruned.is_err()) {
                log::warn("could not prune result store: %s", pruned.error().message.c_str());
            }
        }
    }
    if (owned_store_.is_open()) {
        owned_store_.close();
        store_ = nullptr;
    }

    for (const auto& e : summary.errors) {
        log::error("%s", e.format().c_str());
    }
    log::info("%s", summary.format().c_str());
    return Result<RunSummary>::ok(std::move(summary));
}

} // namespace trellis
