#include <trellis/scope_cache.hpp>
#include <trellis/log.hpp>

#include <unordered_map>

namespace trellis {

ScopeKey scope_key_for(const FixtureDefinition& def, const InvocationScope& where) {
    switch (def.scope) {
        case FixtureScope::Function: return ScopeKey{FixtureScope::Function, where.invocation_id};
        case FixtureScope::Module:   return ScopeKey{FixtureScope::Module, where.module};
        case FixtureScope::Package:  return ScopeKey{FixtureScope::Package, def.directory()};
        case FixtureScope::Session:  return ScopeKey::session();
    }
    return ScopeKey::session();
}

ScopeCache::ScopeCache(SessionContext& session)
    : session_(session) {}

Result<Value> ScopeCache::acquire(const FixtureDefinition& def,
                                  const Arguments& args,
                                  const InvocationScope& where) {
    if (def.scope == FixtureScope::Session) {
        return session_.acquire(def, args);
    }

    ScopeKey key = scope_key_for(def, where);
    Frame& frame = frames_[key];

    auto cached = frame.by_def.find(def.id);
    if (cached != frame.by_def.end()) {
        return Result<Value>::ok(cached->second->value());
    }

    // Only successful setups are cached; the next consumer retries a failure
    auto instance = std::make_unique<FixtureInstance>(def, key);
    auto status = instance->setup(args);
    if (status.is_err()) return std::move(status).error();

    FixtureInstance* raw = instance.get();
    frame.order.push_back(std::move(instance));
    frame.by_def[def.id] = raw;
    return Result<Value>::ok(raw->value());
}

Result<Arguments> ScopeCache::acquire_plan(const ResolutionPlan& plan,
                                           const InvocationScope& where,
                                           const RequestInfo* request) {
    std::unordered_map<size_t, Value> values;

    for (const auto& step : plan.steps) {
        Arguments args;
        args.set_request(request);
        for (const auto& [name, dep] : step.arguments) {
            args.set(name, values.at(dep->id));
        }

        auto value = acquire(*step.definition, args, where);
        if (value.is_err()) return std::move(value).error();
        values[step.definition->id] = std::move(value).value();
    }

    Arguments out;
    out.set_request(request);
    for (const auto& [name, def] : plan.test_arguments) {
        out.set(name, values.at(def->id));
    }
    return Result<Arguments>::ok(std::move(out));
}

std::vector<TeardownFailure> ScopeCache::close_scope(FixtureScope level,
                                                     const std::string& id) {
    if (level == FixtureScope::Session) {
        return session_.close();
    }

    std::vector<TeardownFailure> failures;
    auto it = frames_.find(ScopeKey{level, id});
    if (it == frames_.end()) return failures;

    Frame frame = std::move(it->second);
    frames_.erase(it);

    if (!frame.order.empty()) {
        log::debug("closing %s (%zu instance(s))",
                   ScopeKey{level, id}.str().c_str(), frame.order.size());
    }

    for (auto inst = frame.order.rbegin(); inst != frame.order.rend(); ++inst) {
        auto status = (*inst)->teardown();
        if (status.is_err()) {
            const FixtureDefinition& def = (*inst)->definition();
            failures.push_back(TeardownFailure{def.name, def.location, def.line,
                                               (*inst)->key(), status.error().message});
        }
    }
    return failures;
}

size_t ScopeCache::live_count(const ScopeKey& key) const {
    if (key.level == FixtureScope::Session) return session_.live_count();
    auto it = frames_.find(key);
    if (it == frames_.end()) return 0;
    return it->second.order.size();
}

std::vector<ScopeKey> ScopeCache::open_keys() const {
    std::vector<ScopeKey> keys;
    for (const auto& [key, frame] : frames_) {
        if (!frame.order.empty()) keys.push_back(key);
    }
    return keys;
}

} // namespace trellis
