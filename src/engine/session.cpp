#include <trellis/session.hpp>
#include <trellis/log.hpp>

namespace trellis {

Result<Value> SessionContext::acquire(const FixtureDefinition& def,
                                      const Arguments& args) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (closed_) {
        return TrellisError{TrellisError::Fixture,
            "session scope is closed; cannot acquire '" + def.name + "'"};
    }

    auto it = entries_.find(def.id);
    if (it != entries_.end()) {
        std::shared_ptr<Attempt> attempt = it->second.attempt;
        published_.wait(lk, [&] { return attempt->done; });
        if (attempt->failed) return attempt->error;
        return Result<Value>::ok(entries_.at(def.id).instance->value());
    }

    Entry& slot = entries_[def.id];
    slot.instance = std::make_unique<FixtureInstance>(def, ScopeKey::session());
    slot.attempt = std::make_shared<Attempt>();
    FixtureInstance* instance = slot.instance.get();
    std::shared_ptr<Attempt> attempt = slot.attempt;
    lk.unlock();

    // Setup runs unlocked: other definitions may initialize concurrently
    auto status = instance->setup(args);

    lk.lock();
    attempt->done = true;
    if (status.is_err()) {
        attempt->failed = true;
        attempt->error = status.error();
        entries_.erase(def.id);
        lk.unlock();
        published_.notify_all();
        return std::move(status).error();
    }
    order_.push_back(def.id);
    Value value = instance->value();
    lk.unlock();
    published_.notify_all();
    return Result<Value>::ok(std::move(value));
}

std::vector<TeardownFailure> SessionContext::close() {
    std::vector<size_t> order;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) return {};
        closed_ = true;
        order.swap(order_);
    }

    log::debug("closing session scope (%zu instance(s))", order.size());

    std::vector<TeardownFailure> failures;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        FixtureInstance& instance = *entries_.at(*it).instance;
        auto status = instance.teardown();
        if (status.is_err()) {
            const FixtureDefinition& def = instance.definition();
            failures.push_back(TeardownFailure{def.name, def.location, def.line,
                                               instance.key(), status.error().message});
        }
    }
    return failures;
}

size_t SessionContext::live_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t n = 0;
    for (auto id : order_) {
        if (entries_.at(id).instance->state() == FixtureInstance::State::Acquired) ++n;
    }
    return n;
}

bool SessionContext::is_closed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

} // namespace trellis
