#include <trellis/instance.hpp>
#include <trellis/log.hpp>

#include <exception>

namespace trellis {

bool run_guarded(const std::function<void()>& fn, std::string& error_out) {
    error_out.clear();
    try {
        fn();
    } catch (const std::exception& e) {
        error_out = e.what();
        if (error_out.empty()) error_out = "std::exception";
    } catch (...) {
        error_out = "unknown exception";
    }
    return error_out.empty();
}

FixtureInstance::FixtureInstance(const FixtureDefinition& def, ScopeKey key)
    : def_(def), key_(std::move(key)) {}

Status FixtureInstance::setup(const Arguments& args) {
    if (state_ != State::Pending) {
        return TrellisError{TrellisError::Fixture,
            "fixture '" + def_.name + "' was already set up"};
    }
    if (!def_.body) {
        return TrellisError{TrellisError::Fixture,
            "fixture '" + def_.name + "' has no body", "",
            def_.location, def_.line};
    }

    log::trace("setting up fixture %s for %s",
               def_.name.c_str(), key_.str().c_str());

    FixtureYield yielded;
    std::string error;
    if (!run_guarded([&] { yielded = def_.body(args); }, error)) {
        return TrellisError{TrellisError::Fixture,
            "fixture '" + def_.name + "' failed: " + error, "",
            def_.location, def_.line};
    }

    value_ = std::move(yielded.value);
    if (def_.is_generator) {
        teardown_ = std::move(yielded.teardown);
    } else if (yielded.teardown) {
        log::warn("fixture %s returned a teardown but is not a generator; ignored",
                  def_.display().c_str());
    }
    state_ = State::Acquired;
    return ok_status();
}

Status FixtureInstance::teardown() {
    if (state_ != State::Acquired) return ok_status();
    state_ = State::TornDown;

    auto continuation = std::move(teardown_);
    teardown_ = nullptr;
    if (!continuation) return ok_status();

    log::trace("tearing down fixture %s for %s",
               def_.name.c_str(), key_.str().c_str());

    std::string error;
    if (!run_guarded(continuation, error)) {
        return TrellisError{TrellisError::Fixture,
            "teardown of fixture '" + def_.name + "' failed: " + error, "",
            def_.location, def_.line};
    }
    return ok_status();
}

} // namespace trellis
