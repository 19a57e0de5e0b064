#include <trellis/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace trellis {

static TrellisError config_error(const std::string& key, const std::string& msg,
                                 const std::string& hint = "") {
    return TrellisError{TrellisError::Config, "invalid '" + key + "': " + msg, hint};
}

Result<RunConfig> RunConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TrellisError{TrellisError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    RunConfig cfg;

    // [run] section
    if (auto run = doc["run"].as_table()) {
        if (auto node = run->get("workers")) {
            auto v = node->value<int64_t>();
            if (!v || *v < 1) {
                return config_error("run.workers", "expected an integer >= 1");
            }
            cfg.workers = static_cast<size_t>(*v);
            cfg.workers_set = true;
        }
        if (auto node = run->get("fail-fast")) {
            auto v = node->value<bool>();
            if (!v) return config_error("run.fail-fast", "expected a boolean");
            cfg.fail_fast = *v;
            cfg.fail_fast_set = true;
        }
        if (auto node = run->get("definition-file")) {
            auto v = node->value<std::string>();
            if (!v || v->empty()) {
                return config_error("run.definition-file", "expected a non-empty string");
            }
            cfg.definition_file = *v;
            cfg.definition_file_set = true;
        }
        if (auto node = run->get("duplicate-policy")) {
            auto v = node->value<std::string>();
            if (!v) return config_error("run.duplicate-policy", "expected a string");
            auto policy = parse_duplicate_policy(*v);
            if (policy.is_err()) return std::move(policy).error();
            cfg.duplicates = policy.value();
            cfg.duplicates_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            if (!v || !log::parse_level(*v, cfg.log_level)) {
                return config_error("log.level", "unknown level",
                                    "expected trace, debug, info, warn or error");
            }
            cfg.log_level_set = true;
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) return config_error("log.color", "expected a boolean");
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto node = cache->get("enabled")) {
            auto v = node->value<bool>();
            if (!v) return config_error("cache.enabled", "expected a boolean");
            cfg.cache_enabled = *v;
            cfg.cache_enabled_set = true;
        }
        if (auto node = cache->get("path")) {
            auto v = node->value<std::string>();
            if (!v || v->empty()) {
                return config_error("cache.path", "expected a non-empty string");
            }
            cfg.cache_path = *v;
            cfg.cache_path_set = true;
        }
        if (auto node = cache->get("keep-runs")) {
            auto v = node->value<int64_t>();
            if (!v || *v < 1) {
                return config_error("cache.keep-runs", "expected an integer >= 1");
            }
            cfg.cache_keep_runs = static_cast<size_t>(*v);
            cfg.cache_keep_runs_set = true;
        }
    }

    return Result<RunConfig>::ok(std::move(cfg));
}

Result<RunConfig> RunConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TrellisError{TrellisError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = RunConfig::parse(ss.str());
    if (cfg.is_err()) {
        TrellisError err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void RunConfig::merge(const RunConfig& other) {
    if (other.workers_set) { workers = other.workers; workers_set = true; }
    if (other.fail_fast_set) { fail_fast = other.fail_fast; fail_fast_set = true; }
    if (other.definition_file_set) {
        definition_file = other.definition_file;
        definition_file_set = true;
    }
    if (other.duplicates_set) { duplicates = other.duplicates; duplicates_set = true; }
    if (other.log_level_set) { log_level = other.log_level; log_level_set = true; }
    if (other.log_color_set) { log_color = other.log_color; log_color_set = true; }
    if (other.cache_enabled_set) {
        cache_enabled = other.cache_enabled;
        cache_enabled_set = true;
    }
    if (other.cache_path_set) { cache_path = other.cache_path; cache_path_set = true; }
    if (other.cache_keep_runs_set) {
        cache_keep_runs = other.cache_keep_runs;
        cache_keep_runs_set = true;
    }
}

RunConfig RunConfig::effective(const std::optional<RunConfig>& global,
                               const std::optional<RunConfig>& project,
                               const std::optional<RunConfig>& local) {
    RunConfig result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

TableOptions RunConfig::table_options() const {
    TableOptions opts;
    opts.definition_stem = definition_file;
    opts.duplicates = duplicates;
    return opts;
}

void RunConfig::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.trellis/config.toml";
}

} // namespace trellis
