#pragma once

#include <trellis/fixture_table.hpp>
#include <trellis/log.hpp>
#include <trellis/result.hpp>
#include <optional>
#include <string>

namespace trellis {

// Layered run configuration: global > project > local.
// Lower layers override higher layers, but only for fields they set.
struct RunConfig {
    // [run]
    size_t workers = 1;
    bool fail_fast = false;
    std::string definition_file = "conftest";
    DuplicatePolicy duplicates = DuplicatePolicy::FirstWins;

    // [log]
    log::Level log_level = log::Info;
    bool log_color = false;

    // [cache]
    bool cache_enabled = false;
    std::string cache_path = ".trellis/results.db";
    size_t cache_keep_runs = 20;

    // Track which fields were explicitly set (for merge)
    bool workers_set = false;
    bool fail_fast_set = false;
    bool definition_file_set = false;
    bool duplicates_set = false;
    bool log_level_set = false;
    bool log_color_set = false;
    bool cache_enabled_set = false;
    bool cache_path_set = false;
    bool cache_keep_runs_set = false;

    // Load from a TOML config file
    static Result<RunConfig> load(const std::string& path);

    // Parse from TOML string
    static Result<RunConfig> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const RunConfig& other);

    static RunConfig effective(const std::optional<RunConfig>& global,
                               const std::optional<RunConfig>& project,
                               const std::optional<RunConfig>& local);

    TableOptions table_options() const;

    // Applies the [log] section to the process-wide logger.
    void apply_logging() const;
};

// Discover the global config file path: ~/.trellis/config.toml
std::string global_config_path();

} // namespace trellis
