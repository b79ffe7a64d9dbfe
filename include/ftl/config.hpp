#pragma once

#include <ftl/log.hpp>
#include <ftl/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ftl {

struct BundleOptions {
    bool use_isolating = true;
    size_t cache_size = 0;          // 0 disables the format cache
};

// Layered configuration: global > project > local
// Lower layers override higher layers (local wins over project wins over global)
struct Config {
    // [bundle]
    std::string locale = "en-US";
    std::vector<std::string> fallback_locales;
    BundleOptions bundle;

    // [resources]
    std::string resource_path;      // may contain "{locale}"
    std::vector<std::string> resource_files;

    // [log]
    log::Level log_level = log::Info;
    bool log_color = true;

    // Track which fields were explicitly set (for merge)
    bool locale_set = false;
    bool fallback_locales_set = false;
    bool use_isolating_set = false;
    bool cache_size_set = false;
    bool resource_path_set = false;
    bool resource_files_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& local);

    // Primary locale followed by the fallbacks, without repeats
    std::vector<std::string> locale_chain() const;

    BundleOptions bundle_options() const { return bundle; }

    // Push [log] settings into the global logger
    void apply_logging() const;
};

// Discover the global config file path: ~/.ftl/config.toml
std::string global_config_path();

} // namespace ftl
