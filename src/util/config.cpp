#include <ftl/config.hpp>
#include <ftl/fs.hpp>
#include <ftl/locale.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cstdlib>

namespace ftl {

namespace {

FtlError type_error(const std::string& key, const char* expected) {
    return FtlError{FtlError::Config,
        "config key '" + key + "' must be " + expected};
}

Result<std::vector<std::string>> string_array(const toml::node& node, const std::string& key) {
    const auto* arr = node.as_array();
    if (!arr) return type_error(key, "an array of strings");
    std::vector<std::string> out;
    for (const auto& item : *arr) {
        auto s = item.value<std::string>();
        if (!s) return type_error(key, "an array of strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        FtlError err{FtlError::Parse,
            "config TOML parse error: " + std::string(e.description())};
        err.line = static_cast<int>(begin.line);
        err.column = static_cast<int>(begin.column);
        return err;
    }

    Config cfg;

    // [bundle] section
    if (auto bundle = doc["bundle"].as_table()) {
        if (auto node = bundle->get("locale")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("bundle.locale", "a string");
            FTL_TRY(check_locale(*v));
            cfg.locale = *v;
            cfg.locale_set = true;
        }
        if (auto node = bundle->get("fallback-locales")) {
            auto v = string_array(*node, "bundle.fallback-locales");
            if (v.is_err()) return std::move(v).error();
            for (const auto& code : v.value()) FTL_TRY(check_locale(code));
            cfg.fallback_locales = std::move(v).value();
            cfg.fallback_locales_set = true;
        }
        if (auto node = bundle->get("use-isolating")) {
            auto v = node->value<bool>();
            if (!v) return type_error("bundle.use-isolating", "a boolean");
            cfg.bundle.use_isolating = *v;
            cfg.use_isolating_set = true;
        }
        if (auto node = bundle->get("cache-size")) {
            auto v = node->value<int64_t>();
            if (!v) return type_error("bundle.cache-size", "an integer");
            if (*v < 0) {
                return FtlError{FtlError::Config,
                    "config key 'bundle.cache-size' cannot be negative",
                    "use 0 to disable the format cache"};
            }
            cfg.bundle.cache_size = static_cast<size_t>(*v);
            cfg.cache_size_set = true;
        }
    }

    // [resources] section
    if (auto res = doc["resources"].as_table()) {
        if (auto node = res->get("path")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("resources.path", "a string");
            cfg.resource_path = *v;
            cfg.resource_path_set = true;
        }
        if (auto node = res->get("files")) {
            auto v = string_array(*node, "resources.files");
            if (v.is_err()) return std::move(v).error();
            cfg.resource_files = std::move(v).value();
            cfg.resource_files_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("log.level", "a string");
            auto level = log::parse_level(*v);
            if (level.is_err()) return std::move(level).error();
            cfg.log_level = level.value();
            cfg.log_level_set = true;
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) return type_error("log.color", "a boolean");
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    auto text = read_text_file(path, "config file");
    FTL_TRY(text);
    auto cfg = Config::parse(text.value());
    if (cfg.is_err()) {
        FtlError& err = cfg.error();
        return std::move(err).at(path, err.line, err.column);
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.locale_set) {
        locale = other.locale;
        locale_set = true;
    }
    if (other.fallback_locales_set) {
        fallback_locales = other.fallback_locales;
        fallback_locales_set = true;
    }
    if (other.use_isolating_set) {
        bundle.use_isolating = other.bundle.use_isolating;
        use_isolating_set = true;
    }
    if (other.cache_size_set) {
        bundle.cache_size = other.bundle.cache_size;
        cache_size_set = true;
    }
    if (other.resource_path_set) {
        resource_path = other.resource_path;
        resource_path_set = true;
    }
    if (other.resource_files_set) {
        resource_files = other.resource_files;
        resource_files_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::vector<std::string> Config::locale_chain() const {
    std::vector<std::string> chain;
    auto push = [&chain](const std::string& code) {
        std::string norm = normalize_locale(code);
        bool seen = std::any_of(chain.begin(), chain.end(),
            [&norm](const std::string& c) { return normalize_locale(c) == norm; });
        if (!seen) chain.push_back(code);
    };
    push(locale);
    for (const auto& code : fallback_locales) push(code);
    return chain;
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ftl/config.toml";
}

} // namespace ftl
