#include <ftl/localization.hpp>
#include <ftl/fs.hpp>
#include <ftl/log.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace ftl {

// ---------------------------------------------------------------------------
// PathResourceLoader
// ---------------------------------------------------------------------------

PathResourceLoader::PathResourceLoader(std::string base_path)
    : base_path_(std::move(base_path)) {}

std::string PathResourceLoader::path_for(const std::string& locale,
                                         const std::string& resource_id) const {
    static const std::string kPlaceholder = "{locale}";
    std::string dir = base_path_;
    size_t pos = 0;
    while ((pos = dir.find(kPlaceholder, pos)) != std::string::npos) {
        dir.replace(pos, kPlaceholder.size(), locale);
        pos += locale.size();
    }
    return (fs::path(dir) / resource_id).string();
}

Result<std::string> PathResourceLoader::load(const std::string& locale,
                                             const std::string& resource_id) const {
    return read_text_file(path_for(locale, resource_id), "resource file");
}

// ---------------------------------------------------------------------------
// Localization
// ---------------------------------------------------------------------------

Result<Localization> Localization::create(std::vector<std::string> locales,
                                          std::vector<std::string> resource_ids,
                                          const ResourceLoader* loader,
                                          BundleOptions options) {
    if (locales.empty()) {
        return FtlError{FtlError::InvalidArg, "at least one locale is required"};
    }
    if (!resource_ids.empty() && !loader) {
        return FtlError{FtlError::InvalidArg,
            "a resource loader is required when resource ids are given"};
    }

    Localization l10n;
    for (const auto& locale : locales) {
        if (l10n.bundle(locale)) {
            return FtlError{FtlError::Duplicate,
                "locale '" + locale + "' appears twice in the fallback chain"};
        }
        l10n.locales_.push_back(locale);
        l10n.bundles_.push_back(std::make_unique<Bundle>(locale, options));
    }

    for (size_t i = 0; i < l10n.locales_.size(); ++i) {
        const auto& locale = l10n.locales_[i];
        for (const auto& id : resource_ids) {
            auto source = loader->load(locale, id);
            if (source.is_err()) {
                if (source.error().code != FtlError::NotFound) {
                    return std::move(source).error();
                }
                log::warn("resource '%s' not available for locale '%s'",
                          id.c_str(), locale.c_str());
                continue;
            }
            auto junk = l10n.bundles_[i]->add_resource(source.value());
            if (!junk.empty()) {
                log::warn("%s (%s): %zu entries failed to parse",
                          id.c_str(), locale.c_str(), junk.size());
            }
        }
    }

    return Result<Localization>::ok(std::move(l10n));
}

Result<Localization> Localization::from_config(const Config& config) {
    std::vector<std::string> chain = config.locale_chain();
    if (config.resource_files.empty()) {
        return create(std::move(chain), {}, nullptr, config.bundle_options());
    }
    if (config.resource_path.empty()) {
        return FtlError{FtlError::Config,
            "resources.files is set but resources.path is empty",
            "set resources.path, e.g. \"locales/{locale}\""};
    }
    PathResourceLoader loader(config.resource_path);
    return create(std::move(chain), config.resource_files, &loader, config.bundle_options());
}

Result<std::vector<Junk>> Localization::add_resource(const std::string& locale,
                                                     std::string_view source) {
    for (size_t i = 0; i < locales_.size(); ++i) {
        if (locales_[i] == locale) {
            return Result<std::vector<Junk>>::ok(bundles_[i]->add_resource(source));
        }
    }
    return FtlError{FtlError::InvalidArg,
        "locale '" + locale + "' is not in the fallback chain"};
}

Status Localization::add_function(const std::string& name, const FluentFunction& fn) {
    for (auto& bundle : bundles_) {
        FTL_TRY(bundle->add_function(name, fn));
    }
    return ok_status();
}

ResolveResult Localization::format_value(const std::string& id, const FluentArgs& args) const {
    return format_pattern(id, args);
}

ResolveResult Localization::format_pattern(const std::string& id, const FluentArgs& args,
                                           const std::optional<std::string>& attribute) const {
    if (id.empty()) {
        return {"{???}", {diag::message_not_found(id)}};
    }

    for (size_t i = 0; i < bundles_.size(); ++i) {
        if (bundles_[i]->has_message(id)) {
            if (i > 0) {
                log::debug("message '%s' falls back to locale '%s'",
                           id.c_str(), locales_[i].c_str());
            }
            return bundles_[i]->format_pattern(id, args, attribute);
        }
    }

    Diagnostic d = diag::message_not_found(id);
    d.message = "Message '" + id + "' not found in any locale";
    return {"{" + id + "}", {std::move(d)}};
}

bool Localization::has_message(const std::string& id) const {
    for (const auto& bundle : bundles_) {
        if (bundle->has_message(id)) return true;
    }
    return false;
}

const Bundle* Localization::bundle(const std::string& locale) const {
    for (size_t i = 0; i < locales_.size(); ++i) {
        if (locales_[i] == locale) return bundles_[i].get();
    }
    return nullptr;
}

} // namespace ftl
