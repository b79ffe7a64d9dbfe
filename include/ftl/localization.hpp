#pragma once

#include <ftl/bundle.hpp>
#include <ftl/config.hpp>
#include <ftl/result.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ftl {

// Source of FTL text for a (locale, resource id) pair. A resource that
// does not exist for a locale is reported as FtlError::NotFound.
class ResourceLoader {
public:
    virtual ~ResourceLoader() = default;
    virtual Result<std::string> load(const std::string& locale,
                                     const std::string& resource_id) const = 0;
};

// Reads <base_path>/<resource_id> from disk, with every "{locale}" in
// base_path replaced by the locale code, e.g. "locales/{locale}".
class PathResourceLoader : public ResourceLoader {
public:
    explicit PathResourceLoader(std::string base_path);

    Result<std::string> load(const std::string& locale,
                             const std::string& resource_id) const override;

    std::string path_for(const std::string& locale, const std::string& resource_id) const;

private:
    std::string base_path_;
};

// ---------------------------------------------------------------------------
// Localization: bundles for a chain of locales, tried in order
// ---------------------------------------------------------------------------

class Localization {
public:
    // One bundle per locale, in priority order. When a loader is given,
    // every resource id is loaded into every bundle; resources missing for
    // a locale are skipped.
    static Result<Localization> create(std::vector<std::string> locales,
                                       std::vector<std::string> resource_ids = {},
                                       const ResourceLoader* loader = nullptr,
                                       BundleOptions options = {});

    // Locale chain, resource path and files from a Config
    static Result<Localization> from_config(const Config& config);

    const std::vector<std::string>& locales() const { return locales_; }

    Result<std::vector<Junk>> add_resource(const std::string& locale, std::string_view source);
    Status add_function(const std::string& name, const FluentFunction& fn);

    // Formats with the first bundle in the chain that has the message
    ResolveResult format_value(const std::string& id, const FluentArgs& args = {}) const;
    ResolveResult format_pattern(const std::string& id, const FluentArgs& args = {},
                                 const std::optional<std::string>& attribute = std::nullopt) const;

    bool has_message(const std::string& id) const;

    // nullptr for a locale outside the chain
    const Bundle* bundle(const std::string& locale) const;

private:
    Localization() = default;

    std::vector<std::string> locales_;
    std::vector<std::unique_ptr<Bundle>> bundles_;     // parallel to locales_
};

} // namespace ftl
