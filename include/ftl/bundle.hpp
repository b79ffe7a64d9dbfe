#pragma once

#include <ftl/cache.hpp>
#include <ftl/config.hpp>
#include <ftl/functions.hpp>
#include <ftl/introspect.hpp>
#include <ftl/resolver.hpp>
#include <ftl/validate.hpp>

#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ftl {

// Messages and terms of one locale plus the functions they may call.
// Safe to share between threads: formatting takes a shared lock, adding
// resources or functions takes an exclusive one.
class Bundle {
public:
    explicit Bundle(std::string locale, BundleOptions options = {});

    Bundle(const Bundle&) = delete;
    Bundle& operator=(const Bundle&) = delete;

    const std::string& locale() const { return locale_; }
    const BundleOptions& options() const { return options_; }

    // Parse and add entries. Later definitions of an id replace earlier
    // ones. Returns the entries that failed to parse.
    std::vector<Junk> add_resource(std::string_view source);
    std::vector<Junk> add_resource(const Resource& resource);

    Status add_function(const std::string& name, FluentFunction fn);

    bool has_message(const std::string& id) const;
    bool has_term(const std::string& id) const;
    std::optional<Message> get_message(const std::string& id) const;

    // Ids in order of first definition
    std::vector<std::string> message_ids() const;

    // Format a message value or one of its attributes. Missing messages
    // produce "{id}" and a MESSAGE_NOT_FOUND diagnostic.
    ResolveResult format_pattern(const std::string& id, const FluentArgs& args = {},
                                 const std::optional<std::string>& attribute = std::nullopt) const;
    ResolveResult format_value(const std::string& id, const FluentArgs& args = {}) const;

    std::set<std::string> message_variables(const std::string& id) const;
    Result<MessageInfo> introspect_message(const std::string& id) const;

    // Validate FTL source against this bundle: references to messages and
    // terms already in the bundle count as defined.
    ValidationResult validate_resource(std::string_view source) const;

    CacheStats cache_stats() const { return cache_.stats(); }
    void clear_cache() { cache_.clear(); }

private:
    std::string locale_;
    BundleOptions options_;

    MessageTable messages_;
    TermTable terms_;
    std::vector<std::string> message_order_;
    FunctionRegistry functions_;

    mutable FormatCache cache_;
    mutable std::shared_mutex mutex_;
};

} // namespace ftl
