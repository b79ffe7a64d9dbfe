#include <ftl/bundle.hpp>
#include <ftl/lang/parser.hpp>
#include <ftl/locale.hpp>
#include <ftl/log.hpp>

#include <mutex>

namespace ftl {

Bundle::Bundle(std::string locale, BundleOptions options)
    : locale_(std::move(locale)),
      options_(options),
      functions_(FunctionRegistry::with_builtins()),
      cache_(options.cache_size) {
    auto status = check_locale(locale_);
    if (status.is_err()) {
        log::warn("bundle locale: %s; plural rules default to 'other'",
                  status.error().message.c_str());
    }
}

std::vector<Junk> Bundle::add_resource(std::string_view source) {
    return add_resource(parse(source));
}

std::vector<Junk> Bundle::add_resource(const Resource& resource) {
    std::vector<Junk> junk;
    size_t added_messages = 0;
    size_t added_terms = 0;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : resource.entries) {
            if (const auto* msg = std::get_if<Message>(&entry)) {
                auto [it, inserted] = messages_.insert_or_assign(msg->id, *msg);
                if (inserted) {
                    message_order_.push_back(msg->id);
                } else {
                    log::debug("message '%s' overrides an earlier definition",
                               msg->id.c_str());
                }
                ++added_messages;
            } else if (const auto* term = std::get_if<Term>(&entry)) {
                auto [it, inserted] = terms_.insert_or_assign(term->id, *term);
                if (!inserted) {
                    log::debug("term '-%s' overrides an earlier definition",
                               term->id.c_str());
                }
                ++added_terms;
            } else if (const auto* j = std::get_if<Junk>(&entry)) {
                const char* why = j->annotations.empty()
                    ? "unparseable entry" : j->annotations.front().message.c_str();
                log::warn("skipping junk in %s resource: %s", locale_.c_str(), why);
                junk.push_back(*j);
            }
        }
        cache_.clear();
    }

    log::debug("added %zu messages and %zu terms to bundle '%s'",
               added_messages, added_terms, locale_.c_str());
    return junk;
}

Status Bundle::add_function(const std::string& name, FluentFunction fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    FTL_TRY(functions_.add(name, std::move(fn)));
    cache_.clear();
    log::debug("registered function %s in bundle '%s'", name.c_str(), locale_.c_str());
    return ok_status();
}

bool Bundle::has_message(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return messages_.count(id) > 0;
}

bool Bundle::has_term(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return terms_.count(id) > 0;
}

std::optional<Message> Bundle::get_message(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = messages_.find(id);
    if (it == messages_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Bundle::message_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return message_order_;
}

ResolveResult Bundle::format_pattern(const std::string& id, const FluentArgs& args,
                                     const std::optional<std::string>& attribute) const {
    if (id.empty()) {
        return {"{???}", {diag::message_not_found(id)}};
    }

    // Cache access stays under the shared lock; add_resource clears it
    // under the exclusive one
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::string key = FormatCache::make_key(id, attribute, args);
    if (auto cached = cache_.get(key)) {
        return {std::move(cached->first), std::move(cached->second)};
    }

    ResolveResult result;
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        result = {"{" + id + "}", {diag::message_not_found(id)}};
    } else {
        ResolverOptions opts;
        opts.locale = locale_;
        opts.use_isolating = options_.use_isolating;
        Resolver resolver(messages_, terms_, functions_, std::move(opts));
        result = resolver.resolve(it->second, args, attribute);
    }

    for (const auto& d : result.errors) {
        log::debug("%s: %s", id.c_str(), d.message.c_str());
    }
    cache_.put(key, {result.value, result.errors});
    return result;
}

ResolveResult Bundle::format_value(const std::string& id, const FluentArgs& args) const {
    return format_pattern(id, args);
}

std::set<std::string> Bundle::message_variables(const std::string& id) const {
    auto info = introspect_message(id);
    if (info.is_err()) return {};
    return info.value().variable_names();
}

Result<MessageInfo> Bundle::introspect_message(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return FtlError(FtlError::NotFound, "message '" + id + "' not found in bundle '" +
                        locale_ + "'");
    }
    return Result<MessageInfo>::ok(introspect(it->second));
}

ValidationResult Bundle::validate_resource(std::string_view source) const {
    KnownIds known;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, msg] : messages_) known.messages.insert(id);
        for (const auto& [id, term] : terms_) known.terms.insert(id);
    }
    return validate_source(source, known);
}

} // namespace ftl
