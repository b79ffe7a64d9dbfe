#include <ftl/plural.hpp>
#include <ftl/locale.hpp>
#include <ftl/log.hpp>

#include <unicode/plurrule.h>
#include <unicode/unistr.h>

#include <map>
#include <memory>
#include <mutex>

namespace ftl {

namespace {

std::mutex g_rules_mutex;
std::map<std::string, std::shared_ptr<const icu::PluralRules>> g_rules;

std::shared_ptr<const icu::PluralRules> rules_for(const std::string& locale) {
    std::lock_guard<std::mutex> lock(g_rules_mutex);
    auto it = g_rules.find(locale);
    if (it != g_rules.end()) return it->second;

    UErrorCode status = U_ZERO_ERROR;
    std::shared_ptr<const icu::PluralRules> rules(
        icu::PluralRules::forLocale(to_icu_locale(locale), status));
    if (U_FAILURE(status)) {
        log::debug("no plural rules for locale '%s': %s",
                   locale.c_str(), u_errorName(status));
        rules.reset();
    }
    // Failures are cached too so a bad locale is only reported once
    g_rules.emplace(locale, rules);
    return rules;
}

} // namespace

std::string plural_category(double number, const std::string& locale) {
    auto rules = rules_for(locale);
    if (!rules) return "other";

    std::string out;
    rules->select(number).toUTF8String(out);
    return out.empty() ? "other" : out;
}

} // namespace ftl
