#include <ftl/functions.hpp>
#include <ftl/locale.hpp>
#include <ftl/log.hpp>

#include <unicode/currunit.h>
#include <unicode/datefmt.h>
#include <unicode/numberformatter.h>
#include <unicode/timezone.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <exception>
#include <memory>

namespace ftl {

namespace {

bool is_function_name(const std::string& name) {
    if (name.empty() || name[0] < 'A' || name[0] > 'Z') return false;
    for (char c : name) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

FtlError arg_error(const char* fn, std::string msg) {
    return FtlError(FtlError::InvalidArg, std::string(fn) + "(): " + msg);
}

// Splits [value, ..., locale] into the value and the locale code
Result<std::pair<FluentValue, std::string>> value_and_locale(
        const char* fn, const std::vector<FluentValue>& positional) {
    if (positional.size() < 2) {
        return arg_error(fn, "expected a value and a locale");
    }
    const auto* locale = positional.back().get_if<std::string>();
    if (!locale) {
        return arg_error(fn, "last argument must be the locale code");
    }
    return Result<std::pair<FluentValue, std::string>>::ok({positional.front(), *locale});
}

Result<double> to_number(const char* fn, const FluentValue& value) {
    if (auto n = value.as_number()) return Result<double>::ok(*n);
    if (const auto* s = value.get_if<std::string>()) {
        double out = 0.0;
        auto res = std::from_chars(s->data(), s->data() + s->size(), out);
        if (res.ec == std::errc() && res.ptr == s->data() + s->size()) {
            return Result<double>::ok(out);
        }
    }
    return arg_error(fn, "expected a number, got '" + value.to_string() + "'");
}

// An integer option within [lo, hi]
Result<int> int_option(const char* fn, const NamedArgs& named,
                       const std::string& key, int fallback, int lo, int hi) {
    auto it = named.find(key);
    if (it == named.end()) return Result<int>::ok(fallback);
    auto num = to_number(fn, it->second);
    if (num.is_err() || std::floor(num.value()) != num.value()) {
        return arg_error(fn, key + " must be an integer");
    }
    double v = num.value();
    if (v < lo || v > hi) {
        return arg_error(fn, key + " must be between " + std::to_string(lo) +
                             " and " + std::to_string(hi));
    }
    return Result<int>::ok(static_cast<int>(v));
}

Result<bool> bool_option(const char* fn, const NamedArgs& named,
                         const std::string& key, bool fallback) {
    auto it = named.find(key);
    if (it == named.end()) return Result<bool>::ok(fallback);
    const FluentValue& v = it->second;
    if (const auto* b = v.get_if<bool>()) return Result<bool>::ok(*b);
    if (auto n = v.as_number()) return Result<bool>::ok(*n != 0.0);
    std::string s = v.to_string();
    if (s == "true") return Result<bool>::ok(true);
    if (s == "false") return Result<bool>::ok(false);
    return arg_error(fn, key + " must be \"true\" or \"false\"");
}

std::string string_option(const NamedArgs& named, const std::string& key,
                          const std::string& fallback) {
    auto it = named.find(key);
    return it == named.end() ? fallback : it->second.to_string();
}

std::string to_utf8(const icu::UnicodeString& us) {
    std::string out;
    us.toUTF8String(out);
    return out;
}

FtlError icu_error(const char* fn, UErrorCode status) {
    return FtlError(FtlError::Locale,
                    std::string(fn) + "(): ICU error " + u_errorName(status));
}

Result<icu::DateFormat::EStyle> date_style(const char* fn, const std::string& key,
                                           const std::string& name) {
    using DF = icu::DateFormat;
    if (name == "full") return Result<DF::EStyle>::ok(DF::kFull);
    if (name == "long") return Result<DF::EStyle>::ok(DF::kLong);
    if (name == "medium") return Result<DF::EStyle>::ok(DF::kMedium);
    if (name == "short") return Result<DF::EStyle>::ok(DF::kShort);
    if (name == "none") return Result<DF::EStyle>::ok(DF::kNone);
    return arg_error(fn, key + " must be one of full, long, medium, short, none");
}

} // namespace

// ---------------------------------------------------------------------------
// Built-ins
// ---------------------------------------------------------------------------

namespace builtins {

Result<FluentValue> number(const std::vector<FluentValue>& positional, const NamedArgs& named) {
    static const char* kName = "NUMBER";
    auto args = value_and_locale(kName, positional);
    if (args.is_err()) return args.error();
    const auto& [value, locale] = args.value();

    auto num = to_number(kName, value);
    if (num.is_err()) return num.error();

    auto min_frac = int_option(kName, named, "minimumFractionDigits", 0, 0, 20);
    if (min_frac.is_err()) return min_frac.error();
    bool has_max = named.count("maximumFractionDigits") > 0;
    auto max_frac = int_option(kName, named, "maximumFractionDigits",
                               std::max(min_frac.value(), 3), 0, 20);
    if (max_frac.is_err()) return max_frac.error();
    auto grouping = bool_option(kName, named, "useGrouping", true);
    if (grouping.is_err()) return grouping.error();

    int lo = min_frac.value();
    int hi = max_frac.value();
    if (has_max && hi < lo) {
        return arg_error(kName, "maximumFractionDigits is less than minimumFractionDigits");
    }

    using namespace icu::number;
    auto formatter = NumberFormatter::withLocale(to_icu_locale(locale))
        .precision(Precision::minMaxFraction(lo, hi))
        .grouping(grouping.value() ? UNUM_GROUPING_AUTO : UNUM_GROUPING_OFF);

    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString text;
    if (const auto* i = value.get_if<int64_t>()) {
        text = formatter.formatInt(*i, status).toString(status);
    } else {
        text = formatter.formatDouble(num.value(), status).toString(status);
    }
    if (U_FAILURE(status)) return icu_error(kName, status);

    return Result<FluentValue>::ok(FluentNumber{num.value(), to_utf8(text)});
}

Result<FluentValue> datetime(const std::vector<FluentValue>& positional, const NamedArgs& named) {
    static const char* kName = "DATETIME";
    auto args = value_and_locale(kName, positional);
    if (args.is_err()) return args.error();
    const auto& [value, locale] = args.value();

    const auto* date = value.get_if<FluentDate>();
    if (!date) {
        return arg_error(kName, "expected a date, got '" + value.to_string() + "'");
    }

    auto dstyle = date_style(kName, "dateStyle", string_option(named, "dateStyle", "medium"));
    if (dstyle.is_err()) return dstyle.error();
    auto tstyle = date_style(kName, "timeStyle", string_option(named, "timeStyle", "none"));
    if (tstyle.is_err()) return tstyle.error();
    if (dstyle.value() == icu::DateFormat::kNone && tstyle.value() == icu::DateFormat::kNone) {
        return arg_error(kName, "dateStyle and timeStyle cannot both be none");
    }

    std::unique_ptr<icu::DateFormat> fmt(icu::DateFormat::createDateTimeInstance(
        dstyle.value(), tstyle.value(), to_icu_locale(locale)));
    if (!fmt) {
        return FtlError(FtlError::Locale,
                        "DATETIME(): no date format for locale '" + locale + "'");
    }
    fmt->setTimeZone(*icu::TimeZone::getGMT());

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        date->time_since_epoch()).count();
    icu::UnicodeString text;
    fmt->format(static_cast<UDate>(millis), text);
    return Result<FluentValue>::ok(to_utf8(text));
}

Result<FluentValue> currency(const std::vector<FluentValue>& positional, const NamedArgs& named) {
    static const char* kName = "CURRENCY";
    auto args = value_and_locale(kName, positional);
    if (args.is_err()) return args.error();
    const auto& [value, locale] = args.value();

    auto num = to_number(kName, value);
    if (num.is_err()) return num.error();

    std::string code = string_option(named, "currency", "");
    if (code.size() != 3) {
        return arg_error(kName, "currency must be a three-letter ISO 4217 code");
    }

    std::string display = string_option(named, "currencyDisplay", "symbol");
    UNumberUnitWidth width;
    if (display == "symbol") {
        width = UNUM_UNIT_WIDTH_SHORT;
    } else if (display == "code") {
        width = UNUM_UNIT_WIDTH_ISO_CODE;
    } else if (display == "name") {
        width = UNUM_UNIT_WIDTH_FULL_NAME;
    } else {
        return arg_error(kName, "currencyDisplay must be one of symbol, code, name");
    }

    UErrorCode status = U_ZERO_ERROR;
    icu::CurrencyUnit unit(icu::StringPiece(code.c_str()), status);
    if (U_FAILURE(status)) {
        return arg_error(kName, "unknown currency '" + code + "'");
    }

    using namespace icu::number;
    icu::UnicodeString text = NumberFormatter::withLocale(to_icu_locale(locale))
        .unit(unit)
        .unitWidth(width)
        .formatDouble(num.value(), status)
        .toString(status);
    if (U_FAILURE(status)) return icu_error(kName, status);

    return Result<FluentValue>::ok(to_utf8(text));
}

} // namespace builtins

// ---------------------------------------------------------------------------
// FunctionRegistry
// ---------------------------------------------------------------------------

FunctionRegistry FunctionRegistry::with_builtins() {
    FunctionRegistry reg;
    auto install = [&reg](const std::string& name, FluentFunction fn) {
        auto entry = std::make_shared<const FluentFunction>(std::move(fn));
        reg.functions_[name] = entry;
        reg.builtins_[name] = entry;
    };
    install("NUMBER", builtins::number);
    install("DATETIME", builtins::datetime);
    install("CURRENCY", builtins::currency);
    return reg;
}

Status FunctionRegistry::add(const std::string& name, FluentFunction fn) {
    if (!is_function_name(name)) {
        return FtlError(FtlError::InvalidArg,
                        "invalid function name '" + name + "'",
                        "function names are upper-case, e.g. SHOUT or TO_UPPER");
    }
    if (!fn) {
        return FtlError(FtlError::InvalidArg, "function '" + name + "' is empty");
    }
    if (is_builtin(name)) {
        log::debug("function %s replaces the built-in", name.c_str());
    }
    functions_[name] = std::make_shared<const FluentFunction>(std::move(fn));
    return ok_status();
}

bool FunctionRegistry::has_function(const std::string& name) const {
    return functions_.count(name) > 0;
}

bool FunctionRegistry::is_builtin(const std::string& name) const {
    auto it = functions_.find(name);
    auto bi = builtins_.find(name);
    return it != functions_.end() && bi != builtins_.end() && it->second == bi->second;
}

Result<FluentValue, Diagnostic> FunctionRegistry::call(
        const std::string& name,
        const std::vector<FluentValue>& positional,
        const NamedArgs& named) const {
    using R = Result<FluentValue, Diagnostic>;

    auto it = functions_.find(name);
    if (it == functions_.end()) {
        return R::err(diag::function_not_found(name));
    }

    try {
        auto result = (*it->second)(positional, named);
        if (result.is_err()) {
            return R::err(diag::function_failed(name, result.error().message));
        }
        return R::ok(std::move(result).value());
    } catch (const std::exception& e) {
        return R::err(diag::function_failed(name, e.what()));
    }
}

std::vector<std::string> FunctionRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& [name, fn] : functions_) out.push_back(name);
    return out;
}

} // namespace ftl
