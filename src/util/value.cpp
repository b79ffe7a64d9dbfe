#include <ftl/value.hpp>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace ftl {

static std::string format_double(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0 ? "-Infinity" : "Infinity";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

// Days since 1970-01-01 for a proleptic Gregorian date
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

static std::string format_date(FluentDate t) {
    using namespace std::chrono;
    int64_t secs = duration_cast<seconds>(t.time_since_epoch()).count();
    int64_t days = secs >= 0 ? secs / 86400 : (secs - 86399) / 86400;
    int64_t rem = secs - days * 86400;

    int64_t y;
    unsigned m, d;
    civil_from_days(days, y, m, d);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                  static_cast<long long>(y), m, d,
                  static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60),
                  static_cast<long long>(rem % 60));
    return buf;
}

FluentDate make_date(int year, unsigned month, unsigned day,
                     unsigned hour, unsigned minute, unsigned second) {
    int64_t days = days_from_civil(year, month, day);
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
    return FluentDate(std::chrono::duration_cast<FluentDate::duration>(
        std::chrono::seconds(secs)));
}

bool FluentValue::is_number() const {
    return std::holds_alternative<int64_t>(data_) ||
           std::holds_alternative<double>(data_) ||
           std::holds_alternative<FluentNumber>(data_);
}

std::optional<double> FluentValue::as_number() const {
    if (const auto* i = std::get_if<int64_t>(&data_)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&data_)) return *d;
    if (const auto* n = std::get_if<FluentNumber>(&data_)) return n->value;
    return std::nullopt;
}

std::string FluentValue::to_string() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, FluentNumber>) {
            return v.formatted;
        } else {
            return format_date(v);
        }
    }, data_);
}

std::string FluentValue::cache_key() const {
    return std::visit([this](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "n:";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "b:1" : "b:0";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "i:" + std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return "d:" + format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "s:" + std::to_string(v.size()) + ":" + v;
        } else if constexpr (std::is_same_v<T, FluentNumber>) {
            return "f:" + format_double(v.value) + ":" + v.formatted;
        } else {
            return "t:" + std::to_string(v.time_since_epoch().count()) + ":" + to_string();
        }
    }, data_);
}

} // namespace ftl
