#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace ftl {

// A number that has already been formatted for display but still selects
// plural variants by its numeric value.
struct FluentNumber {
    double value = 0.0;
    std::string formatted;

    bool operator==(const FluentNumber& o) const {
        return value == o.value && formatted == o.formatted;
    }
};

using FluentDate = std::chrono::system_clock::time_point;

// ---------------------------------------------------------------------------
// FluentValue: runtime argument and function result
// ---------------------------------------------------------------------------

class FluentValue {
public:
    using Data = std::variant<std::monostate, bool, int64_t, double,
                              std::string, FluentNumber, FluentDate>;

    FluentValue() = default;
    FluentValue(bool v) : data_(v) {}
    FluentValue(int v) : data_(static_cast<int64_t>(v)) {}
    FluentValue(long v) : data_(static_cast<int64_t>(v)) {}
    FluentValue(long long v) : data_(static_cast<int64_t>(v)) {}
    FluentValue(unsigned v) : data_(static_cast<int64_t>(v)) {}
    FluentValue(unsigned long v) : data_(static_cast<int64_t>(v)) {}
    FluentValue(unsigned long long v) : data_(static_cast<int64_t>(v)) {}
    FluentValue(double v) : data_(v) {}
    FluentValue(const char* v) : data_(std::string(v)) {}
    FluentValue(std::string v) : data_(std::move(v)) {}
    FluentValue(FluentNumber v) : data_(std::move(v)) {}
    FluentValue(FluentDate v) : data_(v) {}

    const Data& data() const { return data_; }

    bool is_none() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_date() const { return std::holds_alternative<FluentDate>(data_); }

    // Integers, doubles and FluentNumbers; bools are not numbers
    bool is_number() const;
    std::optional<double> as_number() const;

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&data_); }

    // Display form: "" for none, "true"/"false", shortest round-trip
    // decimal for doubles, ISO-8601 UTC for dates.
    std::string to_string() const;

    // Type-tagged form, distinct for distinct values ("i:1" vs "s:1")
    std::string cache_key() const;

    bool operator==(const FluentValue& o) const { return data_ == o.data_; }
    bool operator!=(const FluentValue& o) const { return !(*this == o); }

private:
    Data data_;
};

using FluentArgs = std::map<std::string, FluentValue>;

// Build a date value from a UTC calendar date and time
FluentDate make_date(int year, unsigned month, unsigned day,
                     unsigned hour = 0, unsigned minute = 0, unsigned second = 0);

} // namespace ftl
