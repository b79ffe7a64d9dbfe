#pragma once

#include <functional>
#include <string>

namespace ftl {

// CLDR plural category ("zero", "one", "two", "few", "many" or "other") of
// a number in a locale. Locale codes may use '-' or '_' separators.
// Unknown locales fall back to "other".
std::string plural_category(double number, const std::string& locale);

using PluralFunction = std::function<std::string(double, const std::string&)>;

} // namespace ftl
