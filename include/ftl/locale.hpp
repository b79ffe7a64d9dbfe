#pragma once

#include <ftl/result.hpp>
#include <unicode/locid.h>
#include <string>

namespace ftl {

// "en-US" and "en_US" both become "en_US"
std::string normalize_locale(const std::string& code);

icu::Locale to_icu_locale(const std::string& code);

// Checks that ICU recognizes the language part of a locale code
Status check_locale(const std::string& code);

} // namespace ftl
