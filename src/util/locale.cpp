#include <ftl/locale.hpp>
#include <algorithm>
#include <cctype>

namespace ftl {

std::string normalize_locale(const std::string& code) {
    std::string out = code;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

icu::Locale to_icu_locale(const std::string& code) {
    return icu::Locale::createFromName(normalize_locale(code).c_str());
}

Status check_locale(const std::string& code) {
    if (code.empty()) {
        return FtlError(FtlError::Locale, "empty locale code",
                        "use a BCP 47 code such as 'en-US'");
    }
    for (char c : code) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return FtlError(FtlError::Locale,
                            "invalid character in locale code '" + code + "'");
        }
    }
    icu::Locale loc = to_icu_locale(code);
    if (loc.isBogus() || std::string(loc.getLanguage()).empty()) {
        return FtlError(FtlError::Locale, "unrecognized locale '" + code + "'");
    }
    return ok_status();
}

} // namespace ftl
