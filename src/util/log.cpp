#include <ftl/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ftl::log {

namespace {

struct LevelInfo {
    const char* name;
    const char* color;
};

// Indexed by Level
constexpr LevelInfo kLevels[] = {
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info",  "\033[32m"},
    {"warn",  "\033[33m"},
    {"error", "\033[31m"},
};

constexpr int kColorUnset = -1;

std::atomic<Level> s_level{Info};
std::atomic<int> s_color{kColorUnset};
std::mutex s_mutex;
Sink s_sink;

bool color_on() {
    int c = s_color.load();
    if (c == kColorUnset) {
        int detected = isatty(fileno(stderr)) ? 1 : 0;
        s_color.compare_exchange_strong(c, detected);
        return s_color.load() == 1;
    }
    return c == 1;
}

std::string vformat(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return {};

    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(n));
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;
    std::string text = vformat(fmt, args);

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_sink) {
        s_sink(lvl, text);
        return;
    }
    const LevelInfo& li = kLevels[lvl];
    if (color_on()) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", li.color, li.name, text.c_str());
    } else {
        std::fprintf(stderr, "%s: %s\n", li.name, text.c_str());
    }
}

} // namespace

void set_level(Level lvl) { s_level = lvl; }
Level get_level() { return s_level; }

void set_color_enabled(bool enabled) { s_color = enabled ? 1 : 0; }
bool is_color_enabled() { return color_on(); }

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Error) return "unknown";
    return kLevels[lvl].name;
}

Result<Level> parse_level(const std::string& name) {
    if (name == "warning") return Result<Level>::ok(Warn);
    for (int i = Trace; i <= Error; ++i) {
        if (name == kLevels[i].name) return Result<Level>::ok(static_cast<Level>(i));
    }
    return FtlError{FtlError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

#define FTL_LOG_AT(fn, lvl)              \
    void fn(const char* fmt, ...) {      \
        va_list args;                    \
        va_start(args, fmt);             \
        emit(lvl, fmt, args);            \
        va_end(args);                    \
    }

FTL_LOG_AT(trace, Trace)
FTL_LOG_AT(debug, Debug)
FTL_LOG_AT(info, Info)
FTL_LOG_AT(warn, Warn)
FTL_LOG_AT(error, Error)

#undef FTL_LOG_AT

} // namespace ftl::log
