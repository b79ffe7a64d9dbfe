#pragma once

#include <ftl/diagnostic.hpp>
#include <ftl/value.hpp>

#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace ftl {

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t size = 0;
    size_t capacity = 0;
};

// Least-recently-used cache of formatted messages keyed on the message id,
// the attribute and the arguments. A capacity of 0 disables caching.
class FormatCache {
public:
    using Entry = std::pair<std::string, Diagnostics>;

    explicit FormatCache(size_t capacity = 0);

    static std::string make_key(const std::string& id,
                                const std::optional<std::string>& attribute,
                                const FluentArgs& args);

    std::optional<Entry> get(const std::string& key);
    void put(const std::string& key, Entry entry);

    void clear();
    CacheStats stats() const;
    size_t capacity() const { return capacity_; }

private:
    using List = std::list<std::pair<std::string, Entry>>;

    size_t capacity_;
    List order_;                                   // front = most recent
    std::unordered_map<std::string, List::iterator> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace ftl
