#include <ftl/cache.hpp>

namespace ftl {

FormatCache::FormatCache(size_t capacity)
    : capacity_(capacity) {}

std::string FormatCache::make_key(const std::string& id,
                                  const std::optional<std::string>& attribute,
                                  const FluentArgs& args) {
    // Length-prefixed fields keep distinct inputs from colliding
    std::string key = std::to_string(id.size()) + ":" + id;
    if (attribute) {
        key += "." + std::to_string(attribute->size()) + ":" + *attribute;
    }
    key += "|";
    for (const auto& [name, value] : args) {
        key += std::to_string(name.size()) + ":" + name + "=";
        std::string v = value.cache_key();
        key += std::to_string(v.size()) + ":" + v + ";";
    }
    return key;
}

std::optional<FormatCache::Entry> FormatCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) return std::nullopt;

    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
}

void FormatCache::put(const std::string& key, Entry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) return;

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(entry);
        order_.splice(order_.begin(), order_, it->second);
        return;
    }

    order_.emplace_front(key, std::move(entry));
    index_[key] = order_.begin();

    while (order_.size() > capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
    }
}

void FormatCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

CacheStats FormatCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    s.size = order_.size();
    s.capacity = capacity_;
    return s;
}

} // namespace ftl
