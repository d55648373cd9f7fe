// modules/cache/result_cache.cpp
#include "modules/cache/result_cache.h"
#include "common/utils/hash.h"

namespace loom {

std::string ResultKey::digest() const {
    nlohmann::json canonical{
        {"plan_hash", plan_hash},
        {"node_id", node_id},
        {"inputs", inputs},
        {"schemas", schemas}
    };
    return hash_json(HashDomain::RESULT, canonical);
}

std::optional<ResultEnvelope> ResultCache::get(const std::string& digest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(digest);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second;
}

void ResultCache::put(const std::string& digest, ResultEnvelope envelope) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[digest] = std::move(envelope);
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ResultCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t ResultCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

} // namespace loom
