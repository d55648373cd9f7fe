// modules/cache/result_cache.h
#ifndef LOOM_MODULES_CACHE_RESULT_CACHE_H
#define LOOM_MODULES_CACHE_RESULT_CACHE_H

#include "core/types/result.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace loom {

struct ResultKey {
    std::string plan_hash;
    NodeId node_id;
    Value inputs = Value::object();              // {params, state}
    std::map<std::string, std::string> schemas;  // server -> version

    // BLAKE3("result:" + canonical JSON)
    std::string digest() const;
};

// 确定性结果缓存。并发写同一个键时后写者胜，不丢失写入。
class ResultCache {
public:
    std::optional<ResultEnvelope> get(const std::string& digest) const;
    void put(const std::string& digest, ResultEnvelope envelope);

    size_t size() const;
    size_t hits() const;
    size_t misses() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ResultEnvelope> entries_;
    mutable size_t hits_ = 0;
    mutable size_t misses_ = 0;
};

} // namespace loom

#endif // LOOM_MODULES_CACHE_RESULT_CACHE_H
