// modules/cache/schema_cache.cpp
#include "modules/cache/schema_cache.h"

namespace loom {

std::optional<ToolSchema> SchemaCache::get(const std::string& server, const std::string& version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(server + "@" + version);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void SchemaCache::put(ToolSchema schema) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = schema.key();
    entries_[key] = std::move(schema);
}

size_t SchemaCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace loom
