// modules/cache/schema_cache.h
#ifndef LOOM_MODULES_CACHE_SCHEMA_CACHE_H
#define LOOM_MODULES_CACHE_SCHEMA_CACHE_H

#include "common/tools/tool_transport.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace loom {

// Keyed by "server@version"; entries never expire
class SchemaCache {
public:
    std::optional<ToolSchema> get(const std::string& server, const std::string& version) const;
    void put(ToolSchema schema);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolSchema> entries_;
};

} // namespace loom

#endif // LOOM_MODULES_CACHE_SCHEMA_CACHE_H
