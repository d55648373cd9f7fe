// modules/cache/artifact_store.h
#ifndef LOOM_MODULES_CACHE_ARTIFACT_STORE_H
#define LOOM_MODULES_CACHE_ARTIFACT_STORE_H

#include "core/types/result.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace loom {

// Out-of-band payload storage keyed by content hash
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;
    virtual ArtifactHandle put(const std::string& bytes, const std::string& content_type) = 0;
    virtual std::optional<std::string> get(const std::string& uri) const = 0;
};

class MemoryArtifactStore : public ArtifactStore {
public:
    ArtifactHandle put(const std::string& bytes, const std::string& content_type) override;
    std::optional<std::string> get(const std::string& uri) const override;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> blobs_;
};

} // namespace loom

#endif // LOOM_MODULES_CACHE_ARTIFACT_STORE_H
