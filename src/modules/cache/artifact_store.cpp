// modules/cache/artifact_store.cpp
#include "modules/cache/artifact_store.h"
#include "common/utils/hash.h"

namespace loom {

ArtifactHandle MemoryArtifactStore::put(const std::string& bytes, const std::string& content_type) {
    ArtifactHandle handle;
    handle.uri = "artifact://blake3/" + hash_bytes(HashDomain::ARTIFACT, bytes);
    handle.content_type = content_type;
    handle.size = bytes.size();

    std::lock_guard<std::mutex> lock(mutex_);
    blobs_.emplace(handle.uri, bytes);
    return handle;
}

std::optional<std::string> MemoryArtifactStore::get(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(uri);
    if (it == blobs_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryArtifactStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
}

} // namespace loom
