// modules/sandbox/sandbox_engine.cpp
#include "modules/sandbox/sandbox_engine.h"
#include <stdexcept>

namespace loom {

void to_json(nlohmann::json& j, const SandboxHealth& h) {
    j = nlohmann::json{
        {"available", h.available},
        {"active_workers", h.active_workers},
        {"max_workers", h.max_workers},
        {"idle", h.idle()},
        {"detail", h.detail}
    };
}

void EngineRegistry::register_engine(std::shared_ptr<SandboxEngine> engine) {
    if (!engine) {
        throw std::invalid_argument("EngineRegistry: null engine");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    engines_[engine->name()] = std::move(engine);
}

std::shared_ptr<SandboxEngine> EngineRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = engines_.find(name);
    return it == engines_.end() ? nullptr : it->second;
}

std::vector<std::string> EngineRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(engines_.size());
    for (const auto& [name, _] : engines_) out.push_back(name);
    return out;
}

} // namespace loom
