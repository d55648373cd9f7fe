#ifndef LOOM_COMMON_LLM_COMPLETION_H
#define LOOM_COMMON_LLM_COMPLETION_H

#include <string>
#include <vector>

namespace loom {

struct CompletionConstraints {
    int max_tokens = 512;
    std::vector<std::string> stop;
};

// complete(prompt, constraints) -> text. Used by the planner only; sandboxed
// code never reaches it.
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;
    virtual std::string complete(const std::string& prompt, const CompletionConstraints& constraints) = 0;
};

} // namespace loom

#endif // LOOM_COMMON_LLM_COMPLETION_H
