#ifndef LOOM_COMMON_LLM_SCRIPTED_COMPLETION_H
#define LOOM_COMMON_LLM_SCRIPTED_COMPLETION_H

#include "common/llm/completion.h"
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace loom {

// Offline provider: answers from a queue, then from an optional generator.
// Every prompt is recorded.
class ScriptedCompletionProvider : public CompletionProvider {
public:
    using Generator = std::function<std::string(const std::string& prompt)>;

    ScriptedCompletionProvider() = default;
    explicit ScriptedCompletionProvider(std::vector<std::string> answers);

    void push_answer(std::string answer);
    void set_generator(Generator generator);

    std::string complete(const std::string& prompt, const CompletionConstraints& constraints) override;

    std::vector<std::string> prompts() const;

private:
    mutable std::mutex mutex_;
    std::deque<std::string> answers_;
    Generator generator_;
    std::vector<std::string> prompts_;
};

} // namespace loom

#endif // LOOM_COMMON_LLM_SCRIPTED_COMPLETION_H
