#include "common/llm/scripted_completion.h"
#include <stdexcept>

namespace loom {

ScriptedCompletionProvider::ScriptedCompletionProvider(std::vector<std::string> answers)
    : answers_(answers.begin(), answers.end()) {}

void ScriptedCompletionProvider::push_answer(std::string answer) {
    std::lock_guard<std::mutex> lock(mutex_);
    answers_.push_back(std::move(answer));
}

void ScriptedCompletionProvider::set_generator(Generator generator) {
    std::lock_guard<std::mutex> lock(mutex_);
    generator_ = std::move(generator);
}

std::string ScriptedCompletionProvider::complete(const std::string& prompt, const CompletionConstraints&) {
    Generator generator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prompts_.push_back(prompt);
        if (!answers_.empty()) {
            std::string answer = std::move(answers_.front());
            answers_.pop_front();
            return answer;
        }
        generator = generator_;
    }
    if (!generator) {
        throw std::runtime_error("No scripted completion left");
    }
    return generator(prompt);
}

std::vector<std::string> ScriptedCompletionProvider::prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_;
}

} // namespace loom
