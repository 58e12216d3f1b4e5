#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <llama.h>
#include "insight_synthesizer.h"

// Local GGUF model (Phi-3 mini by default) through llama.cpp.
class LlamaClient : public LanguageModelClient
{
public:
    LlamaClient();
    ~LlamaClient() override;

    LlamaClient(const LlamaClient&) = delete;
    LlamaClient& operator=(const LlamaClient&) = delete;

    bool initializeLlama(const std::string& model_path);

    std::string name() const override { return "llama:" + model_path_; }
    std::optional<std::string> generate(const std::string& prompt,
                                        std::chrono::milliseconds timeout) const override;

    // Phi-3 chat framing around a single user turn.
    static std::string chatPrompt(const std::string& prompt);

    // Waits for the single decode slot until `deadline`. The returned lock
    // does not own the slot when the deadline passed first.
    std::unique_lock<std::timed_mutex>
    reserveDecoder(std::chrono::steady_clock::time_point deadline) const;

private:
    llama_model* model_ = nullptr;
    std::string model_path_;
    bool backend_ready_ = false;
    mutable std::timed_mutex mutex_;        // one decode at a time
};
