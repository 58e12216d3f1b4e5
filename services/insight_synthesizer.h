#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "../models/claim_types.h"
#include "../models/stage_result.h"

// A generative language service (remote API or local model).
class LanguageModelClient
{
public:
    virtual ~LanguageModelClient() = default;
    virtual std::string name() const = 0;
    // Empty optional on quota errors, transport failures or malformed replies.
    // May throw; callers treat exceptions like an empty reply.
    virtual std::optional<std::string> generate(const std::string& prompt,
                                                std::chrono::milliseconds timeout) const = 0;
};

struct InsightRequest
{
    std::string incident_description;
    std::string claim_summary;               // FeatureBuilder::summarize
    const ExtractedPolicyText* policy = nullptr;
    std::optional<int> predicted_success;    // 0-100 when the predictor ran
};

class InsightSynthesizer
{
public:
    static constexpr size_t kPolicyExcerptChars = 2000;
    static const char* const kFallbackInsight;

    InsightSynthesizer(std::shared_ptr<const LanguageModelClient> client,
                       std::chrono::milliseconds timeout);

    // Blocks at most the configured timeout. Never throws.
    StageResult<std::string> synthesize(const InsightRequest& request) const;

    static std::string buildPrompt(const InsightRequest& request);

    bool available() const { return client_ != nullptr; }
    std::string backendName() const { return client_ ? client_->name() : "none"; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    // Generation threads still running, including ones whose caller
    // already gave up on them.
    static int activeWorkers();
    // Blocks until every generation thread has finished or `bound` elapsed.
    // Returns false when workers are still running.
    static bool waitForWorkers(std::chrono::milliseconds bound);

private:
    std::shared_ptr<const LanguageModelClient> client_;
    std::chrono::milliseconds timeout_;
};
