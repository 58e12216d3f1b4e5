#pragma once
#include <string>
#include "insight_synthesizer.h"

// Google Generative Language API (generateContent) over libcurl.
class GeminiClient : public LanguageModelClient
{
public:
    GeminiClient(std::string api_key, std::string model, std::string endpoint);

    std::string name() const override { return "gemini:" + model_; }
    std::optional<std::string> generate(const std::string& prompt,
                                        std::chrono::milliseconds timeout) const override;

    static std::string buildRequestBody(const std::string& prompt);
    // Concatenated text parts of the first candidate; empty optional when the
    // body is not a well-formed generateContent reply.
    static std::optional<std::string> parseResponse(const std::string& body);

private:
    std::string api_key_;
    std::string model_;
    std::string endpoint_;
};
