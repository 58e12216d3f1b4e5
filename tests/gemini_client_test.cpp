#include <cassert>
#include <iostream>
#include <curl/curl.h>
#include <rapidjson/document.h>

#include "services/gemini_client.h"

using namespace std::chrono_literals;

namespace {

void testRequestBody()
{
    const std::string prompt = "Line one\n\"quoted\" line two";
    rapidjson::Document d;
    d.Parse(GeminiClient::buildRequestBody(prompt).c_str());
    assert(!d.HasParseError() && d.IsObject());

    const auto& contents = d["contents"];
    assert(contents.IsArray() && contents.Size() == 1);
    assert(std::string(contents[0]["parts"][0]["text"].GetString()) == prompt);

    const auto& gen = d["generationConfig"];
    assert(gen["maxOutputTokens"].GetInt() == 256);
    assert(gen["temperature"].GetDouble() > 0.0);
    std::cout << "[PASS] generateContent request body" << std::endl;
}

void testParseResponse()
{
    auto text = GeminiClient::parseResponse(R"({
        "candidates": [{
            "content": {"role": "model", "parts": [{"text": "Covered. "}, {"text": "Keep receipts."}]},
            "finishReason": "STOP"
        }]
    })");
    assert(text && *text == "Covered. Keep receipts.");

    const char* malformed[] = {
        "",
        "<html>502 Bad Gateway</html>",
        R"({"error": {"code": 429, "status": "RESOURCE_EXHAUSTED"}})",
        R"({"candidates": []})",
        R"({"candidates": [{"finishReason": "SAFETY"}]})",
        R"({"candidates": [{"content": {"parts": [{"inlineData": {}}]}}]})",
    };
    for (const char* body : malformed) {
        assert(!GeminiClient::parseResponse(body) && "malformed reply must not produce text");
    }
    std::cout << "[PASS] response parsing" << std::endl;
}

void testNoNetworkPaths()
{
    GeminiClient keyless("", "gemini-1.5-flash", "https://generativelanguage.googleapis.com/v1beta/models");
    assert(keyless.name() == "gemini:gemini-1.5-flash");
    assert(!keyless.generate("hi", 1000ms));

    // Nothing listens on port 9 locally: transport failure, not an exception.
    GeminiClient unreachable("test-key", "gemini-1.5-flash", "http://127.0.0.1:9/v1beta/models");
    assert(!unreachable.generate("hi", 1000ms));
    std::cout << "[PASS] missing key and transport failure" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] GeminiClient..." << std::endl;
    curl_global_init(CURL_GLOBAL_DEFAULT);
    testRequestBody();
    testParseResponse();
    testNoNetworkPaths();
    curl_global_cleanup();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
