#include "gemini_client.h"

#include <memory>
#include <crow/logging.h>
#include <curl/curl.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace {

constexpr double kTemperature = 0.7;
constexpr int kMaxOutputTokens = 256;

size_t curlWrite(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

} // namespace

GeminiClient::GeminiClient(std::string api_key, std::string model, std::string endpoint)
    : api_key_(std::move(api_key)), model_(std::move(model)), endpoint_(std::move(endpoint))
{
}

std::string GeminiClient::buildRequestBody(const std::string& prompt)
{
    rapidjson::Document d; d.SetObject();
    auto& a = d.GetAllocator();

    rapidjson::Value part(rapidjson::kObjectType);
    part.AddMember("text", rapidjson::Value(prompt.c_str(), static_cast<rapidjson::SizeType>(prompt.size()), a), a);
    rapidjson::Value parts(rapidjson::kArrayType);
    parts.PushBack(part, a);
    rapidjson::Value content(rapidjson::kObjectType);
    content.AddMember("role", "user", a);
    content.AddMember("parts", parts, a);
    rapidjson::Value contents(rapidjson::kArrayType);
    contents.PushBack(content, a);
    d.AddMember("contents", contents, a);

    rapidjson::Value gen(rapidjson::kObjectType);
    gen.AddMember("temperature", kTemperature, a);
    gen.AddMember("maxOutputTokens", kMaxOutputTokens, a);
    d.AddMember("generationConfig", gen, a);

    rapidjson::StringBuffer buf;
    rapidjson::Writer<rapidjson::StringBuffer> wr(buf);
    d.Accept(wr);
    return { buf.GetString(), buf.GetSize() };
}

std::optional<std::string> GeminiClient::parseResponse(const std::string& body)
{
    rapidjson::Document d;
    d.Parse(body.c_str());
    if (d.HasParseError() || !d.IsObject()) return std::nullopt;

    auto cands = d.FindMember("candidates");
    if (cands == d.MemberEnd() || !cands->value.IsArray() || cands->value.Empty()) return std::nullopt;

    const auto& first = cands->value[0];
    if (!first.IsObject() || !first.HasMember("content") || !first["content"].IsObject()) return std::nullopt;
    const auto& content = first["content"];
    if (!content.HasMember("parts") || !content["parts"].IsArray()) return std::nullopt;

    std::string text;
    for (const auto& part : content["parts"].GetArray()) {
        if (part.IsObject() && part.HasMember("text") && part["text"].IsString()) {
            text += part["text"].GetString();
        }
    }
    if (text.empty()) return std::nullopt;
    return text;
}

std::optional<std::string> GeminiClient::generate(const std::string& prompt,
                                                  std::chrono::milliseconds timeout) const
{
    if (api_key_.empty()) {
        CROW_LOG_WARNING << "[gemini] GOOGLE_API_KEY is not configured";
        return std::nullopt;
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return std::nullopt;

    const std::string url = endpoint_ + "/" + model_ + ":generateContent";
    const std::string body = buildRequestBody(prompt);
    const std::string key_header = "x-goog-api-key: " + api_key_;

    curl_slist* raw = curl_slist_append(nullptr, "Content-Type: application/json");
    raw = curl_slist_append(raw, key_header.c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw);

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curlWrite);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        CROW_LOG_WARNING << "[gemini] request failed: " << curl_easy_strerror(res);
        return std::nullopt;
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        // 429 is the quota case
        CROW_LOG_WARNING << "[gemini] HTTP " << http_code << ": " << response.substr(0, 300);
        return std::nullopt;
    }

    auto text = parseResponse(response);
    if (!text) CROW_LOG_WARNING << "[gemini] malformed response body";
    return text;
}
