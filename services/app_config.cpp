#include "app_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <crow/logging.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace {

void readString(const rapidjson::Value& obj, const char* key, std::string& out)
{
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (it->value.IsString()) {
        out = it->value.GetString();
    } else {
        CROW_LOG_WARNING << "[config] '" << key << "' must be a string, keeping default";
    }
}

void readInt(const rapidjson::Value& obj, const char* key, int& out, int lo, int hi)
{
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (it->value.IsInt() && it->value.GetInt() >= lo && it->value.GetInt() <= hi) {
        out = it->value.GetInt();
    } else {
        CROW_LOG_WARNING << "[config] '" << key << "' must be an integer in ["
                         << lo << ", " << hi << "], keeping default";
    }
}

void envString(const char* name, std::string& out)
{
    if (const char* v = std::getenv(name)) {
        if (*v) out = v;
    }
}

void envInt(const char* name, int& out, int lo, int hi)
{
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    try {
        int n = std::stoi(v);
        if (n >= lo && n <= hi) {
            out = n;
            return;
        }
    } catch (const std::exception&) {
    }
    CROW_LOG_WARNING << "[config] ignoring invalid " << name << "=" << v;
}

} // namespace

bool AppConfig::applyJson(const std::string& json_text)
{
    rapidjson::Document doc;
    doc.Parse(json_text.c_str());
    if (doc.HasParseError() || !doc.IsObject()) {
        CROW_LOG_ERROR << "[config] invalid JSON: "
                       << (doc.HasParseError() ? rapidjson::GetParseError_En(doc.GetParseError())
                                               : "root is not an object");
        return false;
    }

    readInt(doc, "port", port, 1, 65535);
    readString(doc, "log_level", log_level);

    if (doc.HasMember("classifier") && doc["classifier"].IsObject()) {
        const auto& c = doc["classifier"];
        readString(c, "model_path", classifier_model_path);
        readString(c, "execution_provider", classifier_execution_provider);
        readInt(c, "threads", classifier_threads, 1, 64);
    }
    if (doc.HasMember("predictor") && doc["predictor"].IsObject()) {
        readString(doc["predictor"], "model_path", predictor_model_path);
    }
    if (doc.HasMember("extractor") && doc["extractor"].IsObject()) {
        const auto& e = doc["extractor"];
        readString(e, "tessdata_path", tessdata_path);
        readString(e, "ocr_language", ocr_language);
        readInt(e, "ocr_max_pages", ocr_max_pages, 1, 50);
        readInt(e, "ocr_dpi", ocr_dpi, 72, 600);
        readInt(e, "meaningful_threshold", meaningful_threshold, 0, 100000);
    }
    if (doc.HasMember("insights") && doc["insights"].IsObject()) {
        const auto& i = doc["insights"];
        readString(i, "backend", insights_backend);
        readString(i, "gemini_api_key", gemini_api_key);
        readString(i, "gemini_model", gemini_model);
        readString(i, "gemini_endpoint", gemini_endpoint);
        readString(i, "llama_model_path", llama_model_path);
        readInt(i, "timeout_ms", insights_timeout_ms, 3000, 8000);
    }
    return true;
}

void AppConfig::applyEnvironment()
{
    envInt("CLAIM_PREDICTOR_PORT", port, 1, 65535);
    envString("CLAIM_LOG_LEVEL", log_level);
    envString("CLAIM_CLASSIFIER_MODEL", classifier_model_path);
    envString("CLAIM_PREDICTOR_MODEL", predictor_model_path);
    envString("CLAIM_TESSDATA_PATH", tessdata_path);
    envString("CLAIM_INSIGHTS_BACKEND", insights_backend);
    envString("GOOGLE_API_KEY", gemini_api_key);
    envString("CLAIM_LLAMA_MODEL", llama_model_path);
    envInt("CLAIM_INSIGHTS_TIMEOUT_MS", insights_timeout_ms, 3000, 8000);

    std::transform(insights_backend.begin(), insights_backend.end(), insights_backend.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

AppConfig AppConfig::load(const std::string& json_path)
{
    AppConfig cfg;
    if (!json_path.empty()) {
        std::ifstream in(json_path);
        if (in) {
            std::stringstream ss;
            ss << in.rdbuf();
            if (cfg.applyJson(ss.str())) {
                CROW_LOG_INFO << "[config] loaded " << json_path;
            }
        } else {
            CROW_LOG_WARNING << "[config] cannot open " << json_path << ", using defaults";
        }
    }
    cfg.applyEnvironment();
    return cfg;
}
