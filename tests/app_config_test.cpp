#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "services/app_config.h"

namespace {

void clearEnvironment()
{
    for (const char* name : {"CLAIM_PREDICTOR_PORT", "CLAIM_LOG_LEVEL", "CLAIM_CLASSIFIER_MODEL",
                             "CLAIM_PREDICTOR_MODEL", "CLAIM_TESSDATA_PATH", "CLAIM_INSIGHTS_BACKEND",
                             "GOOGLE_API_KEY", "CLAIM_LLAMA_MODEL", "CLAIM_INSIGHTS_TIMEOUT_MS"}) {
        unsetenv(name);
    }
}

void testJsonSections()
{
    AppConfig cfg;
    bool ok = cfg.applyJson(R"({
        "port": 9090,
        "log_level": "debug",
        "classifier": {"model_path": "/models/resnet.onnx", "execution_provider": "cpu", "threads": 2},
        "predictor": {"model_path": "/models/linear.json"},
        "extractor": {"ocr_max_pages": 3, "ocr_language": "eng+deu"},
        "insights": {"backend": "llama", "timeout_ms": 4000, "unknown_key": true}
    })");
    assert(ok);
    assert(cfg.port == 9090);
    assert(cfg.log_level == "debug");
    assert(cfg.classifier_model_path == "/models/resnet.onnx");
    assert(cfg.classifier_execution_provider == "cpu");
    assert(cfg.classifier_threads == 2);
    assert(cfg.predictor_model_path == "/models/linear.json");
    assert(cfg.ocr_max_pages == 3 && cfg.ocr_language == "eng+deu");
    assert(cfg.ocr_dpi == 300);
    assert(cfg.insights_backend == "llama");
    assert(cfg.insights_timeout_ms == 4000);
    std::cout << "[PASS] JSON sections" << std::endl;
}

void testBadValuesKeepDefaults()
{
    AppConfig cfg;
    assert(cfg.applyJson(R"({"port": "http", "insights": {"timeout_ms": 60000}, "extractor": {"ocr_dpi": 12}})"));
    assert(cfg.port == 18080);
    assert(cfg.insights_timeout_ms == 6000);
    assert(cfg.ocr_dpi == 300);

    AppConfig broken;
    assert(!broken.applyJson("{port: 1"));
    assert(!broken.applyJson("[1, 2]"));
    assert(broken.port == 18080);
    std::cout << "[PASS] bad values keep defaults" << std::endl;
}

void testEnvironmentOverrides()
{
    clearEnvironment();
    setenv("CLAIM_PREDICTOR_PORT", "8081", 1);
    setenv("CLAIM_INSIGHTS_BACKEND", "NONE", 1);
    setenv("GOOGLE_API_KEY", "test-key", 1);
    setenv("CLAIM_INSIGHTS_TIMEOUT_MS", "20", 1);

    AppConfig cfg;
    cfg.applyEnvironment();
    assert(cfg.port == 8081);
    assert(cfg.insights_backend == "none");
    assert(cfg.gemini_api_key == "test-key");
    assert(cfg.insights_timeout_ms == 6000 && "out-of-range timeout is ignored");

    setenv("CLAIM_PREDICTOR_PORT", "eighty", 1);
    AppConfig bad;
    bad.applyEnvironment();
    assert(bad.port == 18080);
    clearEnvironment();
    std::cout << "[PASS] environment overrides" << std::endl;
}

void testLoadFile()
{
    clearEnvironment();
    const std::string path = "app_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"port": 7000, "predictor": {"model_path": "from-file.json"}})";
    }
    setenv("CLAIM_PREDICTOR_MODEL", "from-env.json", 1);

    AppConfig cfg = AppConfig::load(path);
    assert(cfg.port == 7000);
    assert(cfg.predictor_model_path == "from-env.json" && "environment wins over the file");

    AppConfig missing = AppConfig::load("/nonexistent/claim_predictor.json");
    assert(missing.port == 18080);

    std::remove(path.c_str());
    clearEnvironment();
    std::cout << "[PASS] load file then environment" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] AppConfig..." << std::endl;
    testJsonSections();
    testBadValuesKeepDefaults();
    testEnvironmentOverrides();
    testLoadFile();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
