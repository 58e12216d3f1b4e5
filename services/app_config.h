#pragma once
#include <string>

struct AppConfig
{
    /* ---------- Server ---------- */
    int port = 18080;
    std::string log_level = "info";

    /* ---------- Models ---------- */
    std::string classifier_model_path = "../AI-Models/damage_resnet50.onnx";
    std::string classifier_execution_provider = "auto";   // auto | cpu
    int classifier_threads = 4;
    std::string predictor_model_path = "../AI-Models/claim_outcome_linear.json";

    /* ---------- Document extraction ---------- */
    std::string tessdata_path;                            // empty: tesseract default
    std::string ocr_language = "eng";
    int ocr_max_pages = 5;
    int ocr_dpi = 300;
    int meaningful_threshold = 50;

    /* ---------- Insights ---------- */
    std::string insights_backend = "gemini";               // gemini | llama | none
    std::string gemini_api_key;
    std::string gemini_model = "gemini-1.5-flash";
    std::string gemini_endpoint = "https://generativelanguage.googleapis.com/v1beta/models";
    std::string llama_model_path = "../AI-Models/Phi-3-mini-4k-instruct-q4.gguf";
    int insights_timeout_ms = 6000;

    // Reads an optional JSON file then applies environment overrides.
    // Unknown keys are ignored, bad values keep the default.
    static AppConfig load(const std::string& json_path);

    bool applyJson(const std::string& json_text);
    void applyEnvironment();
};
