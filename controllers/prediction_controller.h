#pragma once

#include <crow.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include "../services/app_config.h"
#include "../services/claim_pipeline.h"

class PredictionController {
public:
    // Loads every model; false means the service must not start.
    static bool initialize(const AppConfig& config);
    static void initialize(std::shared_ptr<const ClaimPipeline> pipeline);
    static void setupRoutes(crow::SimpleApp& app);
    static void cleanup();

    static std::shared_ptr<const ClaimPipeline> pipeline() { return pipeline_; }

    // Multipart body -> submission. nullopt when the request is not multipart;
    // recoverable input problems are appended to notes.
    static std::optional<ClaimSubmission> parseSubmission(const crow::request& req,
                                                          std::vector<std::string>& notes);
    static ClaimForm parseForm(const std::string& json, std::vector<std::string>& notes);
    static std::string toJson(const PredictionResult& result);

    static crow::response predict(const crow::request& req);

private:
    static std::shared_ptr<const ClaimPipeline> pipeline_;
    static crow::response getModelInfo();
    static std::string stringify(const rapidjson::Document& doc);
};
