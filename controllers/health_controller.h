#pragma once

#include <crow.h>
#include <memory>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include "../services/claim_pipeline.h"

class HealthController {
public:
    static void initialize(std::shared_ptr<const ClaimPipeline> pipeline);
    static void setupRoutes(crow::SimpleApp& app);

    static crow::response health();
    // Per-stage availability for external monitoring.
    static crow::response claimHealth();

private:
    static std::shared_ptr<const ClaimPipeline> pipeline_;
    static crow::response json(const rapidjson::Document& doc);
};
