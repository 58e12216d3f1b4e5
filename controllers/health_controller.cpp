#include "health_controller.h"
#include <ctime>

std::shared_ptr<const ClaimPipeline> HealthController::pipeline_ = nullptr;

void HealthController::initialize(std::shared_ptr<const ClaimPipeline> pipeline) {
    pipeline_ = std::move(pipeline);
}

void HealthController::setupRoutes(crow::SimpleApp& app) {
    CROW_ROUTE(app, "/")([](){
        return health();
    });
    CROW_ROUTE(app, "/health")([](){
        return health();
    });
    CROW_ROUTE(app, "/advanced/health")([](){
        return claimHealth();
    });
}

crow::response HealthController::health() {
    rapidjson::Document doc;
    doc.SetObject();
    rapidjson::Document::AllocatorType& allocator = doc.GetAllocator();
    
    doc.AddMember("status", "healthy", allocator);
    doc.AddMember("service", "Claim Outcome Predictor", allocator);
    doc.AddMember("timestamp", static_cast<int64_t>(std::time(nullptr)), allocator);
    
    return json(doc);
}

crow::response HealthController::claimHealth() {
    StageAvailability a;
    if (pipeline_) a = pipeline_->availability();

    rapidjson::Document doc;
    doc.SetObject();
    rapidjson::Document::AllocatorType& allocator = doc.GetAllocator();

    const bool core = a.classifier && a.predictor;
    doc.AddMember("status", core ? "healthy" : "degraded", allocator);
    doc.AddMember("timestamp", static_cast<int64_t>(std::time(nullptr)), allocator);

    rapidjson::Value features(rapidjson::kObjectType);
    features.AddMember("extractor", a.extractor, allocator);
    features.AddMember("ocr", a.ocr, allocator);
    features.AddMember("classifier", a.classifier, allocator);
    features.AddMember("predictor", a.predictor, allocator);
    features.AddMember("synthesizer", a.synthesizer, allocator);
    doc.AddMember("features", features, allocator);

    return json(doc);
}

crow::response HealthController::json(const rapidjson::Document& doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    
    crow::response res(200, buffer.GetString());
    res.add_header("Content-Type", "application/json");
    return res;
}
