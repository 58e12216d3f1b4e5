#include "controller_manager.h"
#include "health_controller.h"
#include "prediction_controller.h"

bool ControllerManager::services_initialized_ = false;

namespace {

const char* onOff(bool v) { return v ? "on" : "off"; }

} // namespace

bool ControllerManager::initializeAll(const AppConfig& config) {
    CROW_LOG_INFO << "Loading claim prediction services...";

    // Model loading happens inside the prediction controller; the health
    // controller reports on the same pipeline instance.
    if (!PredictionController::initialize(config)) {
        CROW_LOG_CRITICAL << "Prediction pipeline could not be built";
        return false;
    }
    auto pipeline = PredictionController::pipeline();
    HealthController::initialize(pipeline);

    const StageAvailability a = pipeline->availability();
    CROW_LOG_INFO << "Stages: extractor=" << onOff(a.extractor) << " ocr=" << onOff(a.ocr)
                  << " classifier=" << onOff(a.classifier) << " predictor=" << onOff(a.predictor)
                  << " insights=" << onOff(a.synthesizer);
    if (!a.ocr) CROW_LOG_WARNING << "Scanned policy documents will not be read (OCR unavailable)";

    services_initialized_ = true;
    return true;
}

void ControllerManager::setupAllRoutes(crow::SimpleApp& app) {
    HealthController::setupRoutes(app);

    if (services_initialized_) {
        PredictionController::setupRoutes(app);
    } else {
        CROW_LOG_WARNING << "Prediction routes not registered: services not initialised";
    }
}

void ControllerManager::cleanupAll() {
    if (!services_initialized_) return;

    HealthController::initialize(nullptr);
    PredictionController::cleanup();
    services_initialized_ = false;
    CROW_LOG_INFO << "Claim prediction services released";
}
