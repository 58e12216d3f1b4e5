#include <cstdlib>
#include <string>
#include <crow.h>
#include <curl/curl.h>
#include "controllers/controller_manager.h"
#include "services/app_config.h"
#include "services/insight_synthesizer.h"

namespace {

crow::LogLevel parseLogLevel(const std::string& level)
{
    if (level == "debug") return crow::LogLevel::Debug;
    if (level == "warning") return crow::LogLevel::Warning;
    if (level == "error") return crow::LogLevel::Error;
    if (level == "critical") return crow::LogLevel::Critical;
    return crow::LogLevel::Info;
}

} // namespace

int main(int argc, char** argv){
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("CLAIM_PREDICTOR_CONFIG")) {
        config_path = env;
    }

    AppConfig config = AppConfig::load(config_path);
    crow::logger::setLogLevel(parseLogLevel(config.log_level));

    curl_global_init(CURL_GLOBAL_ALL);

    // Inicializar modelos y controladores
    if (!ControllerManager::initializeAll(config)) {
        CROW_LOG_CRITICAL << "Failed to initialize prediction services. Exiting.";
        curl_global_cleanup();
        return 1;
    }
    
    crow::SimpleApp app;

    // Setup controllers
    ControllerManager::setupAllRoutes(app);

    CROW_LOG_INFO << "Claim Outcome Predictor starting on port " << config.port << "...";
    app.port(static_cast<uint16_t>(config.port)).multithreaded().run();

    ControllerManager::cleanupAll();

    // Abandoned insight calls may still be inside libcurl.
    if (InsightSynthesizer::waitForWorkers(std::chrono::milliseconds(config.insights_timeout_ms))) {
        curl_global_cleanup();
    } else {
        CROW_LOG_WARNING << InsightSynthesizer::activeWorkers()
                         << " insight worker(s) still running at shutdown, libcurl left initialised";
    }
    return 0;
}
