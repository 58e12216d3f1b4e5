#pragma once

#include <crow.h>
#include <string>
#include "../services/app_config.h"

class ControllerManager {
public:
    static bool initializeAll(const AppConfig& config);
    static void setupAllRoutes(crow::SimpleApp& app);
    static void cleanupAll();
    
private:
    static bool services_initialized_;
};
