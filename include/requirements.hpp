// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include <string>
#include <vector>

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
};

class Requirements {
public:
    // Empty config_path means built-in defaults.
    static StartupResult run(const std::string& config_path);

private:
    static void ensureLogDir(const std::string& log_path, StartupResult& out);
    static bool loadConfig(const std::string& config_path,
                           StartupResult& out);
    static bool validateConfig(const ConfigManager& cfg,
                               StartupResult& out);
    static void flushLogs(const StartupResult& out);
};
