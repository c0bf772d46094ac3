// requirements.cpp
#include "requirements.hpp"
#include "Logger.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <cstring>


// Desc: create the log file's parent directory if missing
// In: const std::string& log_path, StartupResult& out
// Out: void
void Requirements::ensureLogDir(const std::string& log_path, StartupResult& out) {
    const auto slash = log_path.rfind('/');
    if (slash == std::string::npos || slash == 0) return;

    const std::string dir = log_path.substr(0, slash);
    if (::mkdir(dir.c_str(), 0755) == 0) {
        out.logs.push_back("[ensureDir] created: " + dir);
    } else if (errno != EEXIST) {
        // not fatal: log_line() silently skips an unwritable file
        out.logs.push_back("[ensureDir] failed: " + dir + " (" + std::string(::strerror(errno)) + ")");
    }
}

// Desc: load JSON config into StartupResult::config
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (config_path.empty()) {
        out.logs.push_back("[config] no config file, using defaults");
        return true;
    }
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back(std::string("[config] loaded: ") + config_path);
    return true;
}

// Desc: validate config bounds
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    const uint64_t max_bytes = cfg.max_input_bytes();
    const uint64_t MIN_BYTES = 1 * 1024ULL;                        // 1KB
    const uint64_t MAX_BYTES = 1ULL * 1024ULL * 1024ULL * 1024ULL; // 1GB

    if (max_bytes < MIN_BYTES) {
        out.error = "[config] max_input_size too small (<1KB)";
        out.logs.push_back(out.error);
        return false;
    }
    if (max_bytes > MAX_BYTES) {
        out.error = "[config] max_input_size too large (>1GB)";
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[config] max_input_size: " + std::to_string(max_bytes) + " bytes");
    out.logs.push_back(std::string("[config] use_hyperscan: ") + (cfg.useHyperscan() ? "true" : "false"));
    out.logs.push_back("[config] log_path: " + (cfg.getLogPath().empty() ? std::string("(none)") : cfg.getLogPath()));
    out.logs.push_back("[config] validation ok");
    return true;
}

void Requirements::flushLogs(const StartupResult& out) {
    for (const auto& l : out.logs) log_line("Requirements", l);
}

// Desc: orchestrate startup: config, validation, log file
// In: const std::string& config_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path) {
    StartupResult res;

    // 1) config load + validate
    if (!loadConfig(config_path, res)) {
        return res;
    }
    if (!validateConfig(res.config, res)) {
        return res;
    }

    // 2) log file
    const std::string& log_path = res.config.getLogPath();
    if (!log_path.empty()) {
        ensureLogDir(log_path, res);
        logger_set_path(log_path);
    }

    // Ok
    res.ok = true;
    flushLogs(res);
    return res;
}
