// === ConfigManager.cpp ===
#include "ConfigManager.hpp"

#include <fstream>
#include <iterator>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <regex>
#include <stdexcept>
#include <nlohmann/json.hpp>
using nlohmann::json;


// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}


// Desc: parse size string (KB/MB) into bytes
// In: const std::string& raw
// Out: std::uint64_t (bytes); throws on invalid input
std::uint64_t ConfigManager::parse_size_kb_mb(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([kKmM][bB]?)$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw std::runtime_error("invalid format (only KB/MB allowed): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number : '" + raw + "'");
    }

    std::string unit = m[2].str();
    for (auto& c : unit) c = (char)std::toupper((unsigned char)c);

    std::uint64_t mult = 0;
    if (unit == "K" || unit == "KB") mult = 1024ULL;
    else if (unit == "M" || unit == "MB") mult = 1024ULL * 1024ULL;
    else throw std::runtime_error("unreachable unit");

    if (n > std::numeric_limits<std::uint64_t>::max() / mult) {
        throw std::runtime_error("size out of range: '" + raw + "'");
    }
    return n * mult;
}


bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return loadFromString(text);
}

// Desc: parse config JSON; absent keys keep their defaults
// In: const std::string& json_text
// Out: bool (false on invalid JSON or a mistyped key)
bool ConfigManager::loadFromString(const std::string& json_text) {
    json j;
    try { j = json::parse(json_text); }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }

    if (!j.is_object()) { std::cerr << "[ConfigManager] top level must be an object\n"; return false; }

    // log_path
    log_path_.clear();
    if (j.contains("log_path")) {
        if (!j["log_path"].is_string()) { std::cerr << "[ConfigManager] 'log_path' must be a string\n"; return false; }
        log_path_ = j["log_path"].get<std::string>();
        trim_inplace(log_path_);
    }

    // use_hyperscan
    use_hyperscan_ = true;
    if (j.contains("use_hyperscan")) {
        if (!j["use_hyperscan"].is_boolean()) { std::cerr << "[ConfigManager] 'use_hyperscan' must be true or false\n"; return false; }
        use_hyperscan_ = j["use_hyperscan"].get<bool>();
    }

    // sizes
    max_input_bytes_ = kDefaultMaxInputBytes;
    if (j.contains("max_input_size")) {
        if (!j["max_input_size"].is_string()) { std::cerr << "[ConfigManager] 'max_input_size' must be like '512KB' or '64MB'\n"; return false; }
        try { max_input_bytes_ = parse_size_kb_mb(j["max_input_size"].get<std::string>()); }
        catch (const std::exception&) { std::cerr << "[ConfigManager] 'max_input_size' must be like '512KB' or '64MB'\n"; return false; }
    }

    return true;
}
