// include/ConfigManager.hpp
#pragma once
#include <string>
#include <cstdint>

class ConfigManager {
public:
    explicit ConfigManager() = default;
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& json_text);

    const std::string& getLogPath() const { return log_path_; }
    bool useHyperscan() const { return use_hyperscan_; }
    std::uint64_t max_input_bytes() const { return max_input_bytes_; }

    // "<n>KB" / "<n>MB" -> bytes; throws std::runtime_error on bad input
    static std::uint64_t parse_size_kb_mb(const std::string& s);

    static constexpr std::uint64_t kDefaultMaxInputBytes = 64ULL * 1024ULL * 1024ULL;

private:
    std::string log_path_;
    bool use_hyperscan_ = true;
    std::uint64_t max_input_bytes_ = kDefaultMaxInputBytes;
};
