#pragma once
#include <iosfwd>
#include <string>

#include "CoreEngine.hpp"

struct CliOptions {
    RunOptions  run;
    std::string config_path;
    bool        have_config = false;  // -c / --config given
    bool        show_help   = false;
};

// Parse argv. Returns false on a usage error, with err describing it.
bool parse_cli(int argc, const char* const* argv, CliOptions& out, std::string& err);

// -c wins, then the SECURE_REDACTOR_CONFIG value (may be null), else none.
std::string resolve_config_path(const CliOptions& opts, const char* env_config);

void print_help(std::ostream& os);

// Whole command: parse, boot, redact. Exit status 0 ok, 1 failure, 2 usage.
int run_cli(int argc, const char* const* argv, const char* env_config, const EngineStreams& io);
