#ifndef CORE_ENGINE_HPP
#define CORE_ENGINE_HPP
#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>

#include "ConfigManager.hpp"

struct RunOptions {
    std::string input_path;   // empty: stdin if piped, else demo text
    std::string output_path;  // empty: stdout
};

enum class InputStatus { Ok, NotFound, ReadError, TooLarge };

// Text shown when neither a file nor a pipe supplies input.
const std::string& demo_text();

InputStatus read_input_file(const std::string& path, std::uint64_t max_bytes,
                            std::string& out, std::string& err);
InputStatus read_input_stream(std::istream& in, std::uint64_t max_bytes,
                              std::string& out);
bool write_output_file(const std::string& path, const std::string& content,
                       std::string& err);

// Process streams; in_is_tty selects demo text over reading 'in'.
struct EngineStreams {
    std::istream& in;
    bool          in_is_tty;
    std::ostream& out;
    std::ostream& err;
};

// Read, redact, write. Returns the process exit status.
int run_core_engine(const RunOptions& opts, const ConfigManager& config, const EngineStreams& io);

#endif // CORE_ENGINE_HPP
