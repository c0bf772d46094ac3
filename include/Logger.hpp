#pragma once
#include <string>

// Select the append-only log file. Empty path disables file logging.
void logger_set_path(const std::string& path);
std::string logger_path();

// Append "[<time>] [<tag>] <msg>\n" to the log file, if one is set.
void log_line(const std::string& tag, const std::string& msg);
