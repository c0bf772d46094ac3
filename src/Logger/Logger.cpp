// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <cstring>
#include <ctime>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>

namespace {
    std::mutex  g_log_mtx;
    std::string g_log_path;
}

void logger_set_path(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
}

std::string logger_path() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_path;
}

// Desc: append one timestamped line to the log file
// In: const std::string& tag, const std::string& msg
// Out: void
void log_line(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_path.empty()) return;

    int fd = ::open(g_log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return;

    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0'; // strip '\n'

    std::string line = "[" + std::string(buf) + "] [" + tag + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}
