#include "core/logging.hpp"
#include <iostream>
#include <fstream>
#include <mutex>
#include <ctime>
#include <cstdarg>
#include <cstdio>
#include <algorithm>
#include <cctype>
#include <vector>

namespace core {

namespace {
std::mutex g_log_mutex;
LogLevel g_level = LogLevel::Info;
std::ofstream g_file;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

void emit(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_level) return;
    const std::string line = timestamp() + " [" + level_name(level) + "] " + msg;
    if (level >= LogLevel::Warn) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
    if (g_file.is_open()) {
        g_file << line << '\n';
        g_file.flush();
    }
}
} // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_level;
}

LogLevel parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return LogLevel::Info;
}

bool set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_file.is_open()) g_file.close();
    if (path.empty()) return true;
    g_file.open(path, std::ios::app);
    if (!g_file) {
        std::cerr << "[ERROR] Cannot open log file " << path << std::endl;
        return false;
    }
    return true;
}

void log_debug(const std::string& msg) { emit(LogLevel::Debug, msg); }
void log_info(const std::string& msg) { emit(LogLevel::Info, msg); }
void log_warn(const std::string& msg) { emit(LogLevel::Warn, msg); }
void log_error(const std::string& msg) { emit(LogLevel::Error, msg); }

std::string format(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int len = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (len < 0) {
        va_end(args);
        return {};
    }
    std::vector<char> buf(static_cast<size_t>(len) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    va_end(args);
    return std::string(buf.data(), static_cast<size_t>(len));
}

}
