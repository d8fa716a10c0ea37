#pragma once
#include <string>

namespace core {

enum class LogLevel { Debug = 0, Info, Warn, Error };

void set_log_level(LogLevel level);
LogLevel log_level();

// Parse "debug" / "info" / "warn" / "error" (case-insensitive). Unknown -> Info.
LogLevel parse_log_level(const std::string& name);

// Mirror every emitted line into a file (appending). Empty path disables it.
// Returns false if the file could not be opened.
bool set_log_file(const std::string& path);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

// printf-style formatting into a std::string
std::string format(const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

}
