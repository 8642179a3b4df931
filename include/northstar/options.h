#pragma once

#include <string>

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error
};

struct GlobalOptions {
    LogLevel log_level = LogLevel::Info;
    bool debug = false;
    std::string log_path;
};

extern GlobalOptions g_global_options;
extern const std::string RUNTIME_VERSION;

bool parse_log_level(const std::string& text, LogLevel& level);
const char* log_level_name(LogLevel level);

bool configure_log_destination(const std::string& path);
void close_log_destination();

void log_message(LogLevel level, const std::string& message);
void log_trace(const std::string& message);
void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);

std::string iso8601_now();
