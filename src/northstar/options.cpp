#include "northstar/options.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace {

std::unique_ptr<std::ofstream> g_log_stream;
std::mutex g_log_mutex;

bool enabled(LogLevel level) {
    LogLevel threshold = g_global_options.log_level;
    if (g_global_options.debug && threshold > LogLevel::Debug) {
        threshold = LogLevel::Debug;
    }
    return level >= threshold;
}

} // namespace

GlobalOptions g_global_options;
const std::string RUNTIME_VERSION = "0.3.0";

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "TRACE") {
        level = LogLevel::Trace;
    } else if (upper == "DEBUG") {
        level = LogLevel::Debug;
    } else if (upper == "INFO") {
        level = LogLevel::Info;
    } else if (upper == "WARN") {
        level = LogLevel::Warn;
    } else if (upper == "ERROR") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return "trace";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "?";
}

bool configure_log_destination(const std::string& path) {
    std::unique_ptr<std::ofstream> stream(new std::ofstream(path, std::ios::app));
    if (!stream || !(*stream)) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_stream = std::move(stream);
    g_global_options.log_path = path;
    // std::cerr keeps its own buffer; redirecting it crashes during static destruction
    return true;
}

void close_log_destination() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_stream.reset();
}

void log_message(LogLevel level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    std::string line = iso8601_now() + " [" + log_level_name(level) + "] " + message;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line << std::endl;
    if (g_log_stream && g_log_stream->is_open()) {
        (*g_log_stream) << line << std::endl;
    }
}

void log_trace(const std::string& message) {
    log_message(LogLevel::Trace, message);
}

void log_debug(const std::string& message) {
    log_message(LogLevel::Debug, message);
}

void log_info(const std::string& message) {
    log_message(LogLevel::Info, message);
}

void log_warn(const std::string& message) {
    log_message(LogLevel::Warn, message);
}

void log_error(const std::string& message) {
    log_message(LogLevel::Error, message);
}

std::string iso8601_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto seconds = system_clock::to_time_t(now);
    std::tm tm {};
    gmtime_r(&seconds, &tm);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T") << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}
