#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>
#include <thread>
#include <variant>
#include <vector>

#include "northstar/config.h"
#include "northstar/pipe.h"

struct NoDebug {};

struct TraceDebug {
    StraceOutput output = StraceOutput::File;
    std::string flags;
    std::string path = "strace";
};

struct ProfileDebug {
    std::string flags;
    std::string path = "perf";
};

using DebugSession = std::variant<NoDebug, TraceDebug, ProfileDebug>;

DebugSession debug_session_from_config(const DebugConfig& config);
const char* debug_session_name(const DebugSession& session);

// A running strace or perf process bound to one container process.
struct Instrument {
    pid_t pid = -1;
    std::string output_path;
    std::thread log_forwarder;

    Instrument() = default;
    Instrument(Instrument&&) = default;
    Instrument& operator=(Instrument&&) = default;
    ~Instrument();
};

std::vector<std::string> instrument_command(const DebugSession& session, pid_t target, const std::string& name,
                                            const std::string& log_dir, std::string& output_path);

// Starts the instrument and blocks until it has attached to target.
void attach_instrument(Instrument& instrument, const DebugSession& session, pid_t target, const std::string& name,
                       const std::string& log_dir, std::chrono::milliseconds timeout);
// Gives the instrument a grace period to flush, then kills and reaps it.
void detach_instrument(Instrument& instrument);
