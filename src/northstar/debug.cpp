#include "northstar/debug.h"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/options.h"
#include "northstar/process.h"

namespace {

constexpr int INSTRUMENT_GRACE_SEC = 2;

bool traced(pid_t pid) {
    std::ifstream status("/proc/" + std::to_string(pid) + "/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 10, "TracerPid:") == 0) {
            std::istringstream iss(line.substr(10));
            pid_t tracer = 0;
            iss >> tracer;
            return tracer != 0;
        }
    }
    return false;
}

void forward_to_log(int fd, std::string prefix) {
    std::string pending;
    char buffer[1024];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        pending.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            log_info(prefix + pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }
    if (!pending.empty()) {
        log_info(prefix + pending);
    }
    close(fd);
}

} // namespace

Instrument::~Instrument() {
    if (log_forwarder.joinable()) {
        log_forwarder.join();
    }
}

DebugSession debug_session_from_config(const DebugConfig& config) {
    if (config.strace) {
        if (config.perf) {
            log_warn("debug.strace and debug.perf are both configured, only strace is attached");
        }
        TraceDebug trace;
        trace.output = config.strace->output;
        trace.flags = config.strace->flags;
        trace.path = config.strace->path;
        return trace;
    }
    if (config.perf) {
        ProfileDebug profile;
        profile.flags = config.perf->flags;
        profile.path = config.perf->path;
        return profile;
    }
    return NoDebug {};
}

const char* debug_session_name(const DebugSession& session) {
    if (std::holds_alternative<TraceDebug>(session)) {
        return "strace";
    }
    if (std::holds_alternative<ProfileDebug>(session)) {
        return "perf";
    }
    return "none";
}

std::vector<std::string> instrument_command(const DebugSession& session, pid_t target, const std::string& name,
                                            const std::string& log_dir, std::string& output_path) {
    std::vector<std::string> args;
    const std::string pid = std::to_string(target);
    if (const auto* trace = std::get_if<TraceDebug>(&session)) {
        // -f follows the fork into a pid namespace init.
        args = {trace->path, "-f", "-p", pid};
        for (auto& flag : split_whitespace(trace->flags)) {
            args.push_back(flag);
        }
        if (trace->output == StraceOutput::File) {
            output_path = path_join(log_dir, "strace-" + pid + "-" + name + ".log");
            args.push_back("-o");
            args.push_back(output_path);
        }
    } else if (const auto* profile = std::get_if<ProfileDebug>(&session)) {
        output_path = path_join(log_dir, "perf-" + pid + "-" + name + ".perf");
        args = {profile->path, "record", "-p", pid, "-o", output_path};
        for (auto& flag : split_whitespace(profile->flags)) {
            args.push_back(flag);
        }
    }
    return args;
}

void attach_instrument(Instrument& instrument, const DebugSession& session, pid_t target, const std::string& name,
                       const std::string& log_dir, std::chrono::milliseconds timeout) {
    if (std::holds_alternative<NoDebug>(session)) {
        return;
    }
    std::vector<std::string> args = instrument_command(session, target, name, log_dir, instrument.output_path);
    const auto* trace = std::get_if<TraceDebug>(&session);
    const bool to_log = trace && trace->output == StraceOutput::Log;

    Pipe output;
    if (to_log) {
        output = make_pipe();
    }
    std::vector<char*> argv = to_argv(args);

    pid_t pid = fork();
    if (pid == -1) {
        throw system_failure(ErrorCode::ProcessSpawnFailure, "fork for " + args[0] + " failed", errno);
    }
    if (pid == 0) {
        reset_child_signals();
        if (to_log && dup2(output.write.get(), STDERR_FILENO) == -1) {
            _exit(127);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }
    instrument.pid = pid;
    if (to_log) {
        output.write.reset();
        instrument.log_forwarder = std::thread(forward_to_log, output.read.release(), "strace " + name + ": ");
    }
    log_info("Started " + std::string(debug_session_name(session)) + " (pid " + std::to_string(pid) + ") on " + name);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        bool attached = trace ? traced(target) : path_exists(instrument.output_path);
        if (attached) {
            return;
        }
        int status = 0;
        if (waitpid(pid, &status, WNOHANG) == pid) {
            instrument.pid = -1;
            throw NorthstarError(ErrorCode::ProcessSpawnFailure,
                                 std::string(debug_session_name(session)) + " exited before attaching: " +
                                 ExitStatus::from_wait_status(status).to_string());
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            detach_instrument(instrument);
            throw NorthstarError(ErrorCode::Timeout,
                                 std::string(debug_session_name(session)) + " did not attach to " + name);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void detach_instrument(Instrument& instrument) {
    if (instrument.pid > 0) {
        // perf only writes its data on SIGINT
        kill(instrument.pid, SIGINT);
        int status = 0;
        if (!wait_for_process(instrument.pid, INSTRUMENT_GRACE_SEC, status)) {
            log_warn("Instrument " + std::to_string(instrument.pid) + " did not exit in time and was killed");
        }
        instrument.pid = -1;
    }
    if (instrument.log_forwarder.joinable()) {
        instrument.log_forwarder.join();
    }
}
