#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

struct ExitStatus {
    enum class Kind {
        Exited,
        Signaled
    };

    Kind kind = Kind::Exited;
    int code = 0;

    static ExitStatus from_wait_status(int status);
    bool crashed() const { return kind == Kind::Signaled; }
    std::string to_string() const;
};

// Waits up to timeout_sec (forever when <= 0); kills and reaps the process on timeout.
bool wait_for_process(pid_t pid, int timeout_sec, int& status);
bool process_alive(pid_t pid);
// Undoes the runtime's signal setup in a forked child. Blocked masks and ignored
// dispositions survive exec.
void reset_child_signals();
std::vector<char*> to_argv(std::vector<std::string>& args);
