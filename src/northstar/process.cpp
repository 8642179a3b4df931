#include "northstar/process.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

ExitStatus ExitStatus::from_wait_status(int status) {
    ExitStatus exit_status;
    if (WIFSIGNALED(status)) {
        exit_status.kind = Kind::Signaled;
        exit_status.code = WTERMSIG(status);
    } else {
        exit_status.kind = Kind::Exited;
        exit_status.code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
    }
    return exit_status;
}

std::string ExitStatus::to_string() const {
    if (kind == Kind::Signaled) {
        const char* name = strsignal(code);
        return "signaled " + std::to_string(code) + (name ? std::string(" (") + name + ")" : "");
    }
    return "exited " + std::to_string(code);
}

bool wait_for_process(pid_t pid, int timeout_sec, int& status) {
    if (timeout_sec <= 0) {
        pid_t result;
        do {
            result = waitpid(pid, &status, 0);
        } while (result == -1 && errno == EINTR);
        return result == pid;
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    while (true) {
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return true;
        }
        if (result == -1 && errno != EINTR) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            errno = ETIMEDOUT;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

bool process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return kill(pid, 0) == 0 || errno == EPERM;
}

void reset_child_signals() {
    for (int signum : {SIGPIPE, SIGINT, SIGTERM}) {
        signal(signum, SIG_DFL);
    }
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
}

std::vector<char*> to_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}
