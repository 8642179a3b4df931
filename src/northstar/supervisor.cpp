#include "northstar/supervisor.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/options.h"

namespace {

constexpr int SPAWN_ATTEMPTS = 3;
constexpr auto INSTRUMENT_ATTACH_TIMEOUT = std::chrono::seconds(5);
constexpr auto KILL_REAP_TIMEOUT = std::chrono::seconds(10);

void abort_child(SpawnedProcess& child) {
    child.go.reset();
    if (child.pid > 0) {
        kill(child.pid, SIGKILL);
        int status = 0;
        while (waitpid(child.pid, &status, 0) == -1 && errno == EINTR) {
        }
        child.pid = -1;
    }
}

} // namespace

bool wait_for_go(int go_fd) {
    char go = 0;
    ssize_t n;
    do {
        n = read(go_fd, &go, 1);
    } while (n < 0 && errno == EINTR);
    return n == 1;
}

void report_spawn_failure(int status_fd, const std::string& message) {
    write_all(status_fd, message);
    _exit(127);
}

Supervisor::Supervisor(Launcher& launcher, DebugSession debug, std::string log_dir)
    : launcher_(launcher), debug_(std::move(debug)), log_dir_(std::move(log_dir)) {}

Supervisor::~Supervisor() {
    std::map<pid_t, std::shared_ptr<Supervised>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(processes_);
        on_exit_ = nullptr;
    }
    for (auto& entry : remaining) {
        auto& process = entry.second;
        {
            std::lock_guard<std::mutex> lock(process->mutex);
            if (!process->exit) {
                log_warn("Killing supervised process " + std::to_string(process->pid) + " of " +
                         process->container_id);
                kill(process->pid, SIGKILL);
            }
        }
        if (process->monitor.joinable()) {
            process->monitor.join();
        }
    }
}

void Supervisor::set_exit_callback(ExitCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_exit_ = std::move(callback);
}

pid_t Supervisor::start(const LaunchSpec& spec,
                        const std::function<void(pid_t)>& prepare,
                        const std::function<bool()>& cancelled) {
    SpawnedProcess child;
    for (int attempt = 1;; ++attempt) {
        try {
            child = launcher_.spawn(spec);
            break;
        } catch (const NorthstarError& e) {
            if (attempt >= SPAWN_ATTEMPTS) {
                throw;
            }
            log_warn("Spawn attempt " + std::to_string(attempt) + " for " + spec.container_id + " failed: " + e.what());
        }
    }
    log_debug("Spawned " + spec.container_id + " as pid " + std::to_string(child.pid));

    auto process = std::make_shared<Supervised>();
    process->container_id = spec.container_id;
    process->pid = child.pid;
    try {
        if (prepare) {
            prepare(child.pid);
        }
        attach_instrument(process->instrument, debug_, child.pid, spec.name, log_dir_, INSTRUMENT_ATTACH_TIMEOUT);
        if (cancelled && cancelled()) {
            throw NorthstarError(ErrorCode::InvalidState, "start of " + spec.container_id + " cancelled");
        }
        const char go = 1;
        if (!write_all(child.go.get(), &go, 1)) {
            throw system_failure(ErrorCode::ProcessSpawnFailure, "cannot release " + spec.container_id, errno);
        }
    } catch (const NorthstarError&) {
        detach_instrument(process->instrument);
        abort_child(child);
        throw;
    }
    child.go.reset();

    std::string failure;
    if (!read_to_end(child.status.get(), failure)) {
        failure = "cannot read start status";
    }
    if (!failure.empty()) {
        int status = 0;
        while (waitpid(child.pid, &status, 0) == -1 && errno == EINTR) {
        }
        detach_instrument(process->instrument);
        throw NorthstarError(ErrorCode::ProcessSpawnFailure, spec.container_id + ": " + failure);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes_[child.pid] = process;
        process->monitor = std::thread(&Supervisor::monitor, this, process);
    }
    log_info("Started " + spec.container_id + " (pid " + std::to_string(child.pid) + ")");
    return child.pid;
}

void Supervisor::monitor(std::shared_ptr<Supervised> process) {
    int status = 0;
    pid_t result;
    do {
        result = waitpid(process->pid, &status, 0);
    } while (result == -1 && errno == EINTR);

    ExitStatus exit_status;
    if (result == process->pid) {
        exit_status = ExitStatus::from_wait_status(status);
    } else {
        log_error("waitpid on " + std::to_string(process->pid) + " failed: " + std::strerror(errno));
        exit_status.kind = ExitStatus::Kind::Signaled;
        exit_status.code = SIGKILL;
    }
    detach_instrument(process->instrument);
    {
        std::lock_guard<std::mutex> lock(process->mutex);
        process->exit = exit_status;
    }
    process->exited.notify_all();
    log_info(process->container_id + " (pid " + std::to_string(process->pid) + ") " + exit_status.to_string());

    ExitCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_exit_;
    }
    if (callback) {
        callback(process->container_id, process->pid, exit_status);
    }
}

std::shared_ptr<Supervisor::Supervised> Supervisor::find(pid_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    if (it == processes_.end()) {
        throw NorthstarError(ErrorCode::NotFound, "pid " + std::to_string(pid) + " is not supervised");
    }
    return it->second;
}

ExitStatus Supervisor::stop(pid_t pid, std::chrono::milliseconds timeout) {
    auto process = find(pid);
    std::unique_lock<std::mutex> lock(process->mutex);
    if (!process->exit) {
        log_debug("Sending SIGTERM to " + process->container_id);
        kill(pid, SIGTERM);
    }
    if (!process->exited.wait_for(lock, timeout, [&] { return process->exit.has_value(); })) {
        log_warn(process->container_id + " ignored SIGTERM for " + std::to_string(timeout.count()) +
                 "ms, sending SIGKILL");
        kill(pid, SIGKILL);
        if (!process->exited.wait_for(lock, KILL_REAP_TIMEOUT, [&] { return process->exit.has_value(); })) {
            throw NorthstarError(ErrorCode::Timeout, process->container_id + " survived SIGKILL");
        }
    }
    return *process->exit;
}

void Supervisor::release(pid_t pid) {
    std::shared_ptr<Supervised> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(pid);
        if (it == processes_.end()) {
            return;
        }
        process = it->second;
        processes_.erase(it);
    }
    if (process->monitor.joinable()) {
        if (process->monitor.get_id() == std::this_thread::get_id()) {
            process->monitor.detach();
        } else {
            process->monitor.join();
        }
    }
}

bool Supervisor::supervised(pid_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.count(pid) != 0;
}
