#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

#include "northstar/debug.h"
#include "northstar/pipe.h"
#include "northstar/process.h"

struct LaunchSpec {
    std::string container_id;
    std::string name;
    std::string root;
    std::string init;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::vector<std::string> namespaces;
    std::vector<std::string> capabilities;
    bool mount_namespace = true;
    // Host directory bind mounted at /data, empty for none.
    std::string data_dir;
};

// A forked container process that has not executed its entrypoint yet.
struct SpawnedProcess {
    pid_t pid = -1;
    // Writing one byte releases the child; closing it makes the child exit.
    UniqueFd go;
    // Close-on-exec in the child: EOF means exec succeeded, data is a failure message.
    UniqueFd status;
};

class Launcher {
public:
    virtual ~Launcher() = default;

    virtual SpawnedProcess spawn(const LaunchSpec& spec) = 0;
};

// Child side of the start handshake.
bool wait_for_go(int go_fd);
void report_spawn_failure(int status_fd, const std::string& message);

class Supervisor {
public:
    using ExitCallback = std::function<void(const std::string& container_id, pid_t pid, const ExitStatus& status)>;

    Supervisor(Launcher& launcher, DebugSession debug, std::string log_dir);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void set_exit_callback(ExitCallback callback);

    // prepare runs before the child may execute anything (cgroup attach); cancelled is
    // checked right before the child is released.
    pid_t start(const LaunchSpec& spec,
                const std::function<void(pid_t)>& prepare,
                const std::function<bool()>& cancelled);

    // SIGTERM, then SIGKILL once timeout expires. Returns the reaped status.
    ExitStatus stop(pid_t pid, std::chrono::milliseconds timeout);

    // Drops the bookkeeping of an exited process.
    void release(pid_t pid);
    bool supervised(pid_t pid) const;

    const DebugSession& debug_session() const { return debug_; }

private:
    struct Supervised {
        std::string container_id;
        pid_t pid = -1;
        Instrument instrument;
        std::mutex mutex;
        std::condition_variable exited;
        std::optional<ExitStatus> exit;
        std::thread monitor;
    };

    void monitor(std::shared_ptr<Supervised> process);
    std::shared_ptr<Supervised> find(pid_t pid) const;

    Launcher& launcher_;
    DebugSession debug_;
    std::string log_dir_;

    mutable std::mutex mutex_;
    std::map<pid_t, std::shared_ptr<Supervised>> processes_;
    ExitCallback on_exit_;
};
