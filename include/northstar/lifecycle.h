#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "northstar/cgroups.h"
#include "northstar/config.h"
#include "northstar/error.h"
#include "northstar/mount.h"
#include "northstar/repository.h"
#include "northstar/state.h"
#include "northstar/supervisor.h"

struct StateEvent {
    std::string container;
    std::string ref;
    ContainerState state = ContainerState::Installed;
    std::optional<ExitStatus> exit;
    std::string error;
    std::string timestamp;

    json to_json() const;
};

struct ContainerInfo {
    // Empty while the package has never been started.
    std::string id;
    std::string ref;
    ContainerState state = ContainerState::Installed;
    pid_t pid = -1;
    std::string mount_point;
    ResourceLimits limits;
    std::optional<ExitStatus> exit;
    std::string error;

    json to_json() const;
};

json exit_status_json(const ExitStatus& status);

// Drives containers through their states. Every container reference has its own worker
// thread consuming an inbox, so operations on one container are serialized while
// different containers progress independently.
class Lifecycle {
public:
    using Listener = std::function<void(const StateEvent&)>;

    Lifecycle(const Config& config, RepositoryManager& repositories, MountEngine& mounts,
              CgroupController& cgroups, Supervisor& supervisor);
    ~Lifecycle();

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    int subscribe(Listener listener);
    void unsubscribe(int token);

    // Both block until the container settles and throw NorthstarError on failure.
    ContainerInfo start(const PackageRef& ref);
    ContainerInfo stop(const PackageRef& ref, std::chrono::milliseconds timeout);

    // target is an instance id or a name@version reference.
    ContainerInfo status(const std::string& target) const;
    std::vector<ContainerInfo> list() const;

    PackagePtr install(const std::string& repository, const std::string& npk_path);
    // Refused while an instance of the package is active.
    void uninstall(const PackageRef& ref);

    // Releases whatever a previous runtime left behind according to its state records.
    void reconcile();
    // Stops running containers in reverse start order and joins every worker.
    void shutdown();

private:
    struct Container {
        std::string id;
        PackagePtr package;
        ContainerState state = ContainerState::Installed;
        MountChain chain;
        CgroupHandle cgroup;
        ResourceLimits limits;
        pid_t pid = -1;
        std::optional<ExitStatus> exit;
        std::string error;
        uint64_t start_order = 0;
    };

    // Resources of a previous instance whose teardown failed.
    struct Leftover {
        std::string id;
        MountChain chain;
        CgroupHandle cgroup;
    };

    struct Message {
        enum class Kind {
            Start,
            Stop,
            Exited
        };

        Kind kind = Kind::Start;
        std::chrono::milliseconds timeout{0};
        std::string instance;
        ExitStatus exit;
        std::shared_ptr<std::promise<ContainerInfo>> reply;
    };

    struct Slot {
        PackageRef ref;
        mutable std::mutex mutex;
        std::condition_variable wakeup;
        std::deque<Message> inbox;
        bool closing = false;
        bool starting = false;
        std::atomic<bool> cancel{false};
        std::optional<Container> container;
        std::vector<Leftover> leftovers;
        std::thread worker;
    };

    Slot& slot_for(const PackageRef& ref);
    Slot* find_slot(const PackageRef& ref) const;
    std::future<ContainerInfo> post(Slot& slot, Message message, bool internal = false);
    void run_slot(Slot& slot);

    ContainerInfo handle_start(Slot& slot);
    ContainerInfo handle_stop(Slot& slot, std::chrono::milliseconds timeout);
    void handle_exited(Slot& slot, const Message& message);

    void transition(Slot& slot, ContainerState to, const std::function<void(Container&)>& update = nullptr);
    void fail(Slot& slot, const std::string& error);
    void abort_start(Slot& slot, pid_t pid);
    void finish_stop(Slot& slot, const std::optional<ExitStatus>& exit, std::string error, bool crashed);
    std::string teardown(Slot& slot);
    void release_leftovers(Slot& slot);
    void persist(const Container& container, const PackageRef& ref);
    void emit(const StateEvent& event);

    ContainerInfo info(const Slot& slot) const;
    static ContainerInfo info(const PackageRef& ref, const Container& container);
    ResourceLimits limits_for(const Package& package) const;
    LaunchSpec launch_spec(const Container& container) const;
    void on_process_exit(const std::string& instance, pid_t pid, const ExitStatus& status);
    void kill_orphans(const ContainerRecord& record);

    const Config& config_;
    RepositoryManager& repositories_;
    MountEngine& mounts_;
    CgroupController& cgroups_;
    Supervisor& supervisor_;

    mutable std::mutex slots_mutex_;
    std::map<PackageRef, std::unique_ptr<Slot>> slots_;
    std::map<std::string, PackageRef> instances_;
    bool shutting_down_ = false;
    bool shut_down_ = false;

    std::atomic<uint64_t> instance_counter_{0};
    std::atomic<uint64_t> start_counter_{0};

    std::mutex listeners_mutex_;
    std::map<int, Listener> listeners_;
    int next_listener_ = 1;
};
