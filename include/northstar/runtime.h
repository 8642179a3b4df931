#pragma once

#include <memory>

#include "northstar/cgroups.h"
#include "northstar/config.h"
#include "northstar/console.h"
#include "northstar/devices.h"
#include "northstar/lifecycle.h"
#include "northstar/mount.h"
#include "northstar/repository.h"
#include "northstar/supervisor.h"

// Kernel facing back ends. Null members are replaced by the real implementations.
struct RuntimeBackends {
    BlockDevices* devices = nullptr;
    CgroupFs* cgroups = nullptr;
    Launcher* launcher = nullptr;
};

class Runtime {
public:
    explicit Runtime(Config config, RuntimeBackends backends = RuntimeBackends());
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Cleans up after a previous run, indexes the repositories and opens the console.
    void start();
    void shutdown();

    const Config& config() const { return config_; }
    Lifecycle& lifecycle() { return *lifecycle_; }
    ConsoleServer& console() { return *console_; }
    RepositoryManager& repositories() { return *repositories_; }

private:
    Config config_;

    std::unique_ptr<BlockDevices> own_devices_;
    std::unique_ptr<CgroupFs> own_cgroup_fs_;
    std::unique_ptr<Launcher> own_launcher_;

    std::unique_ptr<RepositoryManager> repositories_;
    std::unique_ptr<MountEngine> mounts_;
    std::unique_ptr<CgroupController> cgroups_;
    std::unique_ptr<Supervisor> supervisor_;
    std::unique_ptr<Lifecycle> lifecycle_;
    std::unique_ptr<ConsoleServer> console_;
};
