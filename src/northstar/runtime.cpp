#include "northstar/runtime.h"

#include <cerrno>

#include "northstar/debug.h"
#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/isolation.h"
#include "northstar/options.h"

Runtime::Runtime(Config config, RuntimeBackends backends) : config_(std::move(config)) {
    BlockDevices* devices = backends.devices;
    if (devices == nullptr) {
        own_devices_ = std::make_unique<KernelBlockDevices>(config_.devices);
        devices = own_devices_.get();
    }
    CgroupFs* cgroup_fs = backends.cgroups;
    if (cgroup_fs == nullptr) {
        own_cgroup_fs_ = std::make_unique<SysCgroupFs>();
        cgroup_fs = own_cgroup_fs_.get();
    }
    Launcher* launcher = backends.launcher;
    if (launcher == nullptr) {
        own_launcher_ = std::make_unique<IsolatedLauncher>();
        launcher = own_launcher_.get();
    }

    DebugSession debug = debug_session_from_config(config_.debug);
    if (!std::holds_alternative<NoDebug>(debug)) {
        log_warn(std::string("Debug instrumentation enabled: ") + debug_session_name(debug));
    }

    repositories_ = std::make_unique<RepositoryManager>(config_.repositories);
    mounts_ = std::make_unique<MountEngine>(*devices, config_.devices.mount_retries,
                                            std::chrono::milliseconds(config_.devices.mount_timeout_ms));
    cgroups_ = std::make_unique<CgroupController>(*cgroup_fs, config_.cgroups);
    supervisor_ = std::make_unique<Supervisor>(*launcher, std::move(debug), config_.log_dir);
    lifecycle_ = std::make_unique<Lifecycle>(config_, *repositories_, *mounts_, *cgroups_, *supervisor_);
    console_ = std::make_unique<ConsoleServer>(parse_console_endpoint(config_.console), *lifecycle_,
                                               config_.stop_timeout_ms);
}

Runtime::~Runtime() {
    shutdown();
}

void Runtime::start() {
    for (const std::string& dir : {config_.run_dir, config_.log_dir}) {
        if (!dir.empty() && !ensure_directory(dir, 0755)) {
            throw system_failure(ErrorCode::Io, "cannot create " + dir, errno);
        }
    }
    lifecycle_->reconcile();
    repositories_->scan_all();
    log_info("Loop pool has " + std::to_string(mounts_->pool().capacity()) + " devices");
    console_->start();
    log_info("northstar " + RUNTIME_VERSION + " ready");
}

void Runtime::shutdown() {
    if (console_) {
        console_->stop();
    }
    if (lifecycle_) {
        lifecycle_->shutdown();
    }
}
