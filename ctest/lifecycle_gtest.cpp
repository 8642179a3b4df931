#include <algorithm>
#include <csignal>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

#include "northstar/cgroups.h"
#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/lifecycle.h"
#include "northstar/mount.h"
#include "northstar/repository.h"
#include "northstar/state.h"
#include "northstar/supervisor.h"
#include "test_support.h"

namespace {

const PackageRef HELLO{"hello", "0.1.0"};
const PackageRef WORLD{"world", "1.0"};

const auto SETTLE = std::chrono::milliseconds(10000);

pid_t spawn_sleeper() {
    pid_t pid = fork();
    if (pid == 0) {
        execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }
    return pid;
}

} // namespace

class LifecycleTest : public ::testing::Test {
protected:
    ScratchDir scratch{"ns-life"};
    SigningKey key;
    Config config = test_config(scratch.path());
    FakeBlockDevices devices;
    FakeCgroupFs cgroupfs{true};
    FakeLauncher launcher;
    EventLog events;

    std::unique_ptr<RepositoryManager> repositories;
    std::unique_ptr<MountEngine> mounts;
    std::unique_ptr<CgroupController> cgroups;
    std::unique_ptr<Supervisor> supervisor;
    std::unique_ptr<Lifecycle> lifecycle;

    void SetUp() override {
        ASSERT_TRUE(ensure_directory(repository_dir()));
        add_package("hello", "0.1.0", "sleep 30");
        add_package("world", "1.0", "sleep 30");
    }

    void TearDown() override {
        lifecycle.reset();
        supervisor.reset();
    }

    std::string repository_dir() const { return scratch.file("npk"); }

    void add_package(const std::string& name, const std::string& version, const std::string& script,
                     bool tamper = false) {
        write_npk(path_join(repository_dir(), name + "-" + version + ".npk"), test_manifest(name, version, script), key,
                  tamper);
    }

    void boot() {
        repositories = std::make_unique<RepositoryManager>();
        repositories->add(std::make_shared<Repository>("default", repository_dir(), key.public_key()));
        repositories->scan_all();
        mounts = std::make_unique<MountEngine>(devices, config.devices.mount_retries,
                                               std::chrono::milliseconds(config.devices.mount_timeout_ms));
        cgroups = std::make_unique<CgroupController>(cgroupfs, config.cgroups);
        supervisor = std::make_unique<Supervisor>(launcher, NoDebug{}, config.log_dir);
        lifecycle = std::make_unique<Lifecycle>(config, *repositories, *mounts, *cgroups, *supervisor);
        lifecycle->subscribe(events.listener());
    }

    void expect_released() {
        EXPECT_EQ(0u, devices.attached_loops());
        EXPECT_EQ(0u, devices.verity_targets());
        EXPECT_EQ(0u, devices.mounts());
        EXPECT_EQ(0u, mounts->pool().in_use());
        EXPECT_EQ(0u, cgroupfs.leaf_groups());
    }

    // A record of a container that was running when the previous runtime died.
    void leave_record(const std::string& id, pid_t pid) {
        ContainerRecord record;
        record.id = id;
        record.ref = "ghost@1.0";
        record.state = ContainerState::Running;
        record.pid = pid;
        record.cgroup_memory = "northstar/" + id;
        record.cgroup_cpu = record.cgroup_memory;
        ASSERT_TRUE(save_record(config.run_dir, record));
        cgroupfs.create_group(record.cgroup_memory);
    }

    std::string record_path(const std::string& id) const {
        return path_join(container_state_dir(config.run_dir, id), "state.json");
    }
};

TEST_F(LifecycleTest, StartAndStopWalkEveryState) {
    boot();
    ContainerInfo started = lifecycle->start(HELLO);
    EXPECT_EQ("hello-0.1.0-1", started.id);
    EXPECT_EQ(ContainerState::Running, started.state);
    EXPECT_GT(started.pid, 0);
    EXPECT_EQ(container_mount_point(config.run_dir, started.id), started.mount_point);
    EXPECT_TRUE(devices.mounted(started.mount_point));
    EXPECT_EQ(1u, cgroupfs.leaf_groups());
    EXPECT_EQ("67108864", cgroupfs.value("northstar/" + started.id, "memory.max"));
    EXPECT_EQ(std::to_string(started.pid), cgroupfs.value("northstar/" + started.id, "cgroup.procs"));
    EXPECT_TRUE(path_exists(record_path(started.id)));

    ASSERT_EQ(1u, launcher.launched().size());
    EXPECT_EQ(started.mount_point, launcher.launched()[0].root);
    EXPECT_EQ("/bin/sh", launcher.launched()[0].init);

    ContainerInfo stopped = lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    EXPECT_EQ(ContainerState::Stopped, stopped.state);
    ASSERT_TRUE(stopped.exit.has_value());
    EXPECT_TRUE(stopped.exit->crashed());
    EXPECT_EQ(SIGTERM, stopped.exit->code);
    EXPECT_EQ(-1, stopped.pid);

    const std::vector<ContainerState> expected = {
            ContainerState::Installed, ContainerState::Mounted, ContainerState::Starting,
            ContainerState::Running, ContainerState::Stopping, ContainerState::Stopped};
    EXPECT_EQ(expected, events.states(started.id));
    expect_released();
    EXPECT_FALSE(path_exists(record_path(started.id)));
    EXPECT_FALSE(path_exists(started.mount_point));
}

TEST_F(LifecycleTest, StoppedContainerCanStartAgain) {
    boot();
    lifecycle->start(HELLO);
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    ContainerInfo again = lifecycle->start(HELLO);
    EXPECT_EQ("hello-0.1.0-2", again.id);
    EXPECT_EQ(ContainerState::Running, again.state);
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
}

TEST_F(LifecycleTest, IntegrityMismatchFailsWithoutLeaks) {
    devices.integrity_failure = true;
    boot();
    EXPECT_EQ(ErrorCode::IntegrityMismatch, error_code_of([&] { lifecycle->start(HELLO); }));

    const std::vector<ContainerState> expected = {ContainerState::Installed, ContainerState::Failed};
    EXPECT_EQ(expected, events.states("hello-0.1.0-1"));
    ContainerInfo status = lifecycle->status("hello-0.1.0-1");
    EXPECT_EQ(ContainerState::Failed, status.state);
    EXPECT_FALSE(status.error.empty());
    EXPECT_TRUE(launcher.launched().empty());
    expect_released();

    devices.integrity_failure = false;
    EXPECT_EQ(ContainerState::Running, lifecycle->start(HELLO).state);
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
}

TEST_F(LifecycleTest, ExhaustedLoopPoolLeavesRunningContainersAlone) {
    devices.capacity = 1;
    boot();
    ContainerInfo hello = lifecycle->start(HELLO);
    EXPECT_EQ(ErrorCode::ResourceExhausted, error_code_of([&] { lifecycle->start(WORLD); }));

    EXPECT_EQ(ContainerState::Failed, lifecycle->status("world@1.0").state);
    EXPECT_EQ(ContainerState::Running, lifecycle->status(hello.id).state);
    EXPECT_TRUE(devices.mounted(hello.mount_point));
    EXPECT_TRUE(process_alive(hello.pid));

    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    EXPECT_EQ(ContainerState::Running, lifecycle->start(WORLD).state);
    lifecycle->stop(WORLD, std::chrono::milliseconds(2000));
    expect_released();
}

TEST_F(LifecycleTest, CrashEndsInFailed) {
    add_package("crasher", "1.0", "sleep 0.2; kill -KILL $$");
    boot();
    ContainerInfo started = lifecycle->start(PackageRef{"crasher", "1.0"});
    ASSERT_TRUE(events.wait_for(started.id, ContainerState::Failed, SETTLE));

    const std::vector<ContainerState> expected = {
            ContainerState::Installed, ContainerState::Mounted, ContainerState::Starting,
            ContainerState::Running, ContainerState::Stopping, ContainerState::Failed};
    EXPECT_EQ(expected, events.states(started.id));

    const std::vector<StateEvent> all = events.events();
    auto failed = std::find_if(all.begin(), all.end(), [&](const StateEvent& event) {
        return event.container == started.id && event.state == ContainerState::Failed;
    });
    ASSERT_NE(all.end(), failed);
    ASSERT_TRUE(failed->exit.has_value());
    EXPECT_EQ(SIGKILL, failed->exit->code);
    EXPECT_EQ(0u, failed->error.find("crashed"));
    EXPECT_EQ("crasher@1.0", failed->ref);
    EXPECT_EQ((json{{"signaled", SIGKILL}}), failed->to_json()["exit"]);
    expect_released();
}

TEST_F(LifecycleTest, CleanExitEndsInStopped) {
    add_package("oneshot", "1.0", "sleep 0.2; exit 0");
    boot();
    ContainerInfo started = lifecycle->start(PackageRef{"oneshot", "1.0"});
    ASSERT_TRUE(events.wait_for(started.id, ContainerState::Stopped, SETTLE));
    ContainerInfo status = lifecycle->status(started.id);
    EXPECT_EQ(ContainerState::Stopped, status.state);
    ASSERT_TRUE(status.exit.has_value());
    EXPECT_FALSE(status.exit->crashed());
    EXPECT_EQ(0, status.exit->code);
    EXPECT_TRUE(status.error.empty());
    expect_released();
}

TEST_F(LifecycleTest, StopDuringStartCancelsIt) {
    devices.mount_delay_ms = 500;
    boot();
    auto pending = std::async(std::launch::async, [&] { return lifecycle->start(HELLO); });
    ASSERT_TRUE(events.wait_for("hello-0.1.0-1", ContainerState::Installed, SETTLE));

    ContainerInfo stopped = lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    EXPECT_EQ(ContainerState::Stopped, stopped.state);
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { pending.get(); }));

    std::vector<ContainerState> states = events.states("hello-0.1.0-1");
    EXPECT_EQ(states.end(), std::find(states.begin(), states.end(), ContainerState::Running));
    EXPECT_EQ(ContainerState::Stopped, states.back());
    EXPECT_TRUE(launcher.launched().empty());
    expect_released();
}

TEST_F(LifecycleTest, RejectsInvalidRequests) {
    add_package("evil", "1.0", "sleep 30", true);
    boot();
    EXPECT_EQ(ErrorCode::NotFound,
              error_code_of([&] { lifecycle->stop(PackageRef{"missing", "1.0"}, std::chrono::milliseconds(10)); }));
    EXPECT_EQ(ErrorCode::SignatureInvalid, error_code_of([&] { lifecycle->start(PackageRef{"evil", "1.0"}); }));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { lifecycle->start(PackageRef{"missing", "1.0"}); }));
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { lifecycle->stop(HELLO, std::chrono::milliseconds(10)); }));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { lifecycle->status("nothing-1.0-7"); }));

    lifecycle->start(HELLO);
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { lifecycle->start(HELLO); }));
    EXPECT_EQ(1u, launcher.launched().size());
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
}

TEST_F(LifecycleTest, ListReportsEveryPackage) {
    boot();
    lifecycle->start(HELLO);
    std::vector<ContainerInfo> containers = lifecycle->list();
    ASSERT_EQ(2u, containers.size());
    for (const auto& info : containers) {
        if (info.ref == "hello@0.1.0") {
            EXPECT_EQ(ContainerState::Running, info.state);
            EXPECT_EQ("hello-0.1.0-1", info.id);
        } else {
            EXPECT_EQ("world@1.0", info.ref);
            EXPECT_EQ(ContainerState::Installed, info.state);
            EXPECT_TRUE(info.id.empty());
            EXPECT_EQ(512, info.limits.cpu_shares);
        }
    }
    json hello = lifecycle->status("hello@0.1.0").to_json();
    EXPECT_EQ("running", hello["state"]);
    EXPECT_EQ("hello-0.1.0-1", hello["id"]);
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
}

TEST_F(LifecycleTest, ConfiguredLimitsOverrideManifest) {
    ResourceLimits limits;
    limits.memory = 128 * 1024 * 1024;
    config.limits["hello"] = limits;
    boot();
    ContainerInfo started = lifecycle->start(HELLO);
    EXPECT_EQ(128 * 1024 * 1024, started.limits.memory);
    EXPECT_EQ(512, started.limits.cpu_shares);
    EXPECT_EQ("134217728", cgroupfs.value("northstar/" + started.id, "memory.max"));
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
}

TEST_F(LifecycleTest, UninstallIsRefusedWhileRunning) {
    boot();
    lifecycle->start(HELLO);
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { lifecycle->uninstall(HELLO); }));
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    lifecycle->uninstall(HELLO);
    EXPECT_FALSE(path_exists(path_join(repository_dir(), "hello-0.1.0.npk")));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { lifecycle->start(HELLO); }));
}

TEST_F(LifecycleTest, InstallMakesPackageStartable) {
    boot();
    const std::string upload = scratch.file("fresh.npk");
    write_npk(upload, test_manifest("fresh", "2.0"), key);
    PackagePtr installed = lifecycle->install("default", upload);
    EXPECT_EQ("fresh@2.0", installed->ref().to_string());
    EXPECT_EQ(ContainerState::Running, lifecycle->start(PackageRef{"fresh", "2.0"}).state);
    lifecycle->stop(PackageRef{"fresh", "2.0"}, std::chrono::milliseconds(2000));
}

TEST_F(LifecycleTest, ReconcileReleasesLeftovers) {
    const std::string mount_point = container_mount_point(config.run_dir, "ghost-1.0-3");
    ASSERT_TRUE(ensure_directory(mount_point));
    ContainerRecord record;
    record.id = "ghost-1.0-3";
    record.ref = "ghost@1.0";
    record.state = ContainerState::Running;
    record.mount_point = mount_point;
    record.verity_name = "northstar-ghost-1.0-3";
    record.loop_device = "/dev/loop7";
    record.cgroup_memory = "northstar/ghost-1.0-3";
    record.cgroup_cpu = "northstar/ghost-1.0-3";
    ASSERT_TRUE(save_record(config.run_dir, record));
    cgroupfs.create_group("northstar/ghost-1.0-3");

    boot();
    lifecycle->reconcile();
    EXPECT_TRUE(load_records(config.run_dir).empty());
    EXPECT_FALSE(cgroupfs.exists("northstar/ghost-1.0-3"));
    EXPECT_FALSE(path_exists(mount_point));
}

TEST_F(LifecycleTest, ReconcileKillsProcessesLeftInTheCgroup) {
    pid_t orphan = spawn_sleeper();
    ASSERT_GT(orphan, 0);
    auto reaped = std::async(std::launch::async, [orphan] {
        int status = 0;
        waitpid(orphan, &status, 0);
        return status;
    });
    leave_record("ghost-1.0-4", orphan);
    cgroupfs.write_value("northstar/ghost-1.0-4", "cgroup.procs", std::to_string(orphan));

    boot();
    lifecycle->reconcile();
    int status = reaped.get();
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(SIGKILL, WTERMSIG(status));
    EXPECT_FALSE(cgroupfs.exists("northstar/ghost-1.0-4"));
    EXPECT_TRUE(load_records(config.run_dir).empty());
}

TEST_F(LifecycleTest, ReconcileSparesReusedPids) {
    pid_t bystander = spawn_sleeper();
    ASSERT_GT(bystander, 0);
    leave_record("ghost-1.0-5", bystander);

    boot();
    lifecycle->reconcile();
    EXPECT_TRUE(process_alive(bystander));
    EXPECT_TRUE(load_records(config.run_dir).empty());

    kill(bystander, SIGKILL);
    int status = 0;
    waitpid(bystander, &status, 0);
}

TEST_F(LifecycleTest, RestartForgetsPreviousInstances) {
    boot();
    for (int i = 0; i < 3; ++i) {
        lifecycle->start(HELLO);
        lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    }
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { lifecycle->status("hello-0.1.0-1"); }));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { lifecycle->status("hello-0.1.0-2"); }));
    EXPECT_EQ(ContainerState::Stopped, lifecycle->status("hello-0.1.0-3").state);
}

TEST_F(LifecycleTest, FailedUnmountIsRetriedByTheNextStart) {
    devices.capacity = 1;
    boot();
    ContainerInfo first = lifecycle->start(HELLO);
    devices.unmount_failures = 1;
    ContainerInfo stopped = lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    EXPECT_EQ(ContainerState::Failed, stopped.state);
    EXPECT_NE(std::string::npos, stopped.error.find("busy"));
    EXPECT_TRUE(devices.mounted(first.mount_point));
    EXPECT_EQ(1u, mounts->pool().in_use());

    ContainerInfo second = lifecycle->start(HELLO);
    EXPECT_EQ(ContainerState::Running, second.state);
    EXPECT_FALSE(devices.mounted(first.mount_point));
    EXPECT_EQ(1u, mounts->pool().in_use());
    lifecycle->stop(HELLO, std::chrono::milliseconds(2000));
    expect_released();
}

TEST_F(LifecycleTest, ShutdownRetriesFailedUnmount) {
    boot();
    lifecycle->start(HELLO);
    devices.unmount_failures = 1;
    EXPECT_EQ(ContainerState::Failed, lifecycle->stop(HELLO, std::chrono::milliseconds(2000)).state);
    EXPECT_EQ(1u, devices.mounts());
    lifecycle->shutdown();
    expect_released();
}

TEST_F(LifecycleTest, ShutdownStopsInReverseStartOrder) {
    boot();
    ContainerInfo hello = lifecycle->start(HELLO);
    ContainerInfo world = lifecycle->start(WORLD);
    lifecycle->shutdown();

    const std::vector<StateEvent> all = events.events();
    auto stopped_at = [&](const std::string& id) {
        return std::find_if(all.begin(), all.end(), [&](const StateEvent& event) {
            return event.container == id && event.state == ContainerState::Stopped;
        });
    };
    ASSERT_NE(all.end(), stopped_at(hello.id));
    ASSERT_NE(all.end(), stopped_at(world.id));
    EXPECT_LT(stopped_at(world.id), stopped_at(hello.id));
    EXPECT_FALSE(process_alive(hello.pid));
    EXPECT_FALSE(process_alive(world.pid));
    expect_released();

    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { lifecycle->start(HELLO); }));
}
