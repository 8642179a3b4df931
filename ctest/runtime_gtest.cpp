#include <csignal>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <vector>

#define main runtime_cli_main
#include "../main.cpp"
#undef main

#include "northstar/pipe.h"
#include "northstar/process.h"
#include "northstar/state.h"
#include "test_support.h"

namespace {

int run_parse(std::vector<std::string> args, CliOptions& options) {
    args.insert(args.begin(), "northstar");
    std::vector<char*> argv = to_argv(args);
    return parse_cli(static_cast<int>(args.size()), argv.data(), options);
}

int run_main(std::vector<std::string> args) {
    args.insert(args.begin(), "northstar");
    std::vector<char*> argv = to_argv(args);
    return runtime_cli_main(static_cast<int>(args.size()), argv.data());
}

json console_request(int fd, const json& request) {
    if (!send_frame(fd, request)) {
        return json();
    }
    json response;
    while (recv_frame(fd, response)) {
        if (!response.contains("event")) {
            return response;
        }
    }
    return json();
}

} // namespace

TEST(CliTest, DefaultsToConfigInWorkingDirectory) {
    CliOptions options;
    EXPECT_EQ(-1, run_parse({}, options));
    EXPECT_EQ("northstar.json", options.config_path);
    EXPECT_FALSE(options.debug);
}

TEST(CliTest, ParsesConfigAndDebug) {
    CliOptions options;
    EXPECT_EQ(-1, run_parse({"--config", "/etc/northstar/runtime.json", "--debug"}, options));
    EXPECT_EQ("/etc/northstar/runtime.json", options.config_path);
    EXPECT_TRUE(options.debug);
}

TEST(CliTest, VersionAndHelpExitEarly) {
    CliOptions options;
    EXPECT_EQ(0, run_parse({"--version"}, options));
    EXPECT_EQ(0, run_parse({"--help"}, options));
}

TEST(CliTest, RejectsUnknownArguments) {
    CliOptions options;
    EXPECT_EQ(1, run_parse({"--frobnicate"}, options));
    EXPECT_EQ(1, run_parse({"stray"}, options));
    EXPECT_EQ(1, run_parse({"--config"}, options));
}

TEST(CliTest, MissingConfigurationFailsStartup) {
    ScratchDir scratch("ns-cli");
    EXPECT_EQ(1, run_main({"--config", scratch.file("absent.json")}));
    std::ofstream(scratch.file("broken.json")) << "{ not json";
    EXPECT_EQ(1, run_main({"--config", scratch.file("broken.json")}));
}

class RuntimeTest : public ::testing::Test {
protected:
    ScratchDir scratch{"ns-rt"};
    SigningKey key;
    Config config = test_config(scratch.path());
    FakeBlockDevices devices;
    FakeCgroupFs cgroupfs{true};
    FakeLauncher launcher;

    void SetUp() override {
        signal(SIGPIPE, SIG_IGN);
        const std::string dir = scratch.file("npk");
        ASSERT_TRUE(ensure_directory(dir));
        key.write_public(scratch.file("key.pub"));
        write_npk(path_join(dir, "hello-0.1.0.npk"), test_manifest("hello", "0.1.0"), key);
        config.repositories["default"] = RepositoryConfig{dir, scratch.file("key.pub")};
    }

    RuntimeBackends backends() {
        RuntimeBackends result;
        result.devices = &devices;
        result.cgroups = &cgroupfs;
        result.launcher = &launcher;
        return result;
    }

    UniqueFd connect() {
        UniqueFd fd = connect_console(parse_console_endpoint(config.console));
        timeval timeout{10, 0};
        setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        return fd;
    }
};

TEST_F(RuntimeTest, ServesContainersOverTheConsole) {
    Runtime runtime(config, backends());
    runtime.start();
    EXPECT_TRUE(is_directory(config.run_dir));
    EXPECT_TRUE(is_directory(config.log_dir));

    UniqueFd fd = connect();
    json list = console_request(fd.get(), {{"id", 1}, {"request", "list"}});
    ASSERT_EQ("ok", list["response"]) << list.dump();
    ASSERT_EQ(1u, list["payload"].size());

    json started = console_request(fd.get(), {{"id", 2}, {"request", "start"}, {"ref", "hello@0.1.0"}});
    ASSERT_EQ("ok", started["response"]) << started.dump();
    EXPECT_EQ("running", started["payload"]["state"]);

    json stopped = console_request(fd.get(), {{"id", 3}, {"request", "stop"}, {"ref", "hello@0.1.0"}});
    EXPECT_EQ("stopped", stopped["payload"]["state"]);
    EXPECT_EQ(0u, devices.attached_loops());
    EXPECT_EQ(0u, cgroupfs.leaf_groups());
}

TEST_F(RuntimeTest, ShutdownStopsRunningContainers) {
    pid_t pid;
    {
        Runtime runtime(config, backends());
        runtime.start();
        ContainerInfo info = runtime.lifecycle().start(PackageRef{"hello", "0.1.0"});
        pid = info.pid;
        ASSERT_TRUE(process_alive(pid));
        runtime.shutdown();
        EXPECT_FALSE(path_exists(path_join(container_state_dir(config.run_dir, info.id), "state.json")));
    }
    EXPECT_FALSE(process_alive(pid));
    EXPECT_EQ(0u, devices.mounts());
    EXPECT_EQ(0u, cgroupfs.leaf_groups());
    EXPECT_THROW(connect_console(parse_console_endpoint(config.console)), NorthstarError);
}

TEST_F(RuntimeTest, StartReconcilesPreviousRun) {
    ContainerRecord record;
    record.id = "hello-0.1.0-4";
    record.ref = "hello@0.1.0";
    record.state = ContainerState::Starting;
    record.cgroup_memory = "northstar/hello-0.1.0-4";
    record.cgroup_cpu = record.cgroup_memory;
    ASSERT_TRUE(save_record(config.run_dir, record));
    cgroupfs.create_group(record.cgroup_memory);

    Runtime runtime(config, backends());
    runtime.start();
    EXPECT_TRUE(load_records(config.run_dir).empty());
    EXPECT_FALSE(cgroupfs.exists(record.cgroup_memory));
    EXPECT_EQ(ContainerState::Running, runtime.lifecycle().start(PackageRef{"hello", "0.1.0"}).state);
}

TEST_F(RuntimeTest, RejectsBadRepositoryKey) {
    config.repositories["default"].key = scratch.file("missing.pub");
    EXPECT_EQ(ErrorCode::ConfigError, error_code_of([&] { Runtime runtime(config, backends()); }));
}
