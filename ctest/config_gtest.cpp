#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <variant>

#include "northstar/config.h"
#include "northstar/debug.h"
#include "northstar/error.h"
#include "northstar/options.h"
#include "test_support.h"

namespace {

json minimal_config() {
    return json{
            {"log_level", "DEBUG"},
            {"console", "tcp://127.0.0.1:4200"},
            {"run_dir", "/run/northstar"},
            {"data_dir", "/data"},
            {"log_dir", "/var/log/northstar"},
            {"cgroups", {{"memory", "northstar"}, {"cpu", "northstar"}}},
            {"devices", {
                    {"unshare_root", "/"},
                    {"loop_control", "/dev/loop-control"},
                    {"loop_dev", "/dev/loop"},
                    {"device_mapper", "/dev/mapper/control"},
                    {"device_mapper_dev", "/dev/dm-"}
            }},
            {"repositories", {{"default", {{"dir", "/data/npk"}, {"key", "/etc/northstar/key.pub"}}}}}
    };
}

ErrorCode config_error_code(const json& j) {
    try {
        parse_config(j);
    } catch (const NorthstarError& e) {
        return e.code();
    }
    return ErrorCode::Io;
}

} // namespace

TEST(ConfigTest, ParsesDocumentedKeysAndDefaults) {
    Config config = parse_config(minimal_config());
    EXPECT_EQ(LogLevel::Debug, config.log_level);
    EXPECT_EQ("/run/northstar", config.run_dir);
    EXPECT_EQ("northstar", config.cgroups.memory);
    EXPECT_EQ("/dev/mapper/control", config.devices.device_mapper);
    EXPECT_EQ(3, config.devices.mount_retries);
    EXPECT_EQ(5000, config.devices.mount_timeout_ms);
    EXPECT_EQ(5000, config.stop_timeout_ms);
    EXPECT_FALSE(config.debug.runtime.disable_mount_namespace);
    EXPECT_FALSE(config.debug.strace.has_value());
    ASSERT_EQ(1u, config.repositories.count("default"));
    EXPECT_EQ("/data/npk", config.repositories.at("default").dir);
}

TEST(ConfigTest, ParsesOptionalSections) {
    json j = minimal_config();
    j["log_level"] = "warn";
    j["devices"]["loop_pool_size"] = 8;
    j["limits"] = {{"hello", {{"memory", 1048576}}}};
    j["stop_timeout_ms"] = 1500;
    j["debug"] = {
            {"runtime", {{"disable_mount_namespace", true}}},
            {"strace", {{"output", "log"}, {"flags", "-f -s 256"}}}
    };
    Config config = parse_config(j);
    EXPECT_EQ(LogLevel::Warn, config.log_level);
    EXPECT_EQ(8, config.devices.loop_pool_size);
    EXPECT_EQ(1048576, config.limits.at("hello").memory);
    EXPECT_EQ(0, config.limits.at("hello").cpu_shares);
    EXPECT_EQ(1500, config.stop_timeout_ms);
    EXPECT_TRUE(config.debug.runtime.disable_mount_namespace);
    ASSERT_TRUE(config.debug.strace.has_value());
    EXPECT_EQ(StraceOutput::Log, config.debug.strace->output);
    EXPECT_EQ("strace", config.debug.strace->path);
}

TEST(ConfigTest, RejectsInvalidDocuments) {
    json bad_level = minimal_config();
    bad_level["log_level"] = "LOUD";
    EXPECT_EQ(ErrorCode::ConfigError, config_error_code(bad_level));

    json missing_devices = minimal_config();
    missing_devices.erase("devices");
    EXPECT_EQ(ErrorCode::ConfigError, config_error_code(missing_devices));

    json bad_console = minimal_config();
    bad_console["console"] = "http://localhost:80";
    EXPECT_EQ(ErrorCode::ConfigError, config_error_code(bad_console));

    json bad_strace = minimal_config();
    bad_strace["debug"] = {{"strace", {{"output", "tty"}}}};
    EXPECT_EQ(ErrorCode::ConfigError, config_error_code(bad_strace));

    json bad_retries = minimal_config();
    bad_retries["devices"]["mount_retries"] = 0;
    EXPECT_EQ(ErrorCode::ConfigError, config_error_code(bad_retries));
}

TEST(ConfigTest, LoadConfigReportsMissingAndMalformedFiles) {
    ScratchDir dir("ns-config");
    EXPECT_THROW(load_config(dir.file("missing.json")), NorthstarError);

    std::ofstream(dir.file("broken.json")) << "{ not json";
    try {
        load_config(dir.file("broken.json"));
        FAIL() << "malformed configuration accepted";
    } catch (const NorthstarError& e) {
        EXPECT_EQ(ErrorCode::ConfigError, e.code());
    }

    std::ofstream(dir.file("good.json")) << minimal_config().dump(2);
    EXPECT_EQ("/data", load_config(dir.file("good.json")).data_dir);
}

TEST(ConfigTest, ParsesConsoleEndpoints) {
    ConsoleEndpoint tcp = parse_console_endpoint("tcp://localhost:4200");
    EXPECT_EQ(EndpointKind::Tcp, tcp.kind);
    EXPECT_EQ("localhost", tcp.host);
    EXPECT_EQ(4200, tcp.port);

    ConsoleEndpoint unix_socket = parse_console_endpoint("unix:///run/northstar/console");
    EXPECT_EQ(EndpointKind::Unix, unix_socket.kind);
    EXPECT_EQ("/run/northstar/console", unix_socket.path);

    EXPECT_THROW(parse_console_endpoint("tcp://localhost"), NorthstarError);
    EXPECT_THROW(parse_console_endpoint("tcp://localhost:99999"), NorthstarError);
    EXPECT_THROW(parse_console_endpoint("unix://"), NorthstarError);
}

TEST(ConfigTest, MissingHostDevicesAbortStartup) {
    ScratchDir dir("ns-config");
    Config config = parse_config(minimal_config());
    config.devices.loop_control = dir.file("loop-control");
    config.devices.device_mapper = dir.file("control");
    EXPECT_THROW(check_host_devices(config), NorthstarError);

    std::ofstream(config.devices.loop_control) << "";
    EXPECT_THROW(check_host_devices(config), NorthstarError);

    std::ofstream(config.devices.device_mapper) << "";
    EXPECT_NO_THROW(check_host_devices(config));
}

TEST(DebugSessionTest, StraceTakesPrecedenceOverPerf) {
    DebugConfig config;
    EXPECT_TRUE(std::holds_alternative<NoDebug>(debug_session_from_config(config)));

    config.perf = PerfConfig();
    EXPECT_TRUE(std::holds_alternative<ProfileDebug>(debug_session_from_config(config)));

    config.strace = StraceConfig();
    DebugSession session = debug_session_from_config(config);
    ASSERT_TRUE(std::holds_alternative<TraceDebug>(session));
    EXPECT_STREQ("strace", debug_session_name(session));
}

TEST(DebugSessionTest, BuildsInstrumentCommandLines) {
    TraceDebug trace;
    trace.flags = "-f -tt";
    std::string output;
    std::vector<std::string> strace = instrument_command(trace, 42, "hello", "/var/log/northstar", output);
    ASSERT_GE(strace.size(), 5u);
    EXPECT_EQ("strace", strace[0]);
    EXPECT_EQ("-f", strace[1]);
    EXPECT_EQ("-p", strace[2]);
    EXPECT_EQ("42", strace[3]);
    EXPECT_NE(strace.end(), std::find(strace.begin(), strace.end(), "-tt"));
    EXPECT_EQ("/var/log/northstar/strace-42-hello.log", output);

    ProfileDebug perf;
    std::vector<std::string> record = instrument_command(perf, 42, "hello", "/var/log/northstar", output);
    ASSERT_GE(record.size(), 2u);
    EXPECT_EQ("perf", record[0]);
    EXPECT_EQ("record", record[1]);
    EXPECT_EQ("/var/log/northstar/perf-42-hello.perf", output);
}

TEST(LoggingTest, ParsesLevelsCaseInsensitively) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("trace", level));
    EXPECT_EQ(LogLevel::Trace, level);
    EXPECT_TRUE(parse_log_level("ERROR", level));
    EXPECT_EQ(LogLevel::Error, level);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_STREQ("warn", log_level_name(LogLevel::Warn));
}

TEST(LoggingTest, Iso8601NowProducesZuluTimeStamp) {
    std::string ts = iso8601_now();
    EXPECT_FALSE(ts.empty());
    EXPECT_EQ('Z', ts.back());
    EXPECT_NE(std::string::npos, ts.find('T'));
}
