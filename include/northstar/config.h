#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "northstar/options.h"

using json = nlohmann::json;

struct ResourceLimits {
    long long memory = 0;
    long long cpu_shares = 0;
};

struct CgroupsConfig {
    std::string memory;
    std::string cpu;
};

struct DevicesConfig {
    std::string unshare_root;
    std::string loop_control;
    std::string loop_dev;
    std::string device_mapper;
    std::string device_mapper_dev;
    int loop_pool_size = 0;
    int mount_retries = 3;
    int mount_timeout_ms = 5000;
};

enum class StraceOutput {
    File,
    Log
};

struct StraceConfig {
    StraceOutput output = StraceOutput::File;
    std::string flags;
    std::string path = "strace";
};

struct PerfConfig {
    std::string path = "perf";
    std::string flags;
};

struct RuntimeDebugConfig {
    bool disable_mount_namespace = false;
};

struct DebugConfig {
    RuntimeDebugConfig runtime;
    std::optional<StraceConfig> strace;
    std::optional<PerfConfig> perf;
};

struct RepositoryConfig {
    std::string dir;
    std::string key;
};

enum class EndpointKind {
    Tcp,
    Unix
};

struct ConsoleEndpoint {
    EndpointKind kind = EndpointKind::Tcp;
    std::string host;
    int port = 0;
    std::string path;
};

struct Config {
    LogLevel log_level = LogLevel::Info;
    std::string console;
    std::string run_dir;
    std::string data_dir;
    std::string log_dir;
    CgroupsConfig cgroups;
    DevicesConfig devices;
    DebugConfig debug;
    std::map<std::string, RepositoryConfig> repositories;
    std::map<std::string, ResourceLimits> limits;
    int stop_timeout_ms = 5000;
};

Config load_config(const std::string& path);
Config parse_config(const json& j);
ConsoleEndpoint parse_console_endpoint(const std::string& uri);
void check_host_devices(const Config& config);

void from_json(const json& j, ResourceLimits& limits);
void from_json(const json& j, CgroupsConfig& cgroups);
void from_json(const json& j, DevicesConfig& devices);
void from_json(const json& j, StraceConfig& strace);
void from_json(const json& j, PerfConfig& perf);
void from_json(const json& j, DebugConfig& debug);
void from_json(const json& j, RepositoryConfig& repository);
void from_json(const json& j, Config& c);
