#include "northstar/config.h"

#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

#include "northstar/error.h"

void from_json(const json& j, ResourceLimits& limits) {
    if (j.contains("memory")) {
        j.at("memory").get_to(limits.memory);
    }
    if (j.contains("cpu_shares")) {
        j.at("cpu_shares").get_to(limits.cpu_shares);
    }
    if (limits.memory < 0 || limits.cpu_shares < 0) {
        throw NorthstarError(ErrorCode::ConfigError, "resource limits must not be negative");
    }
}

void from_json(const json& j, CgroupsConfig& cgroups) {
    j.at("memory").get_to(cgroups.memory);
    j.at("cpu").get_to(cgroups.cpu);
}

void from_json(const json& j, DevicesConfig& devices) {
    j.at("unshare_root").get_to(devices.unshare_root);
    j.at("loop_control").get_to(devices.loop_control);
    j.at("loop_dev").get_to(devices.loop_dev);
    j.at("device_mapper").get_to(devices.device_mapper);
    j.at("device_mapper_dev").get_to(devices.device_mapper_dev);
    if (j.contains("loop_pool_size")) {
        j.at("loop_pool_size").get_to(devices.loop_pool_size);
    }
    if (j.contains("mount_retries")) {
        j.at("mount_retries").get_to(devices.mount_retries);
    }
    if (j.contains("mount_timeout_ms")) {
        j.at("mount_timeout_ms").get_to(devices.mount_timeout_ms);
    }
    if (devices.loop_pool_size < 0 || devices.mount_retries < 1 || devices.mount_timeout_ms <= 0) {
        throw NorthstarError(ErrorCode::ConfigError, "invalid loop pool size, mount retry or mount timeout setting");
    }
}

void from_json(const json& j, StraceConfig& strace) {
    if (j.contains("output")) {
        std::string output = j.at("output").get<std::string>();
        if (output == "file") {
            strace.output = StraceOutput::File;
        } else if (output == "log") {
            strace.output = StraceOutput::Log;
        } else {
            throw NorthstarError(ErrorCode::ConfigError, "debug.strace.output must be \"file\" or \"log\"");
        }
    }
    if (j.contains("flags")) {
        j.at("flags").get_to(strace.flags);
    }
    if (j.contains("path")) {
        j.at("path").get_to(strace.path);
    }
}

void from_json(const json& j, PerfConfig& perf) {
    if (j.contains("path")) {
        j.at("path").get_to(perf.path);
    }
    if (j.contains("flags")) {
        j.at("flags").get_to(perf.flags);
    }
}

void from_json(const json& j, DebugConfig& debug) {
    if (j.contains("runtime") && j["runtime"].contains("disable_mount_namespace")) {
        j["runtime"].at("disable_mount_namespace").get_to(debug.runtime.disable_mount_namespace);
    }
    if (j.contains("strace")) {
        debug.strace = j.at("strace").get<StraceConfig>();
    }
    if (j.contains("perf")) {
        debug.perf = j.at("perf").get<PerfConfig>();
    }
}

void from_json(const json& j, RepositoryConfig& repository) {
    j.at("dir").get_to(repository.dir);
    j.at("key").get_to(repository.key);
}

void from_json(const json& j, Config& c) {
    if (j.contains("log_level")) {
        std::string level = j.at("log_level").get<std::string>();
        if (!parse_log_level(level, c.log_level)) {
            throw NorthstarError(ErrorCode::ConfigError, "invalid log_level: " + level);
        }
    }
    j.at("console").get_to(c.console);
    j.at("run_dir").get_to(c.run_dir);
    j.at("data_dir").get_to(c.data_dir);
    j.at("log_dir").get_to(c.log_dir);
    j.at("cgroups").get_to(c.cgroups);
    j.at("devices").get_to(c.devices);
    if (j.contains("debug")) {
        j.at("debug").get_to(c.debug);
    }
    if (j.contains("repositories")) {
        j.at("repositories").get_to(c.repositories);
    }
    if (j.contains("limits")) {
        j.at("limits").get_to(c.limits);
    }
    if (j.contains("stop_timeout_ms")) {
        j.at("stop_timeout_ms").get_to(c.stop_timeout_ms);
    }
}

Config parse_config(const json& j) {
    Config config;
    try {
        config = j.get<Config>();
    } catch (const json::exception& e) {
        throw NorthstarError(ErrorCode::ConfigError, std::string("invalid configuration: ") + e.what());
    }
    if (config.run_dir.empty() || config.data_dir.empty() || config.log_dir.empty()) {
        throw NorthstarError(ErrorCode::ConfigError, "run_dir, data_dir and log_dir must not be empty");
    }
    if (config.cgroups.memory.empty() || config.cgroups.cpu.empty()) {
        throw NorthstarError(ErrorCode::ConfigError, "cgroups.memory and cgroups.cpu must not be empty");
    }
    if (config.stop_timeout_ms <= 0) {
        throw NorthstarError(ErrorCode::ConfigError, "stop_timeout_ms must be positive");
    }
    for (const auto& entry : config.repositories) {
        if (entry.second.dir.empty() || entry.second.key.empty()) {
            throw NorthstarError(ErrorCode::ConfigError, "repository '" + entry.first + "' needs dir and key");
        }
    }
    parse_console_endpoint(config.console);
    return config;
}

Config load_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw NorthstarError(ErrorCode::ConfigError, "Failed to load configuration: " + path);
    }
    json j = json::parse(ifs, nullptr, false);
    if (j.is_discarded()) {
        throw NorthstarError(ErrorCode::ConfigError, "Configuration is not valid JSON: " + path);
    }
    return parse_config(j);
}

ConsoleEndpoint parse_console_endpoint(const std::string& uri) {
    ConsoleEndpoint endpoint;
    const std::string tcp_scheme = "tcp://";
    const std::string unix_scheme = "unix://";
    if (uri.compare(0, unix_scheme.size(), unix_scheme) == 0) {
        endpoint.kind = EndpointKind::Unix;
        endpoint.path = uri.substr(unix_scheme.size());
        if (endpoint.path.empty()) {
            throw NorthstarError(ErrorCode::ConfigError, "console socket path is empty: " + uri);
        }
        return endpoint;
    }
    if (uri.compare(0, tcp_scheme.size(), tcp_scheme) != 0) {
        throw NorthstarError(ErrorCode::ConfigError, "unsupported console endpoint: " + uri);
    }
    std::string address = uri.substr(tcp_scheme.size());
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        throw NorthstarError(ErrorCode::ConfigError, "console endpoint needs host:port: " + uri);
    }
    endpoint.kind = EndpointKind::Tcp;
    endpoint.host = address.substr(0, colon);
    char* end = nullptr;
    long port = std::strtol(address.c_str() + colon + 1, &end, 10);
    if (*end != '\0' || port < 0 || port > 65535) {
        throw NorthstarError(ErrorCode::ConfigError, "invalid console port: " + uri);
    }
    endpoint.port = static_cast<int>(port);
    return endpoint;
}

void check_host_devices(const Config& config) {
    struct stat st {};
    if (stat(config.devices.loop_control.c_str(), &st) != 0) {
        throw NorthstarError(ErrorCode::ConfigError,
                             "loop control device missing: " + config.devices.loop_control);
    }
    if (stat(config.devices.device_mapper.c_str(), &st) != 0) {
        throw NorthstarError(ErrorCode::ConfigError,
                             "device mapper control device missing: " + config.devices.device_mapper);
    }
}
