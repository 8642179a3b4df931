#include "northstar/cgroups.h"

#include <cerrno>
#include <chrono>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/options.h"

namespace {

constexpr int REMOVE_ATTEMPTS = 10;

std::string trim_slashes(std::string path) {
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

SysCgroupFs::SysCgroupFs(std::string base) : base_(std::move(base)) {}

bool SysCgroupFs::unified() {
    return access(path_join(base_, "cgroup.controllers").c_str(), F_OK) == 0;
}

void SysCgroupFs::create_group(const std::string& path) {
    const std::string full = path_join(base_, path);
    if (!ensure_directory(full, 0755)) {
        throw system_failure(ErrorCode::CgroupFailure, "Failed to create cgroup dir " + full, errno);
    }
}

void SysCgroupFs::write_value(const std::string& path, const std::string& file, const std::string& value) {
    const std::string full = path_join(path_join(base_, path), file);
    std::ofstream ofs(full);
    if (!ofs) {
        throw system_failure(ErrorCode::CgroupFailure, "Failed to open cgroup file " + full, errno);
    }
    ofs << value;
    ofs.flush();
    if (!ofs.good()) {
        throw system_failure(ErrorCode::CgroupFailure, "Failed to write " + value + " to " + full, errno);
    }
}

std::string SysCgroupFs::read_value(const std::string& path, const std::string& file) {
    const std::string full = path_join(path_join(base_, path), file);
    std::ifstream ifs(full);
    if (!ifs) {
        if (errno == ENOENT) {
            return std::string();
        }
        throw system_failure(ErrorCode::CgroupFailure, "Failed to open cgroup file " + full, errno);
    }
    std::ostringstream contents;
    contents << ifs.rdbuf();
    return contents.str();
}

bool SysCgroupFs::remove_group(const std::string& path) {
    const std::string full = path_join(base_, path);
    for (int attempt = 0; attempt < REMOVE_ATTEMPTS; ++attempt) {
        if (rmdir(full.c_str()) == 0) {
            return true;
        }
        if (errno == ENOENT) {
            return false;
        }
        if (errno != EBUSY) {
            throw system_failure(ErrorCode::CgroupFailure, "Failed to remove cgroup dir " + full, errno);
        }
        // The last task may still be exiting.
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    throw NorthstarError(ErrorCode::CgroupFailure, "cgroup " + full + " is still busy");
}

unsigned long cpu_shares_to_weight(long long shares) {
    if (shares <= 0) {
        return 100;
    }
    if (shares < 2) {
        return 1;
    }
    if (shares > 262144) {
        shares = 262144;
    }
    return static_cast<unsigned long>(1 + ((shares - 2) * 9999) / 262142);
}

CgroupController::CgroupController(CgroupFs& fs, const CgroupsConfig& config) : fs_(fs), config_(config) {
    config_.memory = trim_slashes(config_.memory);
    config_.cpu = trim_slashes(config_.cpu);
}

void CgroupController::enable_controllers(const std::string& parent) {
    for (const std::string& group : {std::string(), parent}) {
        for (const char* controller : {"+memory", "+cpu"}) {
            try {
                fs_.write_value(group, "cgroup.subtree_control", controller);
            } catch (const NorthstarError& e) {
                log_debug(std::string("Cannot enable ") + controller + " below '" + group + "': " + e.what());
            }
        }
    }
}

CgroupHandle CgroupController::create(const std::string& container_id, const ResourceLimits& limits) {
    log_debug("Setting up cgroups for container " + container_id);
    CgroupHandle handle;
    try {
        if (fs_.unified()) {
            if (config_.cpu != config_.memory) {
                log_warn("cgroup v2 has a single hierarchy, using '" + config_.memory + "' for cpu as well");
            }
            fs_.create_group(config_.memory);
            enable_controllers(config_.memory);
            handle.memory_path = config_.memory + "/" + container_id;
            handle.cpu_path = handle.memory_path;
            fs_.create_group(handle.memory_path);
            if (limits.memory > 0) {
                fs_.write_value(handle.memory_path, "memory.max", std::to_string(limits.memory));
            }
            if (limits.cpu_shares > 0) {
                fs_.write_value(handle.cpu_path, "cpu.weight", std::to_string(cpu_shares_to_weight(limits.cpu_shares)));
            }
            return handle;
        }

        handle.memory_path = "memory/" + config_.memory + "/" + container_id;
        fs_.create_group(handle.memory_path);
        if (limits.memory > 0) {
            fs_.write_value(handle.memory_path, "memory.limit_in_bytes", std::to_string(limits.memory));
        }
        handle.cpu_path = "cpu/" + config_.cpu + "/" + container_id;
        fs_.create_group(handle.cpu_path);
        if (limits.cpu_shares > 0) {
            fs_.write_value(handle.cpu_path, "cpu.shares", std::to_string(limits.cpu_shares));
        }
    } catch (const NorthstarError&) {
        try {
            destroy(handle);
        } catch (const NorthstarError& cleanup_error) {
            log_error("Removing partial cgroups of " + container_id + " failed: " + cleanup_error.what());
        }
        throw;
    }
    return handle;
}

void CgroupController::attach(const CgroupHandle& handle, pid_t pid) {
    if (!handle.valid()) {
        throw NorthstarError(ErrorCode::CgroupFailure, "cannot attach pid " + std::to_string(pid) + " to no cgroup");
    }
    fs_.write_value(handle.memory_path, "cgroup.procs", std::to_string(pid));
    if (handle.cpu_path != handle.memory_path) {
        fs_.write_value(handle.cpu_path, "cgroup.procs", std::to_string(pid));
    }
}

std::vector<pid_t> CgroupController::members(const CgroupHandle& handle) {
    std::vector<pid_t> pids;
    for (const std::string* path : {&handle.memory_path, &handle.cpu_path}) {
        if (path->empty()) {
            continue;
        }
        std::istringstream procs(fs_.read_value(*path, "cgroup.procs"));
        pid_t pid;
        while (procs >> pid) {
            if (std::find(pids.begin(), pids.end(), pid) == pids.end()) {
                pids.push_back(pid);
            }
        }
    }
    return pids;
}

void CgroupController::destroy(CgroupHandle& handle) {
    if (!handle.cpu_path.empty() && handle.cpu_path != handle.memory_path) {
        if (!fs_.remove_group(handle.cpu_path)) {
            log_debug("cgroup " + handle.cpu_path + " already removed");
        }
    }
    handle.cpu_path.clear();
    if (!handle.memory_path.empty()) {
        if (!fs_.remove_group(handle.memory_path)) {
            log_debug("cgroup " + handle.memory_path + " already removed");
        }
    }
    handle.memory_path.clear();
}
