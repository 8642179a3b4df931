#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

#include "northstar/config.h"

enum class ContainerState {
    Installed,
    Mounted,
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed
};

const char* container_state_name(ContainerState state);
ContainerState parse_container_state(const std::string& name);
bool transition_allowed(ContainerState from, ContainerState to);
// Stopped and Failed: every resource has been released.
bool terminal_state(ContainerState state);

// What a container instance holds on the host, persisted so a restarted runtime can clean up.
struct ContainerRecord {
    std::string id;
    std::string ref;
    ContainerState state = ContainerState::Installed;
    pid_t pid = -1;
    std::string loop_device;
    std::string verity_name;
    std::string mount_point;
    std::string cgroup_memory;
    std::string cgroup_cpu;
    std::string updated;

    json to_json_object() const;
    static ContainerRecord from_json(const json& j);
};

std::string container_state_dir(const std::string& run_dir, const std::string& id);
std::string container_mount_point(const std::string& run_dir, const std::string& id);

bool save_record(const std::string& run_dir, const ContainerRecord& record);
bool remove_record(const std::string& run_dir, const std::string& id);
// Records that cannot be parsed are logged and skipped.
std::vector<ContainerRecord> load_records(const std::string& run_dir);
