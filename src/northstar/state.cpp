#include "northstar/state.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/options.h"

namespace {

constexpr const char* STATE_FILE = "state.json";

struct StateName {
    ContainerState state;
    const char* name;
};

constexpr StateName STATE_NAMES[] = {
        {ContainerState::Installed, "installed"},
        {ContainerState::Mounted, "mounted"},
        {ContainerState::Starting, "starting"},
        {ContainerState::Running, "running"},
        {ContainerState::Stopping, "stopping"},
        {ContainerState::Stopped, "stopped"},
        {ContainerState::Failed, "failed"},
};

} // namespace

const char* container_state_name(ContainerState state) {
    for (const auto& entry : STATE_NAMES) {
        if (entry.state == state) {
            return entry.name;
        }
    }
    return "unknown";
}

ContainerState parse_container_state(const std::string& name) {
    for (const auto& entry : STATE_NAMES) {
        if (name == entry.name) {
            return entry.state;
        }
    }
    throw NorthstarError(ErrorCode::InvalidState, "unknown container state '" + name + "'");
}

bool transition_allowed(ContainerState from, ContainerState to) {
    using S = ContainerState;
    if (to == S::Failed) {
        return from == S::Installed || from == S::Mounted || from == S::Starting || from == S::Stopping;
    }
    switch (from) {
        case S::Installed:
            return to == S::Mounted;
        case S::Mounted:
            return to == S::Starting || to == S::Stopping;
        case S::Starting:
            return to == S::Running || to == S::Stopping;
        case S::Running:
            return to == S::Stopping;
        case S::Stopping:
            return to == S::Stopped;
        case S::Stopped:
        case S::Failed:
            return false;
    }
    return false;
}

bool terminal_state(ContainerState state) {
    return state == ContainerState::Stopped || state == ContainerState::Failed;
}

json ContainerRecord::to_json_object() const {
    return json{
            {"id", id},
            {"ref", ref},
            {"state", container_state_name(state)},
            {"pid", pid},
            {"loop_device", loop_device},
            {"verity_name", verity_name},
            {"mount_point", mount_point},
            {"cgroup", {{"memory", cgroup_memory}, {"cpu", cgroup_cpu}}},
            {"updated", updated}
    };
}

ContainerRecord ContainerRecord::from_json(const json& j) {
    ContainerRecord record;
    j.at("id").get_to(record.id);
    j.at("ref").get_to(record.ref);
    record.state = parse_container_state(j.at("state").get<std::string>());
    record.pid = j.value("pid", -1);
    record.loop_device = j.value("loop_device", "");
    record.verity_name = j.value("verity_name", "");
    record.mount_point = j.value("mount_point", "");
    if (j.contains("cgroup")) {
        record.cgroup_memory = j["cgroup"].value("memory", "");
        record.cgroup_cpu = j["cgroup"].value("cpu", "");
    }
    record.updated = j.value("updated", "");
    return record;
}

std::string container_state_dir(const std::string& run_dir, const std::string& id) {
    return path_join(path_join(run_dir, "containers"), id);
}

std::string container_mount_point(const std::string& run_dir, const std::string& id) {
    return path_join(path_join(run_dir, "mounts"), id);
}

bool save_record(const std::string& run_dir, const ContainerRecord& record) {
    const std::string dir = container_state_dir(run_dir, record.id);
    if (!ensure_directory(dir, 0755)) {
        log_error("Failed to create state directory " + dir + ": " + std::strerror(errno));
        return false;
    }
    ContainerRecord stamped = record;
    stamped.updated = iso8601_now();
    if (!write_file_atomic(path_join(dir, STATE_FILE), stamped.to_json_object().dump(4))) {
        log_error("Failed to write state of " + record.id);
        return false;
    }
    return true;
}

bool remove_record(const std::string& run_dir, const std::string& id) {
    const std::string dir = container_state_dir(run_dir, id);
    const std::string file = path_join(dir, STATE_FILE);
    if (unlink(file.c_str()) != 0 && errno != ENOENT) {
        log_error("Failed to remove " + file + ": " + std::strerror(errno));
        return false;
    }
    if (rmdir(dir.c_str()) != 0 && errno != ENOENT) {
        log_error("Failed to remove " + dir + ": " + std::strerror(errno));
        return false;
    }
    return true;
}

std::vector<ContainerRecord> load_records(const std::string& run_dir) {
    std::vector<ContainerRecord> records;
    const std::string base = path_join(run_dir, "containers");
    if (!is_directory(base)) {
        return records;
    }
    for (const auto& id : list_directory(base)) {
        const std::string file = path_join(path_join(base, id), STATE_FILE);
        std::string contents;
        if (!read_file(file, contents)) {
            log_warn("Skipping state directory without state file: " + id);
            continue;
        }
        try {
            records.push_back(ContainerRecord::from_json(json::parse(contents)));
        } catch (const json::exception& e) {
            log_warn("Skipping malformed state " + file + ": " + e.what());
        } catch (const NorthstarError& e) {
            log_warn("Skipping malformed state " + file + ": " + e.what());
        }
    }
    return records;
}
