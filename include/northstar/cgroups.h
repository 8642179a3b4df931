#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

#include "northstar/config.h"

constexpr const char* CGROUP_BASE_PATH = "/sys/fs/cgroup";

struct CgroupHandle {
    std::string memory_path;
    std::string cpu_path;

    bool valid() const { return !memory_path.empty() || !cpu_path.empty(); }
};

// Filesystem view of the cgroup hierarchy. Paths are relative to the hierarchy root.
class CgroupFs {
public:
    virtual ~CgroupFs() = default;

    virtual bool unified() = 0;
    virtual void create_group(const std::string& path) = 0;
    virtual void write_value(const std::string& path, const std::string& file, const std::string& value) = 0;
    // Empty when the group does not exist.
    virtual std::string read_value(const std::string& path, const std::string& file) = 0;
    // Returns false when the group was already gone.
    virtual bool remove_group(const std::string& path) = 0;
};

class SysCgroupFs : public CgroupFs {
public:
    explicit SysCgroupFs(std::string base = CGROUP_BASE_PATH);

    bool unified() override;
    void create_group(const std::string& path) override;
    void write_value(const std::string& path, const std::string& file, const std::string& value) override;
    std::string read_value(const std::string& path, const std::string& file) override;
    bool remove_group(const std::string& path) override;

private:
    std::string base_;
};

unsigned long cpu_shares_to_weight(long long shares);

class CgroupController {
public:
    CgroupController(CgroupFs& fs, const CgroupsConfig& config);

    CgroupHandle create(const std::string& container_id, const ResourceLimits& limits);
    void attach(const CgroupHandle& handle, pid_t pid);
    // Processes currently in the groups of handle.
    std::vector<pid_t> members(const CgroupHandle& handle);
    // Tolerates groups the kernel already reclaimed.
    void destroy(CgroupHandle& handle);

private:
    void enable_controllers(const std::string& parent);

    CgroupFs& fs_;
    CgroupsConfig config_;
};
