#pragma once

#include <map>
#include <mutex>
#include <string>

#include "northstar/config.h"
#include "northstar/npk.h"
#include "northstar/pipe.h"

// Host block device operations used by the mount engine.
class BlockDevices {
public:
    virtual ~BlockDevices() = default;

    // Number of loop devices the runtime may hold at once.
    virtual int loop_capacity() = 0;
    // Binds image read-only to a free loop device and returns the device node.
    virtual std::string attach_loop(const std::string& image) = 0;
    virtual void detach_loop(const std::string& device) = 0;
    // Creates a read-only dm-verity target over device and returns its node.
    virtual std::string create_verity(const std::string& name, const std::string& device, const Package& package) = 0;
    virtual void remove_verity(const std::string& name) = 0;
    virtual bool verity_corrupted(const std::string& name) = 0;
    virtual void mount_filesystem(const std::string& device, const std::string& target) = 0;
    virtual void unmount_filesystem(const std::string& target) = 0;
};

class KernelBlockDevices : public BlockDevices {
public:
    explicit KernelBlockDevices(const DevicesConfig& config);

    int loop_capacity() override;
    std::string attach_loop(const std::string& image) override;
    void detach_loop(const std::string& device) override;
    std::string create_verity(const std::string& name, const std::string& device, const Package& package) override;
    void remove_verity(const std::string& name) override;
    bool verity_corrupted(const std::string& name) override;
    void mount_filesystem(const std::string& device, const std::string& target) override;
    void unmount_filesystem(const std::string& target) override;

private:
    DevicesConfig config_;
    std::mutex mutex_;
    // Open loop descriptors keep the autoclear devices bound until the verity target holds them.
    std::map<std::string, UniqueFd> loop_fds_;
};

std::string verity_table(const std::string& device, const Package& package);
