#include "northstar/devices.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <linux/dm-ioctl.h>
#include <linux/loop.h>
#include <sstream>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "northstar/error.h"
#include "northstar/options.h"

namespace {

constexpr int DEFAULT_LOOP_CAPACITY = 16;
constexpr size_t DM_BUFFER_SIZE = 16 * 1024;
constexpr int LOOP_ATTACH_ATTEMPTS = 8;
constexpr auto DEVICE_NODE_TIMEOUT = std::chrono::seconds(2);

class DmIoctl {
public:
    explicit DmIoctl(const std::string& name) : buffer_(DM_BUFFER_SIZE, 0) {
        dm_ioctl* io = header();
        io->version[0] = DM_VERSION_MAJOR;
        io->version[1] = 0;
        io->version[2] = 0;
        io->data_size = static_cast<uint32_t>(buffer_.size());
        io->data_start = sizeof(dm_ioctl);
        std::strncpy(io->name, name.c_str(), DM_NAME_LEN - 1);
    }

    dm_ioctl* header() { return reinterpret_cast<dm_ioctl*>(buffer_.data()); }
    char* payload() { return buffer_.data() + sizeof(dm_ioctl); }
    size_t payload_capacity() const { return buffer_.size() - sizeof(dm_ioctl); }

private:
    std::vector<char> buffer_;
};

int run_dm_ioctl(const std::string& control, unsigned long request, DmIoctl& io) {
    UniqueFd fd(open(control.c_str(), O_RDWR | O_CLOEXEC));
    if (!fd.valid()) {
        return -1;
    }
    return ioctl(fd.get(), request, io.header());
}

bool wait_for_node(const std::string& path) {
    auto deadline = std::chrono::steady_clock::now() + DEVICE_NODE_TIMEOUT;
    struct stat st {};
    while (stat(path.c_str(), &st) != 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

std::string device_number(const std::string& device) {
    struct stat st {};
    if (stat(device.c_str(), &st) != 0) {
        return device;
    }
    return std::to_string(major(st.st_rdev)) + ":" + std::to_string(minor(st.st_rdev));
}

} // namespace

std::string verity_table(const std::string& device, const Package& package) {
    const VerityParams& verity = package.verity;
    std::ostringstream table;
    table << "1 " << device << " " << device << " " << verity.block_size << " " << verity.block_size << " "
          << verity.data_blocks << " " << (verity.hash_offset / verity.block_size) << " " << verity.algorithm << " "
          << verity.root_hash << " " << (verity.salt.empty() ? "-" : verity.salt);
    return table.str();
}

KernelBlockDevices::KernelBlockDevices(const DevicesConfig& config) : config_(config) {}

int KernelBlockDevices::loop_capacity() {
    if (config_.loop_pool_size > 0) {
        return config_.loop_pool_size;
    }
    std::ifstream ifs("/sys/module/loop/parameters/max_loop");
    int max_loop = 0;
    if (ifs >> max_loop && max_loop > 0) {
        return max_loop;
    }
    return DEFAULT_LOOP_CAPACITY;
}

std::string KernelBlockDevices::attach_loop(const std::string& image) {
    UniqueFd control(open(config_.loop_control.c_str(), O_RDWR | O_CLOEXEC));
    if (!control.valid()) {
        throw system_failure(ErrorCode::MountFailure, "open " + config_.loop_control, errno);
    }
    UniqueFd file(open(image.c_str(), O_RDONLY | O_CLOEXEC));
    if (!file.valid()) {
        throw system_failure(ErrorCode::MountFailure, "open " + image, errno);
    }

    for (int attempt = 0; attempt < LOOP_ATTACH_ATTEMPTS; ++attempt) {
        int index = ioctl(control.get(), LOOP_CTL_GET_FREE);
        if (index < 0) {
            throw system_failure(ErrorCode::ResourceExhausted, "no free loop device", errno);
        }
        const std::string device = config_.loop_dev + std::to_string(index);
        if (!wait_for_node(device)) {
            throw NorthstarError(ErrorCode::MountFailure, "loop device node did not appear: " + device);
        }
        UniqueFd loop(open(device.c_str(), O_RDONLY | O_CLOEXEC));
        if (!loop.valid()) {
            throw system_failure(ErrorCode::MountFailure, "open " + device, errno);
        }
        if (ioctl(loop.get(), LOOP_SET_FD, file.get()) != 0) {
            if (errno == EBUSY) {
                // Another process grabbed this device between GET_FREE and SET_FD.
                continue;
            }
            throw system_failure(ErrorCode::MountFailure, "LOOP_SET_FD on " + device, errno);
        }
        loop_info64 info {};
        info.lo_flags = LO_FLAGS_READ_ONLY | LO_FLAGS_AUTOCLEAR;
        std::strncpy(reinterpret_cast<char*>(info.lo_file_name), image.c_str(), LO_NAME_SIZE - 1);
        if (ioctl(loop.get(), LOOP_SET_STATUS64, &info) != 0) {
            int saved = errno;
            ioctl(loop.get(), LOOP_CLR_FD, 0);
            throw system_failure(ErrorCode::MountFailure, "LOOP_SET_STATUS64 on " + device, saved);
        }
        log_debug("Attached " + image + " to " + device);
        std::lock_guard<std::mutex> lock(mutex_);
        loop_fds_[device] = std::move(loop);
        return device;
    }
    throw NorthstarError(ErrorCode::ResourceExhausted, "loop devices kept getting taken, giving up on " + image);
}

void KernelBlockDevices::detach_loop(const std::string& device) {
    UniqueFd held;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loop_fds_.find(device);
        if (it != loop_fds_.end()) {
            held = std::move(it->second);
            loop_fds_.erase(it);
        }
    }
    UniqueFd fd(held.valid() ? held.release() : open(device.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ENOENT || errno == ENXIO) {
            return;
        }
        throw system_failure(ErrorCode::MountFailure, "open " + device, errno);
    }
    if (ioctl(fd.get(), LOOP_CLR_FD, 0) != 0 && errno != ENXIO) {
        throw system_failure(ErrorCode::MountFailure, "LOOP_CLR_FD on " + device, errno);
    }
    log_debug("Detached " + device);
}

std::string KernelBlockDevices::create_verity(const std::string& name, const std::string& device,
                                              const Package& package) {
    DmIoctl create(name);
    create.header()->flags = DM_READONLY_FLAG;
    if (run_dm_ioctl(config_.device_mapper, DM_DEV_CREATE, create) != 0) {
        throw system_failure(ErrorCode::MountFailure, "DM_DEV_CREATE " + name, errno);
    }
    const dev_t dev = create.header()->dev;

    const std::string table = verity_table(device_number(device), package);
    DmIoctl load(name);
    load.header()->flags = DM_READONLY_FLAG;
    load.header()->target_count = 1;
    auto* spec = reinterpret_cast<dm_target_spec*>(load.payload());
    spec->sector_start = 0;
    spec->length = package.fs_size / 512;
    std::strncpy(spec->target_type, "verity", DM_MAX_TYPE_NAME - 1);
    char* params = load.payload() + sizeof(dm_target_spec);
    if (table.size() + 1 > load.payload_capacity() - sizeof(dm_target_spec)) {
        remove_verity(name);
        throw NorthstarError(ErrorCode::MountFailure, "verity table too long for " + name);
    }
    std::memcpy(params, table.c_str(), table.size() + 1);
    size_t used = sizeof(dm_target_spec) + table.size() + 1;
    used = (used + 7) & ~static_cast<size_t>(7);
    spec->next = 0;
    load.header()->data_size = static_cast<uint32_t>(sizeof(dm_ioctl) + used);
    if (run_dm_ioctl(config_.device_mapper, DM_TABLE_LOAD, load) != 0) {
        int saved = errno;
        remove_verity(name);
        throw system_failure(ErrorCode::IntegrityMismatch, "DM_TABLE_LOAD " + name, saved);
    }

    DmIoctl resume(name);
    if (run_dm_ioctl(config_.device_mapper, DM_DEV_SUSPEND, resume) != 0) {
        int saved = errno;
        remove_verity(name);
        throw system_failure(ErrorCode::MountFailure, "DM_DEV_SUSPEND " + name, saved);
    }

    const std::string node = config_.device_mapper_dev + std::to_string(minor(dev));
    if (!wait_for_node(node)) {
        remove_verity(name);
        throw NorthstarError(ErrorCode::MountFailure, "device mapper node did not appear: " + node);
    }

    // Reading the superblock forces verification of the first hash path.
    UniqueFd probe(open(node.c_str(), O_RDONLY | O_CLOEXEC));
    std::vector<char> block(package.verity.block_size);
    if (!probe.valid() || !read_exact(probe.get(), block.data(), block.size())) {
        int saved = errno;
        probe.reset();
        remove_verity(name);
        throw system_failure(ErrorCode::IntegrityMismatch, "verity probe of " + node + " failed", saved);
    }
    probe.reset();
    if (verity_corrupted(name)) {
        remove_verity(name);
        throw NorthstarError(ErrorCode::IntegrityMismatch, "verity target " + name + " reports corruption");
    }
    log_debug("Created verity target " + name + " on " + node);
    return node;
}

void KernelBlockDevices::remove_verity(const std::string& name) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        DmIoctl remove(name);
        if (run_dm_ioctl(config_.device_mapper, DM_DEV_REMOVE, remove) == 0 || errno == ENXIO) {
            return;
        }
        if (errno != EBUSY) {
            throw system_failure(ErrorCode::MountFailure, "DM_DEV_REMOVE " + name, errno);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    throw NorthstarError(ErrorCode::MountFailure, "verity target " + name + " stays busy");
}

bool KernelBlockDevices::verity_corrupted(const std::string& name) {
    DmIoctl status(name);
    if (run_dm_ioctl(config_.device_mapper, DM_TABLE_STATUS, status) != 0) {
        return false;
    }
    if (status.header()->target_count == 0) {
        return false;
    }
    auto* spec = reinterpret_cast<dm_target_spec*>(status.payload());
    const char* text = status.payload() + sizeof(dm_target_spec);
    return std::strcmp(spec->target_type, "verity") == 0 && text[0] == 'C';
}

void KernelBlockDevices::mount_filesystem(const std::string& device, const std::string& target) {
    if (mount(device.c_str(), target.c_str(), "squashfs", MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0) {
        throw system_failure(ErrorCode::MountFailure, "mount " + device + " on " + target, errno);
    }
}

void KernelBlockDevices::unmount_filesystem(const std::string& target) {
    if (umount2(target.c_str(), MNT_DETACH) != 0 && errno != EINVAL && errno != ENOENT) {
        throw system_failure(ErrorCode::MountFailure, "umount " + target, errno);
    }
}
