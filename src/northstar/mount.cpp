#include "northstar/mount.h"

#include <cerrno>
#include <cstring>
#include <thread>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/options.h"

namespace {

constexpr std::chrono::milliseconds MOUNT_BACKOFF(100);

} // namespace

LoopPool::LoopPool(size_t capacity) : slots_(capacity) {}

LoopHandle LoopPool::acquire(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < slots_.size(); ++i) {
        Slot& slot = slots_[i];
        if (slot.used) {
            continue;
        }
        slot.used = true;
        slot.owner = owner;
        ++slot.generation;
        return LoopHandle{static_cast<int>(i), slot.generation};
    }
    throw NorthstarError(ErrorCode::ResourceExhausted,
                         "all " + std::to_string(slots_.size()) + " loop devices are in use");
}

void LoopPool::release(const LoopHandle& handle) {
    if (!handle.valid()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<size_t>(handle.index) >= slots_.size()) {
        return;
    }
    Slot& slot = slots_[handle.index];
    if (!slot.used || slot.generation != handle.generation) {
        return;
    }
    slot.used = false;
    slot.owner.clear();
}

std::string LoopPool::owner(const LoopHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle.valid() || static_cast<size_t>(handle.index) >= slots_.size()) {
        return "";
    }
    const Slot& slot = slots_[handle.index];
    return slot.used && slot.generation == handle.generation ? slot.owner : "";
}

size_t LoopPool::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& slot : slots_) {
        if (slot.used) {
            ++count;
        }
    }
    return count;
}

const char* mount_stage_name(MountStage stage) {
    switch (stage) {
        case MountStage::Free:
            return "free";
        case MountStage::Allocated:
            return "allocated";
        case MountStage::Verified:
            return "verified";
        case MountStage::Mounted:
            return "mounted";
        case MountStage::Unmounted:
            return "unmounted";
    }
    return "?";
}

std::string verity_target_name(const std::string& owner) {
    return "northstar-" + owner;
}

MountEngine::MountEngine(BlockDevices& devices, int mount_retries, std::chrono::milliseconds mount_timeout)
    : devices_(devices),
      pool_(static_cast<size_t>(devices.loop_capacity())),
      mount_retries_(mount_retries),
      mount_timeout_(mount_timeout) {}

LoopHandle MountEngine::acquire_loop_device(MountChain& chain, const Package& package) {
    LoopHandle handle = pool_.acquire(chain.owner);
    try {
        chain.loop_device = devices_.attach_loop(package.path);
    } catch (...) {
        pool_.release(handle);
        throw;
    }
    chain.loop = handle;
    chain.stage = MountStage::Allocated;
    log_debug("Loop slot " + std::to_string(handle.index) + " (" + chain.loop_device + ") allocated to " + chain.owner);
    return handle;
}

std::string MountEngine::setup_integrity(MountChain& chain, const Package& package) {
    if (chain.stage != MountStage::Allocated) {
        throw NorthstarError(ErrorCode::InvalidState,
                             std::string("integrity setup needs an allocated loop device, chain is ") +
                             mount_stage_name(chain.stage));
    }
    const std::string name = verity_target_name(chain.owner);
    chain.verity_device = devices_.create_verity(name, chain.loop_device, package);
    chain.verity_name = name;
    chain.stage = MountStage::Verified;
    return chain.verity_device;
}

std::string MountEngine::mount(MountChain& chain, const std::string& target_dir) {
    if (chain.stage != MountStage::Verified) {
        throw NorthstarError(ErrorCode::InvalidState,
                             std::string("mount needs a verified device, chain is ") + mount_stage_name(chain.stage));
    }
    if (!ensure_directory(target_dir, 0755)) {
        throw system_failure(ErrorCode::MountFailure, "cannot create mount point " + target_dir, errno);
    }
    chain.mount_point = target_dir;

    const auto deadline = std::chrono::steady_clock::now() + mount_timeout_;
    std::string last_error;
    for (int attempt = 1; attempt <= mount_retries_; ++attempt) {
        try {
            devices_.mount_filesystem(chain.verity_device, target_dir);
            chain.stage = MountStage::Mounted;
            log_debug("Mounted " + chain.verity_device + " on " + target_dir);
            return target_dir;
        } catch (const NorthstarError& e) {
            if (devices_.verity_corrupted(chain.verity_name)) {
                throw NorthstarError(ErrorCode::IntegrityMismatch,
                                     "integrity check failed while mounting " + chain.owner + ": " + e.what());
            }
            last_error = e.what();
            log_warn("Mount attempt " + std::to_string(attempt) + "/" + std::to_string(mount_retries_) + " for " +
                     chain.owner + " failed: " + last_error);
        }
        if (attempt == mount_retries_) {
            break;
        }
        auto backoff = MOUNT_BACKOFF * attempt;
        if (std::chrono::steady_clock::now() + backoff >= deadline) {
            throw NorthstarError(ErrorCode::Timeout, "mounting " + chain.owner + " timed out: " + last_error);
        }
        std::this_thread::sleep_for(backoff);
    }
    throw NorthstarError(ErrorCode::MountFailure, "mounting " + chain.owner + " failed after " +
                                                          std::to_string(mount_retries_) + " attempts: " + last_error);
}

void MountEngine::unmount(MountChain& chain) {
    if (!chain.mount_point.empty()) {
        if (chain.stage == MountStage::Mounted) {
            devices_.unmount_filesystem(chain.mount_point);
        }
        if (rmdir(chain.mount_point.c_str()) != 0 && errno != ENOENT) {
            log_warn("Cannot remove mount point " + chain.mount_point + ": " + std::strerror(errno));
        }
        chain.mount_point.clear();
    }
    if (!chain.verity_name.empty()) {
        devices_.remove_verity(chain.verity_name);
        chain.verity_name.clear();
        chain.verity_device.clear();
    }
    if (!chain.loop_device.empty()) {
        devices_.detach_loop(chain.loop_device);
        chain.loop_device.clear();
    }
    if (chain.loop.valid()) {
        pool_.release(chain.loop);
        chain.loop = LoopHandle();
    }
    if (chain.stage != MountStage::Free) {
        chain.stage = MountStage::Unmounted;
    }
}

MountChain MountEngine::mount_package(const std::string& owner, const Package& package,
                                      const std::string& target_dir) {
    MountChain chain;
    chain.owner = owner;
    try {
        acquire_loop_device(chain, package);
        setup_integrity(chain, package);
        mount(chain, target_dir);
    } catch (const NorthstarError& e) {
        log_warn("Mounting " + package.ref().to_string() + " failed at stage " + mount_stage_name(chain.stage) + ": " +
                 e.what());
        try {
            unmount(chain);
        } catch (const NorthstarError& unwind_error) {
            log_error("Unwinding mount of " + owner + " failed: " + unwind_error.what());
        }
        throw;
    }
    return chain;
}

void MountEngine::release_orphan(const std::string& mount_point, const std::string& verity_name,
                                 const std::string& loop_device) {
    if (!mount_point.empty()) {
        devices_.unmount_filesystem(mount_point);
        if (rmdir(mount_point.c_str()) != 0 && errno != ENOENT) {
            log_warn("Cannot remove stale mount point " + mount_point + ": " + std::strerror(errno));
        }
    }
    if (!verity_name.empty()) {
        devices_.remove_verity(verity_name);
    }
    if (!loop_device.empty()) {
        devices_.detach_loop(loop_device);
    }
}
