#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "northstar/devices.h"
#include "northstar/npk.h"

// Index into the loop pool arena. The generation guards against releasing a recycled slot.
struct LoopHandle {
    int index = -1;
    uint64_t generation = 0;

    bool valid() const { return index >= 0; }
};

class LoopPool {
public:
    explicit LoopPool(size_t capacity);

    // Throws ResourceExhausted when every slot is held.
    LoopHandle acquire(const std::string& owner);
    // No-op for an invalid or already released handle.
    void release(const LoopHandle& handle);

    std::string owner(const LoopHandle& handle) const;
    size_t capacity() const { return slots_.size(); }
    size_t in_use() const;

private:
    struct Slot {
        bool used = false;
        uint64_t generation = 0;
        std::string owner;
    };

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
};

enum class MountStage {
    Free,
    Allocated,
    Verified,
    Mounted,
    Unmounted
};

const char* mount_stage_name(MountStage stage);

// Everything acquired for one container root, in acquisition order.
struct MountChain {
    std::string owner;
    MountStage stage = MountStage::Free;
    LoopHandle loop;
    std::string loop_device;
    std::string verity_name;
    std::string verity_device;
    std::string mount_point;

    // True while any stage still holds a kernel resource or pool slot.
    bool held() const {
        return loop.valid() || !loop_device.empty() || !verity_name.empty() || !mount_point.empty();
    }
};

class MountEngine {
public:
    MountEngine(BlockDevices& devices, int mount_retries, std::chrono::milliseconds mount_timeout);

    LoopHandle acquire_loop_device(MountChain& chain, const Package& package);
    std::string setup_integrity(MountChain& chain, const Package& package);
    std::string mount(MountChain& chain, const std::string& target_dir);
    // Reverse order teardown. Safe on partial chains and when called repeatedly.
    void unmount(MountChain& chain);

    // Runs the whole chain and unwinds it before rethrowing on failure.
    MountChain mount_package(const std::string& owner, const Package& package, const std::string& target_dir);

    // Releases resources recorded by a previous runtime instance.
    void release_orphan(const std::string& mount_point, const std::string& verity_name, const std::string& loop_device);

    const LoopPool& pool() const { return pool_; }

private:
    BlockDevices& devices_;
    LoopPool pool_;
    int mount_retries_;
    std::chrono::milliseconds mount_timeout_;
};

std::string verity_target_name(const std::string& owner);
