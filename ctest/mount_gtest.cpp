#include <gtest/gtest.h>
#include <string>

#include "northstar/devices.h"
#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/mount.h"
#include "northstar/npk.h"
#include "test_support.h"

TEST(LoopPoolTest, ExhaustionIsReported) {
    LoopPool pool(2);
    LoopHandle first = pool.acquire("a");
    LoopHandle second = pool.acquire("b");
    EXPECT_EQ(2u, pool.in_use());
    EXPECT_EQ(ErrorCode::ResourceExhausted, error_code_of([&] { pool.acquire("c"); }));

    pool.release(first);
    LoopHandle third = pool.acquire("c");
    EXPECT_EQ(first.index, third.index);
    EXPECT_EQ("c", pool.owner(third));
    EXPECT_EQ("b", pool.owner(second));
}

TEST(LoopPoolTest, StaleHandleCannotReleaseRecycledSlot) {
    LoopPool pool(1);
    LoopHandle stale = pool.acquire("old");
    pool.release(stale);
    LoopHandle fresh = pool.acquire("new");
    ASSERT_EQ(stale.index, fresh.index);
    EXPECT_NE(stale.generation, fresh.generation);

    pool.release(stale);
    EXPECT_EQ(1u, pool.in_use());
    EXPECT_EQ("new", pool.owner(fresh));
    EXPECT_EQ("", pool.owner(stale));

    pool.release(fresh);
    pool.release(fresh);
    pool.release(LoopHandle());
    EXPECT_EQ(0u, pool.in_use());
}

TEST(DevicesTest, VerityTableDescribesHashTree) {
    Package package;
    package.fs_size = 8 * VERITY_BLOCK_SIZE;
    package.verity.data_blocks = 8;
    package.verity.hash_offset = 8 * VERITY_BLOCK_SIZE;
    package.verity.root_hash = std::string(64, 'a');
    EXPECT_EQ("1 7:0 7:0 4096 4096 8 8 sha256 " + std::string(64, 'a') + " -", verity_table("7:0", package));
    package.verity.salt = "beef";
    EXPECT_EQ("1 7:0 7:0 4096 4096 8 8 sha256 " + std::string(64, 'a') + " beef", verity_table("7:0", package));
}

class MountEngineTest : public ::testing::Test {
protected:
    ScratchDir scratch{"ns-mount"};
    SigningKey key;
    FakeBlockDevices devices;
    Package package;

    void SetUp() override {
        package = read_package(write_npk(scratch.file("hello.npk"), test_manifest("hello", "0.1.0"), key));
    }

    MountEngine engine(int retries = 3) {
        return MountEngine(devices, retries, std::chrono::milliseconds(5000));
    }
};

TEST_F(MountEngineTest, MountsAndUnmountsInReverseOrder) {
    MountEngine mounts = engine();
    MountChain chain = mounts.mount_package("hello-0.1.0-1", package, scratch.file("root"));
    EXPECT_EQ(MountStage::Mounted, chain.stage);
    EXPECT_EQ("northstar-hello-0.1.0-1", chain.verity_name);
    EXPECT_TRUE(devices.mounted(scratch.file("root")));
    EXPECT_TRUE(is_directory(scratch.file("root")));
    EXPECT_EQ(1u, mounts.pool().in_use());
    EXPECT_EQ(1u, devices.attached_loops());
    EXPECT_EQ(1u, devices.verity_targets());

    mounts.unmount(chain);
    EXPECT_EQ(MountStage::Unmounted, chain.stage);
    EXPECT_EQ(0u, devices.mounts());
    EXPECT_EQ(0u, devices.verity_targets());
    EXPECT_EQ(0u, devices.attached_loops());
    EXPECT_EQ(0u, mounts.pool().in_use());
    EXPECT_FALSE(path_exists(scratch.file("root")));

    mounts.unmount(chain);
    EXPECT_EQ(0u, mounts.pool().in_use());
}

TEST_F(MountEngineTest, FailedUnmountKeepsTheChainForRetry) {
    MountEngine mounts = engine();
    MountChain chain = mounts.mount_package("hello-0.1.0-1", package, scratch.file("root"));
    devices.unmount_failures = 1;
    EXPECT_EQ(ErrorCode::MountFailure, error_code_of([&] { mounts.unmount(chain); }));
    EXPECT_TRUE(chain.held());
    EXPECT_EQ(1u, mounts.pool().in_use());
    EXPECT_EQ(1u, devices.verity_targets());

    mounts.unmount(chain);
    EXPECT_FALSE(chain.held());
    EXPECT_EQ(0u, mounts.pool().in_use());
    EXPECT_EQ(0u, devices.mounts());
    EXPECT_EQ(0u, devices.attached_loops());
}

TEST_F(MountEngineTest, IntegrityFailureUnwindsTheLoopDevice) {
    devices.integrity_failure = true;
    MountEngine mounts = engine();
    EXPECT_EQ(ErrorCode::IntegrityMismatch,
              error_code_of([&] { mounts.mount_package("hello-0.1.0-1", package, scratch.file("root")); }));
    EXPECT_EQ(0u, mounts.pool().in_use());
    EXPECT_EQ(0u, devices.attached_loops());
    EXPECT_EQ(0u, devices.mounts());
}

TEST_F(MountEngineTest, TransientMountFailuresAreRetried) {
    devices.mount_failures = 2;
    MountEngine mounts = engine(3);
    MountChain chain = mounts.mount_package("hello-0.1.0-1", package, scratch.file("root"));
    EXPECT_EQ(MountStage::Mounted, chain.stage);
    EXPECT_EQ(3, devices.mount_attempts.load());
    mounts.unmount(chain);
}

TEST_F(MountEngineTest, PersistentMountFailureReleasesEverything) {
    devices.mount_failures = 10;
    MountEngine mounts = engine(2);
    EXPECT_EQ(ErrorCode::MountFailure,
              error_code_of([&] { mounts.mount_package("hello-0.1.0-1", package, scratch.file("root")); }));
    EXPECT_EQ(2, devices.mount_attempts.load());
    EXPECT_EQ(0u, mounts.pool().in_use());
    EXPECT_EQ(0u, devices.attached_loops());
    EXPECT_EQ(0u, devices.verity_targets());
    EXPECT_FALSE(path_exists(scratch.file("root")));
}

TEST_F(MountEngineTest, PoolExhaustionLeavesExistingMountsAlone) {
    devices.capacity = 1;
    MountEngine mounts = engine();
    MountChain first = mounts.mount_package("hello-0.1.0-1", package, scratch.file("first"));
    EXPECT_EQ(ErrorCode::ResourceExhausted,
              error_code_of([&] { mounts.mount_package("hello-0.1.0-2", package, scratch.file("second")); }));
    EXPECT_TRUE(devices.mounted(scratch.file("first")));
    EXPECT_EQ(1u, devices.attached_loops());
    mounts.unmount(first);
}

TEST_F(MountEngineTest, StagesMustRunInOrder) {
    MountEngine mounts = engine();
    MountChain chain;
    chain.owner = "hello-0.1.0-1";
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { mounts.setup_integrity(chain, package); }));
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { mounts.mount(chain, scratch.file("root")); }));

    mounts.acquire_loop_device(chain, package);
    EXPECT_EQ(MountStage::Allocated, chain.stage);
    mounts.unmount(chain);
    EXPECT_EQ(MountStage::Unmounted, chain.stage);
    EXPECT_EQ(0u, devices.attached_loops());
}

TEST_F(MountEngineTest, ReleasesOrphansOfPreviousRuns) {
    MountEngine mounts = engine();
    MountChain chain = mounts.mount_package("hello-0.1.0-1", package, scratch.file("root"));
    MountEngine restarted = engine();
    restarted.release_orphan(chain.mount_point, chain.verity_name, chain.loop_device);
    EXPECT_EQ(0u, devices.mounts());
    EXPECT_EQ(0u, devices.verity_targets());
    EXPECT_EQ(0u, devices.attached_loops());
    EXPECT_EQ(0u, restarted.pool().in_use());
}
