#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

#include "northstar/cgroups.h"
#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "test_support.h"

namespace {

CgroupsConfig cgroups_config() {
    CgroupsConfig config;
    config.memory = "/northstar/";
    config.cpu = "northstar";
    return config;
}

ResourceLimits limits(long long memory, long long cpu_shares) {
    ResourceLimits result;
    result.memory = memory;
    result.cpu_shares = cpu_shares;
    return result;
}

} // namespace

TEST(CgroupsTest, SharesMapOntoWeightRange) {
    EXPECT_EQ(100u, cpu_shares_to_weight(0));
    EXPECT_EQ(1u, cpu_shares_to_weight(2));
    EXPECT_EQ(39u, cpu_shares_to_weight(1024));
    EXPECT_EQ(10000u, cpu_shares_to_weight(262144));
    EXPECT_EQ(10000u, cpu_shares_to_weight(1000000));
}

TEST(CgroupsTest, UnifiedHierarchyUsesOneGroup) {
    FakeCgroupFs fs(true);
    CgroupController controller(fs, cgroups_config());
    CgroupHandle handle = controller.create("hello-0.1.0-1", limits(64 * 1024 * 1024, 1024));

    EXPECT_EQ("northstar/hello-0.1.0-1", handle.memory_path);
    EXPECT_EQ(handle.memory_path, handle.cpu_path);
    EXPECT_EQ("67108864", fs.value(handle.memory_path, "memory.max"));
    EXPECT_EQ("39", fs.value(handle.cpu_path, "cpu.weight"));
    EXPECT_EQ("+cpu", fs.value("northstar", "cgroup.subtree_control"));

    controller.attach(handle, 4242);
    EXPECT_EQ("4242", fs.value(handle.memory_path, "cgroup.procs"));

    controller.destroy(handle);
    EXPECT_FALSE(handle.valid());
    EXPECT_EQ(0u, fs.leaf_groups());
    EXPECT_TRUE(fs.exists("northstar"));
}

TEST(CgroupsTest, LegacyHierarchyUsesControllerTrees) {
    FakeCgroupFs fs(false);
    CgroupController controller(fs, cgroups_config());
    CgroupHandle handle = controller.create("hello-0.1.0-1", limits(1024 * 1024, 512));

    EXPECT_EQ("memory/northstar/hello-0.1.0-1", handle.memory_path);
    EXPECT_EQ("cpu/northstar/hello-0.1.0-1", handle.cpu_path);
    EXPECT_EQ("1048576", fs.value(handle.memory_path, "memory.limit_in_bytes"));
    EXPECT_EQ("512", fs.value(handle.cpu_path, "cpu.shares"));

    controller.attach(handle, 77);
    EXPECT_EQ("77", fs.value(handle.memory_path, "cgroup.procs"));
    EXPECT_EQ("77", fs.value(handle.cpu_path, "cgroup.procs"));

    controller.destroy(handle);
    EXPECT_EQ(0u, fs.leaf_groups());
}

TEST(CgroupsTest, UnsetLimitsWriteNothing) {
    FakeCgroupFs fs(true);
    CgroupController controller(fs, cgroups_config());
    CgroupHandle handle = controller.create("idle-1.0-1", limits(0, 0));
    EXPECT_TRUE(fs.exists(handle.memory_path));
    EXPECT_EQ("", fs.value(handle.memory_path, "memory.max"));
    EXPECT_EQ("", fs.value(handle.memory_path, "cpu.weight"));
    controller.destroy(handle);
}

TEST(CgroupsTest, FailedLimitWriteRemovesPartialGroups) {
    FakeCgroupFs fs(false);
    fs.fail_writes = true;
    CgroupController controller(fs, cgroups_config());
    EXPECT_EQ(ErrorCode::CgroupFailure,
              error_code_of([&] { controller.create("hello-0.1.0-1", limits(1024 * 1024, 512)); }));
    EXPECT_EQ(0u, fs.leaf_groups());
}

TEST(CgroupsTest, AttachWithoutGroupFails) {
    FakeCgroupFs fs(true);
    CgroupController controller(fs, cgroups_config());
    CgroupHandle none;
    EXPECT_EQ(ErrorCode::CgroupFailure, error_code_of([&] { controller.attach(none, 1); }));
}

TEST(CgroupsTest, DestroyToleratesVanishedGroups) {
    FakeCgroupFs fs(false);
    CgroupController controller(fs, cgroups_config());
    CgroupHandle handle = controller.create("hello-0.1.0-1", limits(0, 0));
    ASSERT_TRUE(fs.remove_group(handle.cpu_path));
    EXPECT_NO_THROW(controller.destroy(handle));
    EXPECT_EQ(0u, fs.leaf_groups());
    EXPECT_NO_THROW(controller.destroy(handle));
}

TEST(CgroupsTest, SysfsViewWritesPlainFiles) {
    ScratchDir scratch("ns-cgroup");
    SysCgroupFs fs(scratch.path());
    EXPECT_FALSE(fs.unified());

    fs.create_group("northstar/hello");
    EXPECT_TRUE(is_directory(scratch.file("northstar/hello")));
    fs.write_value("northstar/hello", "memory.max", "4096");
    std::string contents;
    ASSERT_TRUE(read_file(scratch.file("northstar/hello/memory.max"), contents));
    EXPECT_EQ("4096", contents);
    EXPECT_EQ("4096", fs.read_value("northstar/hello", "memory.max"));
    EXPECT_EQ("", fs.read_value("missing", "cgroup.procs"));
    EXPECT_EQ(ErrorCode::CgroupFailure, error_code_of([&] { fs.write_value("missing", "memory.max", "1"); }));

    ASSERT_EQ(0, unlink(scratch.file("northstar/hello/memory.max").c_str()));
    EXPECT_TRUE(fs.remove_group("northstar/hello"));
    EXPECT_FALSE(fs.remove_group("northstar/hello"));

    std::ofstream(scratch.file("cgroup.controllers")) << "cpu memory";
    EXPECT_TRUE(fs.unified());
}

TEST(CgroupsTest, MembersComeFromBothHierarchies) {
    FakeCgroupFs fs(false);
    CgroupController controller(fs, cgroups_config());
    CgroupHandle handle = controller.create("hello-0.1.0-1", limits(0, 0));
    EXPECT_TRUE(controller.members(handle).empty());

    controller.attach(handle, 4242);
    EXPECT_EQ(std::vector<pid_t>{4242}, controller.members(handle));
    EXPECT_TRUE(controller.members(CgroupHandle()).empty());
    controller.destroy(handle);
}
