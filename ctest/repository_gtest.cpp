#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/npk.h"
#include "northstar/repository.h"
#include "test_support.h"

class RepositoryTest : public ::testing::Test {
protected:
    ScratchDir scratch{"ns-repo"};
    SigningKey key;
    std::string dir;

    void SetUp() override {
        dir = scratch.file("npk");
        ASSERT_TRUE(ensure_directory(dir));
    }

    std::shared_ptr<Repository> repository() {
        return std::make_shared<Repository>("default", dir, key.public_key());
    }
};

TEST(NpkTest, ParsesPackageReferences) {
    PackageRef ref = PackageRef::parse("hello@0.1.0");
    EXPECT_EQ("hello", ref.name);
    EXPECT_EQ("0.1.0", ref.version);
    EXPECT_EQ("hello@0.1.0", ref.to_string());
    EXPECT_THROW(PackageRef::parse("hello"), NorthstarError);
    EXPECT_THROW(PackageRef::parse("@1.0"), NorthstarError);
    EXPECT_THROW(PackageRef::parse("hello@"), NorthstarError);
}

TEST_F(RepositoryTest, ReadsPackageMetadata) {
    const std::string path = write_npk(scratch.file("hello.npk"), test_manifest("hello", "0.1.0"), key);
    Package package = read_package(path);
    EXPECT_EQ("hello", package.manifest.name);
    EXPECT_EQ("/bin/sh", package.manifest.init);
    ASSERT_EQ(2u, package.manifest.args.size());
    EXPECT_EQ(64 * 1024 * 1024, package.manifest.resources.memory);
    EXPECT_EQ(VERITY_BLOCK_SIZE, package.fs_size);
    EXPECT_EQ(1u, package.verity.data_blocks);
    EXPECT_EQ(VERITY_BLOCK_SIZE, package.verity.hash_offset);
    EXPECT_EQ(64u, package.verity.root_hash.size());
    EXPECT_EQ(VerifyResult::Verified, verify(package, key.public_key()));
}

TEST_F(RepositoryTest, RejectsMalformedImages) {
    std::ofstream(scratch.file("junk.npk")) << "definitely not a package";
    EXPECT_EQ(ErrorCode::InvalidPackage, error_code_of([&] { read_package(scratch.file("junk.npk")); }));

    json relative_init = test_manifest("hello", "0.1.0");
    relative_init["init"] = "bin/sh";
    write_npk(scratch.file("relative.npk"), relative_init, key);
    EXPECT_EQ(ErrorCode::InvalidPackage, error_code_of([&] { read_package(scratch.file("relative.npk")); }));

    json bad_name = test_manifest("../escape", "0.1.0");
    write_npk(scratch.file("name.npk"), bad_name, key);
    EXPECT_EQ(ErrorCode::InvalidPackage, error_code_of([&] { read_package(scratch.file("name.npk")); }));
}

TEST_F(RepositoryTest, ScanIndexesOnlyVerifiedPackages) {
    write_npk(path_join(dir, "hello-0.1.0.npk"), test_manifest("hello", "0.1.0"), key);
    write_npk(path_join(dir, "evil-1.0.npk"), test_manifest("evil", "1.0"), key, true);
    std::ofstream(path_join(dir, "broken.npk")) << "garbage";
    std::ofstream(path_join(dir, "README")) << "ignored";

    auto repo = repository();
    ScanReport report = repo->scan();
    ASSERT_EQ(1u, report.packages.size());
    EXPECT_EQ(2u, report.skipped.size());

    EXPECT_TRUE(repo->contains(PackageRef{"hello", "0.1.0"}));
    EXPECT_FALSE(repo->contains(PackageRef{"evil", "1.0"}));
    EXPECT_THROW(repo->lookup(PackageRef{"evil", "1.0"}), NorthstarError);
    std::string reason;
    EXPECT_TRUE(repo->rejected(PackageRef{"evil", "1.0"}, reason));
    EXPECT_EQ("signature invalid", reason);
}

TEST_F(RepositoryTest, PackageSignedByAnotherKeyIsRejected) {
    SigningKey other;
    write_npk(path_join(dir, "hello-0.1.0.npk"), test_manifest("hello", "0.1.0"), other);
    auto repo = repository();
    repo->scan();
    EXPECT_TRUE(repo->packages().empty());
}

TEST_F(RepositoryTest, ForeignArchitectureIsSkipped) {
    json manifest = test_manifest("hello", "0.1.0");
    manifest["arch"] = host_architecture() == "aarch64" ? "x86_64" : "aarch64";
    write_npk(path_join(dir, "hello-0.1.0.npk"), manifest, key);
    auto repo = repository();
    ScanReport report = repo->scan();
    EXPECT_TRUE(report.packages.empty());
    ASSERT_EQ(1u, report.skipped.size());
    EXPECT_EQ("architecture mismatch", report.skipped[0].second);
}

TEST_F(RepositoryTest, RescanSwapsTheIndex) {
    auto repo = repository();
    repo->scan();
    EXPECT_TRUE(repo->packages().empty());

    write_npk(path_join(dir, "hello-0.1.0.npk"), test_manifest("hello", "0.1.0"), key);
    repo->scan();
    PackagePtr before = repo->lookup(PackageRef{"hello", "0.1.0"});
    EXPECT_EQ("default", before->repository);

    ASSERT_TRUE(remove_tree(path_join(dir, "hello-0.1.0.npk")));
    repo->scan();
    EXPECT_FALSE(repo->contains(PackageRef{"hello", "0.1.0"}));
    EXPECT_EQ("hello", before->manifest.name);
}

TEST_F(RepositoryTest, ScanOfMissingDirectoryFails) {
    Repository missing("gone", scratch.file("gone"), key.public_key());
    EXPECT_EQ(ErrorCode::Io, error_code_of([&] { missing.scan(); }));
}

TEST_F(RepositoryTest, ManagerResolvesAcrossRepositories) {
    const std::string second_dir = scratch.file("second");
    ASSERT_TRUE(ensure_directory(second_dir));
    write_npk(path_join(dir, "hello-0.1.0.npk"), test_manifest("hello", "0.1.0"), key);
    write_npk(path_join(second_dir, "world-2.0.npk"), test_manifest("world", "2.0"), key);
    write_npk(path_join(second_dir, "evil-1.0.npk"), test_manifest("evil", "1.0"), key, true);

    RepositoryManager manager;
    manager.add(repository());
    manager.add(std::make_shared<Repository>("second", second_dir, key.public_key()));
    manager.scan_all();

    EXPECT_EQ(2u, manager.packages().size());
    EXPECT_EQ("second", manager.resolve(PackageRef{"world", "2.0"})->repository);
    EXPECT_EQ(ErrorCode::SignatureInvalid, error_code_of([&] { manager.resolve(PackageRef{"evil", "1.0"}); }));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { manager.resolve(PackageRef{"nothing", "1.0"}); }));
}

TEST_F(RepositoryTest, ManagerLoadsKeysFromConfiguration) {
    key.write_public(scratch.file("key.pub"));
    write_npk(path_join(dir, "hello-0.1.0.npk"), test_manifest("hello", "0.1.0"), key);
    RepositoryManager manager({{"default", RepositoryConfig{dir, scratch.file("key.pub")}}});
    manager.scan_all();
    EXPECT_NO_THROW(manager.resolve(PackageRef{"hello", "0.1.0"}));

    EXPECT_EQ(ErrorCode::ConfigError, error_code_of([&] {
        RepositoryManager broken({{"default", RepositoryConfig{dir, scratch.file("missing.pub")}}});
    }));
}

TEST_F(RepositoryTest, InstallCopiesAndUninstallRemoves) {
    RepositoryManager manager;
    manager.add(repository());
    manager.scan_all();

    const std::string upload = write_npk(scratch.file("upload.npk"), test_manifest("hello", "0.1.0"), key);
    PackagePtr installed = manager.install("default", upload);
    EXPECT_EQ("hello@0.1.0", installed->ref().to_string());
    EXPECT_TRUE(path_exists(path_join(dir, "hello-0.1.0.npk")));
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] { manager.install("default", upload); }));

    const std::string forged = write_npk(scratch.file("forged.npk"), test_manifest("forged", "1.0"), key, true);
    EXPECT_EQ(ErrorCode::SignatureInvalid, error_code_of([&] { manager.install("default", forged); }));
    EXPECT_FALSE(path_exists(path_join(dir, "forged-1.0.npk")));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { manager.install("nowhere", upload); }));

    manager.uninstall(PackageRef{"hello", "0.1.0"});
    EXPECT_FALSE(path_exists(path_join(dir, "hello-0.1.0.npk")));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { manager.resolve(PackageRef{"hello", "0.1.0"}); }));
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { manager.uninstall(PackageRef{"hello", "0.1.0"}); }));
}
