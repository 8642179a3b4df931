#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "northstar/cgroups.h"
#include "northstar/crypto.h"
#include "northstar/devices.h"
#include "northstar/error.h"
#include "northstar/lifecycle.h"
#include "northstar/npk.h"
#include "northstar/supervisor.h"

namespace nlohmann {

// gtest would otherwise walk json values as containers.
inline void PrintTo(const json& value, std::ostream* os) {
    *os << value.dump();
}

} // namespace nlohmann

// Per-test directory under /tmp, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& prefix);
    ~ScratchDir();

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const;

private:
    std::string path_;
};

// Ed25519 key pair used to sign test packages.
class SigningKey {
public:
    SigningKey();

    std::vector<unsigned char> public_raw() const;
    PublicKey public_key() const;
    void write_public(const std::string& path) const;
    std::string sign_hex(const std::string& message) const;

private:
    std::shared_ptr<EVP_PKEY> key_;
};

json test_manifest(const std::string& name, const std::string& version, const std::string& script = "sleep 30");

// Writes a well-formed npk. A tampered package carries a signature over different content.
std::string write_npk(const std::string& path, const json& manifest, const SigningKey& key, bool tamper = false);

// Runs action and returns the code of the NorthstarError it throws.
ErrorCode error_code_of(const std::function<void()>& action);

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

class FakeBlockDevices : public BlockDevices {
public:
    int loop_capacity() override;
    std::string attach_loop(const std::string& image) override;
    void detach_loop(const std::string& device) override;
    std::string create_verity(const std::string& name, const std::string& device, const Package& package) override;
    void remove_verity(const std::string& name) override;
    bool verity_corrupted(const std::string& name) override;
    void mount_filesystem(const std::string& device, const std::string& target) override;
    void unmount_filesystem(const std::string& target) override;

    size_t attached_loops() const;
    size_t verity_targets() const;
    size_t mounts() const;
    bool mounted(const std::string& target) const;

    std::atomic<int> capacity{4};
    // create_verity fails the way a digest mismatch does.
    std::atomic<bool> integrity_failure{false};
    // Mount attempts that fail before one succeeds.
    std::atomic<int> mount_failures{0};
    std::atomic<int> mount_attempts{0};
    std::atomic<int> mount_delay_ms{0};
    // Unmounts that fail the way a busy mount does.
    std::atomic<int> unmount_failures{0};

private:
    mutable std::mutex mutex_;
    int next_loop_ = 0;
    std::set<std::string> loops_;
    std::map<std::string, std::string> verity_;
    std::set<std::string> mounts_;
};

class FakeCgroupFs : public CgroupFs {
public:
    explicit FakeCgroupFs(bool unified = true) : unified_(unified) {}

    bool unified() override { return unified_; }
    void create_group(const std::string& path) override;
    void write_value(const std::string& path, const std::string& file, const std::string& value) override;
    std::string read_value(const std::string& path, const std::string& file) override;
    bool remove_group(const std::string& path) override;

    bool exists(const std::string& path) const;
    std::string value(const std::string& path, const std::string& file) const;
    // Groups below the configured parents, i.e. per-container groups.
    size_t leaf_groups() const;

    std::atomic<bool> fail_writes{false};

private:
    bool unified_;
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::string>> groups_;
};

// Forks real host processes and executes the manifest init outside of any namespace.
class FakeLauncher : public Launcher {
public:
    SpawnedProcess spawn(const LaunchSpec& spec) override;

    std::vector<LaunchSpec> launched() const;

    std::atomic<int> fork_failures{0};

private:
    mutable std::mutex mutex_;
    std::vector<LaunchSpec> launched_;
};

// Collects lifecycle events for assertions.
class EventLog {
public:
    Lifecycle::Listener listener();

    std::vector<ContainerState> states(const std::string& container) const;
    std::vector<StateEvent> events() const;
    bool wait_for(const std::string& container, ContainerState state, std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<StateEvent> events_;
};

// Config pointing every directory into a scratch root.
Config test_config(const std::string& root);
