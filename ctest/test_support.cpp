#include "test_support.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

#include <gtest/gtest.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"

namespace {

std::string current_test_name() {
    const testing::TestInfo* info = testing::UnitTest::GetInstance()->current_test_info();
    std::string name = info ? std::string(info->test_suite_name()) + "-" + info->name() : "default";
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    });
    return name;
}

void append_le64(std::string& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
    }
}

} // namespace

ScratchDir::ScratchDir(const std::string& prefix)
    : path_("/tmp/" + prefix + "-" + std::to_string(getpid()) + "-" + current_test_name()) {
    remove_tree(path_);
    if (!ensure_directory(path_, 0755)) {
        throw std::runtime_error("cannot create scratch directory " + path_);
    }
}

ScratchDir::~ScratchDir() {
    remove_tree(path_);
}

std::string ScratchDir::file(const std::string& name) const {
    return path_join(path_, name);
}

SigningKey::SigningKey() {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
            EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free);
    EVP_PKEY* key = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &key) != 1) {
        throw std::runtime_error("Ed25519 key generation failed: " + openssl_error_string());
    }
    key_.reset(key, EVP_PKEY_free);
}

std::vector<unsigned char> SigningKey::public_raw() const {
    std::vector<unsigned char> raw(32);
    size_t size = raw.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), raw.data(), &size) != 1) {
        throw std::runtime_error("cannot export public key: " + openssl_error_string());
    }
    raw.resize(size);
    return raw;
}

PublicKey SigningKey::public_key() const {
    return PublicKey::from_raw(public_raw());
}

void SigningKey::write_public(const std::string& path) const {
    std::vector<unsigned char> raw = public_raw();
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(reinterpret_cast<const char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (!ofs) {
        throw std::runtime_error("cannot write " + path);
    }
}

std::string SigningKey::sign_hex(const std::string& message) const {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    unsigned char signature[64];
    size_t size = sizeof(signature);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1 ||
        EVP_DigestSign(ctx.get(), signature, &size, reinterpret_cast<const unsigned char*>(message.data()),
                       message.size()) != 1) {
        throw std::runtime_error("signing failed: " + openssl_error_string());
    }
    return hex_encode(signature, size);
}

json test_manifest(const std::string& name, const std::string& version, const std::string& script) {
    return json{
            {"name", name},
            {"version", version},
            {"arch", host_architecture()},
            {"init", "/bin/sh"},
            {"args", {"-c", script}},
            {"env", {{"PATH", "/bin:/usr/bin"}}},
            {"uid", 0},
            {"gid", 0},
            {"namespaces", json::array()},
            {"capabilities", json::array()},
            {"resources", {{"memory", 64 * 1024 * 1024}, {"cpu_shares", 512}}}
    };
}

std::string write_npk(const std::string& path, const json& manifest, const SigningKey& key, bool tamper) {
    const std::string image(VERITY_BLOCK_SIZE, 'S');
    const std::string hash_tree(VERITY_BLOCK_SIZE, 'H');
    json metadata = {
            {"manifest", manifest},
            {"fs", {
                    {"size", image.size()},
                    {"verity", {
                            {"block_size", VERITY_BLOCK_SIZE},
                            {"data_blocks", 1},
                            {"hash_offset", image.size()},
                            {"algorithm", "sha256"},
                            {"salt", ""},
                            {"root_hash", sha256_hex(image)}
                    }}
            }}
    };
    json signed_metadata = metadata;
    if (tamper) {
        signed_metadata["manifest"]["init"] = "/bin/other";
    }
    metadata["signature"] = key.sign_hex(npk_signed_payload(signed_metadata));

    const std::string text = metadata.dump();
    std::string contents = image + hash_tree + text;
    append_le64(contents, text.size());
    contents.append(NPK_MAGIC, 4);

    std::ofstream ofs(path, std::ios::binary);
    ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!ofs) {
        throw std::runtime_error("cannot write " + path);
    }
    return path;
}

ErrorCode error_code_of(const std::function<void()>& action) {
    try {
        action();
    } catch (const NorthstarError& e) {
        return e.code();
    }
    ADD_FAILURE() << "no NorthstarError thrown";
    return ErrorCode::Io;
}

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

int FakeBlockDevices::loop_capacity() {
    return capacity;
}

std::string FakeBlockDevices::attach_loop(const std::string& image) {
    if (access(image.c_str(), R_OK) != 0) {
        throw system_failure(ErrorCode::MountFailure, "cannot open " + image, errno);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string device = "/dev/loop" + std::to_string(next_loop_++);
    loops_.insert(device);
    return device;
}

void FakeBlockDevices::detach_loop(const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    loops_.erase(device);
}

std::string FakeBlockDevices::create_verity(const std::string& name, const std::string& device, const Package&) {
    if (integrity_failure) {
        throw NorthstarError(ErrorCode::IntegrityMismatch, "verity target " + name + " is corrupted");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (loops_.count(device) == 0) {
        throw NorthstarError(ErrorCode::MountFailure, device + " is not attached");
    }
    if (verity_.count(name) != 0) {
        throw NorthstarError(ErrorCode::MountFailure, "verity target " + name + " exists");
    }
    verity_[name] = device;
    return "/dev/mapper/" + name;
}

void FakeBlockDevices::remove_verity(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    verity_.erase(name);
}

bool FakeBlockDevices::verity_corrupted(const std::string&) {
    return false;
}

void FakeBlockDevices::mount_filesystem(const std::string&, const std::string& target) {
    ++mount_attempts;
    if (mount_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(mount_delay_ms.load()));
    }
    if (mount_failures > 0) {
        --mount_failures;
        throw NorthstarError(ErrorCode::MountFailure, "mount of " + target + " failed");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    mounts_.insert(target);
}

void FakeBlockDevices::unmount_filesystem(const std::string& target) {
    if (unmount_failures > 0) {
        --unmount_failures;
        throw NorthstarError(ErrorCode::MountFailure, "unmounting " + target + ": device or resource busy");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    mounts_.erase(target);
}

size_t FakeBlockDevices::attached_loops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loops_.size();
}

size_t FakeBlockDevices::verity_targets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return verity_.size();
}

size_t FakeBlockDevices::mounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mounts_.size();
}

bool FakeBlockDevices::mounted(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mounts_.count(target) != 0;
}

void FakeCgroupFs::create_group(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_[path];
}

void FakeCgroupFs::write_value(const std::string& path, const std::string& file, const std::string& value) {
    if (fail_writes && file != "cgroup.subtree_control") {
        throw NorthstarError(ErrorCode::CgroupFailure, "write of " + file + " refused");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(path);
    if (it == groups_.end() && !path.empty()) {
        throw NorthstarError(ErrorCode::CgroupFailure, "no cgroup " + path);
    }
    groups_[path][file] = value;
}

std::string FakeCgroupFs::read_value(const std::string& path, const std::string& file) {
    return value(path, file);
}

bool FakeCgroupFs::remove_group(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.erase(path) != 0;
}

bool FakeCgroupFs::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.count(path) != 0;
}

std::string FakeCgroupFs::value(const std::string& path, const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto group = groups_.find(path);
    if (group == groups_.end()) {
        return std::string();
    }
    auto entry = group->second.find(file);
    return entry == group->second.end() ? std::string() : entry->second;
}

size_t FakeCgroupFs::leaf_groups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& group : groups_) {
        if (std::count(group.first.begin(), group.first.end(), '/') >= 1) {
            ++count;
        }
    }
    return count;
}

SpawnedProcess FakeLauncher::spawn(const LaunchSpec& spec) {
    if (fork_failures > 0) {
        --fork_failures;
        throw NorthstarError(ErrorCode::ProcessSpawnFailure, "fork: resource temporarily unavailable");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        launched_.push_back(spec);
    }
    std::vector<std::string> args = {spec.init};
    args.insert(args.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = to_argv(args);

    Pipe go = make_pipe();
    Pipe status = make_pipe();
    pid_t pid = fork();
    if (pid == -1) {
        throw system_failure(ErrorCode::ProcessSpawnFailure, "fork", errno);
    }
    if (pid == 0) {
        go.write.reset();
        status.read.reset();
        reset_child_signals();
        if (!wait_for_go(go.read.get())) {
            _exit(1);
        }
        execv(argv[0], argv.data());
        report_spawn_failure(status.write.get(), std::string("exec ") + spec.init + " failed");
    }
    SpawnedProcess child;
    child.pid = pid;
    child.go = std::move(go.write);
    child.status = std::move(status.read);
    return child;
}

std::vector<LaunchSpec> FakeLauncher::launched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launched_;
}

Lifecycle::Listener EventLog::listener() {
    return [this](const StateEvent& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        changed_.notify_all();
    };
}

std::vector<ContainerState> EventLog::states(const std::string& container) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContainerState> result;
    for (const auto& event : events_) {
        if (event.container == container) {
            result.push_back(event.state);
        }
    }
    return result;
}

std::vector<StateEvent> EventLog::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

bool EventLog::wait_for(const std::string& container, ContainerState state, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [&] {
        return std::any_of(events_.begin(), events_.end(), [&](const StateEvent& event) {
            return event.container == container && event.state == state;
        });
    });
}

Config test_config(const std::string& root) {
    Config config;
    config.console = "unix://" + path_join(root, "console.sock");
    config.run_dir = path_join(root, "run");
    config.data_dir = path_join(root, "data");
    config.log_dir = path_join(root, "log");
    config.cgroups.memory = "northstar";
    config.cgroups.cpu = "northstar";
    config.devices.loop_control = "/dev/loop-control";
    config.devices.device_mapper = "/dev/mapper/control";
    config.devices.mount_retries = 3;
    config.devices.mount_timeout_ms = 5000;
    config.stop_timeout_ms = 2000;
    return config;
}
