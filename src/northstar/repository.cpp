#include "northstar/repository.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/options.h"

namespace {

bool has_npk_extension(const std::string& file) {
    const std::string extension = ".npk";
    return file.size() > extension.size() &&
           file.compare(file.size() - extension.size(), extension.size(), extension) == 0;
}

std::string package_file_name(const PackageRef& ref) {
    return ref.name + "-" + ref.version + ".npk";
}

} // namespace

VerifyResult verify(const Package& package, const PublicKey& trusted_key) {
    std::vector<unsigned char> signature;
    if (!hex_decode(package.signature, signature) || signature.empty()) {
        return VerifyResult::SignatureInvalid;
    }
    if (!trusted_key.verify(package.signed_payload, signature)) {
        return VerifyResult::SignatureInvalid;
    }
    return VerifyResult::Verified;
}

Repository::Repository(std::string name, std::string dir, PublicKey key)
    : name_(std::move(name)), dir_(std::move(dir)), key_(std::move(key)) {}

ScanReport Repository::scan() {
    std::lock_guard<std::mutex> scan_lock(scan_mutex_);
    ScanReport report;
    std::map<PackageRef, PackagePtr> index;
    std::map<PackageRef, std::string> rejected;
    const std::string arch = host_architecture();

    if (!is_directory(dir_)) {
        throw NorthstarError(ErrorCode::Io, "repository directory missing: " + dir_);
    }

    for (const auto& file : list_directory(dir_)) {
        if (!has_npk_extension(file)) {
            continue;
        }
        const std::string path = path_join(dir_, file);
        std::shared_ptr<Package> package;
        try {
            package = std::make_shared<Package>(read_package(path));
        } catch (const NorthstarError& e) {
            log_warn("Skipping " + path + ": " + e.what());
            report.skipped.emplace_back(path, e.what());
            continue;
        }
        package->repository = name_;
        const PackageRef ref = package->ref();

        if (verify(*package, key_) != VerifyResult::Verified) {
            log_warn("Rejecting " + ref.to_string() + " in repository " + name_ + ": signature invalid");
            rejected[ref] = "signature invalid";
            report.skipped.emplace_back(path, "signature invalid");
            continue;
        }
        if (package->manifest.arch != arch) {
            log_warn("Skipping " + ref.to_string() + ": built for " + package->manifest.arch + ", host is " + arch);
            report.skipped.emplace_back(path, "architecture mismatch");
            continue;
        }
        if (index.count(ref) != 0) {
            report.skipped.emplace_back(path, "duplicate package " + ref.to_string());
            continue;
        }
        index.emplace(ref, package);
        report.packages.push_back(package);
    }

    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        index_.swap(index);
        rejected_.swap(rejected);
    }
    log_info("Repository " + name_ + ": indexed " + std::to_string(report.packages.size()) + " package(s), skipped " +
             std::to_string(report.skipped.size()));
    return report;
}

PackagePtr Repository::lookup(const PackageRef& ref) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = index_.find(ref);
    if (it == index_.end()) {
        throw NorthstarError(ErrorCode::NotFound, "package not found: " + ref.to_string());
    }
    return it->second;
}

bool Repository::contains(const PackageRef& ref) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_.count(ref) != 0;
}

bool Repository::rejected(const PackageRef& ref, std::string& reason) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = rejected_.find(ref);
    if (it == rejected_.end()) {
        return false;
    }
    reason = it->second;
    return true;
}

std::vector<PackagePtr> Repository::packages() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    std::vector<PackagePtr> result;
    result.reserve(index_.size());
    for (const auto& entry : index_) {
        result.push_back(entry.second);
    }
    return result;
}

PackagePtr Repository::install(const std::string& npk_path) {
    Package candidate = read_package(npk_path);
    const PackageRef ref = candidate.ref();
    if (verify(candidate, key_) != VerifyResult::Verified) {
        throw NorthstarError(ErrorCode::SignatureInvalid,
                             ref.to_string() + " is not signed by the key of repository " + name_);
    }
    if (candidate.manifest.arch != host_architecture()) {
        throw NorthstarError(ErrorCode::InvalidPackage, ref.to_string() + " is built for " + candidate.manifest.arch);
    }
    if (contains(ref)) {
        throw NorthstarError(ErrorCode::InvalidState, ref.to_string() + " is already installed in " + name_);
    }
    const std::string target = path_join(dir_, package_file_name(ref));
    std::string error_message;
    if (!copy_file(npk_path, target, error_message)) {
        throw NorthstarError(ErrorCode::Io, "install of " + ref.to_string() + " failed: " + error_message);
    }
    scan();
    return lookup(ref);
}

void Repository::remove(const PackageRef& ref) {
    PackagePtr package = lookup(ref);
    if (unlink(package->path.c_str()) != 0 && errno != ENOENT) {
        throw system_failure(ErrorCode::Io, "cannot remove " + package->path, errno);
    }
    scan();
}

RepositoryManager::RepositoryManager(const std::map<std::string, RepositoryConfig>& repositories) {
    for (const auto& entry : repositories) {
        PublicKey key = PublicKey::load(entry.second.key);
        if (!ensure_directory(entry.second.dir)) {
            throw NorthstarError(ErrorCode::ConfigError, "cannot create repository directory " + entry.second.dir);
        }
        add(std::make_shared<Repository>(entry.first, entry.second.dir, key));
    }
}

void RepositoryManager::add(std::shared_ptr<Repository> repository) {
    const std::string name = repository->name();
    repositories_[name] = std::move(repository);
}

void RepositoryManager::scan_all() {
    for (auto& entry : repositories_) {
        entry.second->scan();
    }
}

PackagePtr RepositoryManager::resolve(const PackageRef& ref) const {
    for (const auto& entry : repositories_) {
        if (entry.second->contains(ref)) {
            return entry.second->lookup(ref);
        }
    }
    for (const auto& entry : repositories_) {
        std::string reason;
        if (entry.second->rejected(ref, reason)) {
            throw NorthstarError(ErrorCode::SignatureInvalid,
                                 ref.to_string() + " rejected by repository " + entry.first + ": " + reason);
        }
    }
    throw NorthstarError(ErrorCode::NotFound, "package not found: " + ref.to_string());
}

std::vector<PackagePtr> RepositoryManager::packages() const {
    std::vector<PackagePtr> result;
    for (const auto& entry : repositories_) {
        auto packages = entry.second->packages();
        result.insert(result.end(), packages.begin(), packages.end());
    }
    return result;
}

PackagePtr RepositoryManager::install(const std::string& repository, const std::string& npk_path) {
    auto it = repositories_.find(repository);
    if (it == repositories_.end()) {
        throw NorthstarError(ErrorCode::NotFound, "unknown repository: " + repository);
    }
    return it->second->install(npk_path);
}

void RepositoryManager::uninstall(const PackageRef& ref) {
    for (auto& entry : repositories_) {
        if (entry.second->contains(ref)) {
            entry.second->remove(ref);
            return;
        }
    }
    throw NorthstarError(ErrorCode::NotFound, "package not found: " + ref.to_string());
}
