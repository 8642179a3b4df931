#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "northstar/crypto.h"
#include "northstar/npk.h"

enum class VerifyResult {
    Verified,
    SignatureInvalid
};

VerifyResult verify(const Package& package, const PublicKey& trusted_key);

struct ScanReport {
    std::vector<PackagePtr> packages;
    // Files that could not be indexed, with the reason.
    std::vector<std::pair<std::string, std::string>> skipped;
};

class Repository {
public:
    Repository(std::string name, std::string dir, PublicKey key);

    const std::string& name() const { return name_; }
    const std::string& dir() const { return dir_; }

    // Re-reads every *.npk in the directory and swaps the whole index in one step.
    ScanReport scan();

    PackagePtr lookup(const PackageRef& ref) const;
    bool contains(const PackageRef& ref) const;
    bool rejected(const PackageRef& ref, std::string& reason) const;
    std::vector<PackagePtr> packages() const;

    PackagePtr install(const std::string& npk_path);
    void remove(const PackageRef& ref);

private:
    std::string name_;
    std::string dir_;
    PublicKey key_;

    std::mutex scan_mutex_;
    mutable std::shared_mutex index_mutex_;
    std::map<PackageRef, PackagePtr> index_;
    std::map<PackageRef, std::string> rejected_;
};

class RepositoryManager {
public:
    RepositoryManager() = default;
    explicit RepositoryManager(const std::map<std::string, RepositoryConfig>& repositories);

    void add(std::shared_ptr<Repository> repository);
    void scan_all();

    // Throws SignatureInvalid for a rejected reference and NotFound for an unknown one.
    PackagePtr resolve(const PackageRef& ref) const;
    std::vector<PackagePtr> packages() const;

    PackagePtr install(const std::string& repository, const std::string& npk_path);
    void uninstall(const PackageRef& ref);

private:
    std::map<std::string, std::shared_ptr<Repository>> repositories_;
};
