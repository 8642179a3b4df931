#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "northstar/config.h"

constexpr char NPK_MAGIC[] = "NPK1";
constexpr size_t NPK_FOOTER_SIZE = 12;
constexpr uint32_t VERITY_BLOCK_SIZE = 4096;

struct PackageRef {
    std::string name;
    std::string version;

    // Parses "name@version".
    static PackageRef parse(const std::string& text);
    std::string to_string() const { return name + "@" + version; }

    bool operator<(const PackageRef& other) const {
        return name != other.name ? name < other.name : version < other.version;
    }
    bool operator==(const PackageRef& other) const {
        return name == other.name && version == other.version;
    }
};

struct Manifest {
    std::string name;
    std::string version;
    std::string arch;
    std::string init;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::vector<std::string> namespaces;
    std::vector<std::string> capabilities;
    ResourceLimits resources;
};

struct VerityParams {
    uint32_t block_size = VERITY_BLOCK_SIZE;
    uint64_t data_blocks = 0;
    uint64_t hash_offset = 0;
    std::string algorithm = "sha256";
    std::string salt;
    std::string root_hash;
};

// An indexed image. Immutable once read; shared by the index and running containers.
struct Package {
    Manifest manifest;
    std::string path;
    std::string repository;
    uint64_t fs_size = 0;
    VerityParams verity;
    std::string signature;
    std::string signed_payload;

    PackageRef ref() const { return PackageRef{manifest.name, manifest.version}; }
};

using PackagePtr = std::shared_ptr<const Package>;

Package read_package(const std::string& path);
std::string npk_signed_payload(const json& metadata);
std::string host_architecture();

void from_json(const json& j, Manifest& manifest);
void from_json(const json& j, VerityParams& verity);
void to_json(json& j, const Manifest& manifest);
void to_json(json& j, const VerityParams& verity);
