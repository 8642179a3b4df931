#include "northstar/npk.h"

#include <cctype>
#include <cstring>
#include <fstream>
#include <sys/utsname.h>

#include "northstar/error.h"

namespace {

bool valid_name(const std::string& name) {
    if (name.empty() || name.size() > 128) {
        return false;
    }
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return name != "." && name != "..";
}

uint64_t read_le64(const unsigned char* bytes) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

} // namespace

PackageRef PackageRef::parse(const std::string& text) {
    auto at = text.find('@');
    if (at == std::string::npos || at == 0 || at + 1 == text.size()) {
        throw NorthstarError(ErrorCode::NotFound, "invalid package reference '" + text + "', expected name@version");
    }
    return PackageRef{text.substr(0, at), text.substr(at + 1)};
}

void from_json(const json& j, Manifest& manifest) {
    j.at("name").get_to(manifest.name);
    j.at("version").get_to(manifest.version);
    j.at("arch").get_to(manifest.arch);
    j.at("init").get_to(manifest.init);
    if (j.contains("args")) {
        j.at("args").get_to(manifest.args);
    }
    if (j.contains("env")) {
        j.at("env").get_to(manifest.env);
    }
    if (j.contains("uid")) {
        j.at("uid").get_to(manifest.uid);
    }
    if (j.contains("gid")) {
        j.at("gid").get_to(manifest.gid);
    }
    if (j.contains("namespaces")) {
        j.at("namespaces").get_to(manifest.namespaces);
    }
    if (j.contains("capabilities")) {
        j.at("capabilities").get_to(manifest.capabilities);
    }
    if (j.contains("resources")) {
        j.at("resources").get_to(manifest.resources);
    }
}

void to_json(json& j, const Manifest& manifest) {
    j = json{
            {"name", manifest.name},
            {"version", manifest.version},
            {"arch", manifest.arch},
            {"init", manifest.init},
            {"args", manifest.args},
            {"env", manifest.env},
            {"uid", manifest.uid},
            {"gid", manifest.gid},
            {"namespaces", manifest.namespaces},
            {"capabilities", manifest.capabilities},
            {"resources", {{"memory", manifest.resources.memory}, {"cpu_shares", manifest.resources.cpu_shares}}}
    };
}

void from_json(const json& j, VerityParams& verity) {
    if (j.contains("block_size")) {
        j.at("block_size").get_to(verity.block_size);
    }
    j.at("data_blocks").get_to(verity.data_blocks);
    j.at("hash_offset").get_to(verity.hash_offset);
    if (j.contains("algorithm")) {
        j.at("algorithm").get_to(verity.algorithm);
    }
    if (j.contains("salt")) {
        j.at("salt").get_to(verity.salt);
    }
    j.at("root_hash").get_to(verity.root_hash);
}

void to_json(json& j, const VerityParams& verity) {
    j = json{
            {"block_size", verity.block_size},
            {"data_blocks", verity.data_blocks},
            {"hash_offset", verity.hash_offset},
            {"algorithm", verity.algorithm},
            {"salt", verity.salt},
            {"root_hash", verity.root_hash}
    };
}

std::string npk_signed_payload(const json& metadata) {
    json payload = {
            {"fs", metadata.at("fs")},
            {"manifest", metadata.at("manifest")}
    };
    return payload.dump();
}

Package read_package(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs) {
        throw NorthstarError(ErrorCode::InvalidPackage, "cannot open package: " + path);
    }
    std::streamoff file_size = ifs.tellg();
    if (file_size < static_cast<std::streamoff>(NPK_FOOTER_SIZE)) {
        throw NorthstarError(ErrorCode::InvalidPackage, "package too small: " + path);
    }

    unsigned char footer[NPK_FOOTER_SIZE];
    ifs.seekg(file_size - static_cast<std::streamoff>(NPK_FOOTER_SIZE));
    ifs.read(reinterpret_cast<char*>(footer), NPK_FOOTER_SIZE);
    if (!ifs || std::memcmp(footer + 8, NPK_MAGIC, 4) != 0) {
        throw NorthstarError(ErrorCode::InvalidPackage, "missing npk footer: " + path);
    }
    uint64_t metadata_size = read_le64(footer);
    uint64_t body_size = static_cast<uint64_t>(file_size) - NPK_FOOTER_SIZE;
    if (metadata_size == 0 || metadata_size > body_size) {
        throw NorthstarError(ErrorCode::InvalidPackage, "invalid metadata size in " + path);
    }

    std::string metadata_text(metadata_size, '\0');
    ifs.seekg(static_cast<std::streamoff>(body_size - metadata_size));
    ifs.read(&metadata_text[0], static_cast<std::streamsize>(metadata_size));
    if (!ifs) {
        throw NorthstarError(ErrorCode::InvalidPackage, "truncated metadata in " + path);
    }
    json metadata = json::parse(metadata_text, nullptr, false);
    if (metadata.is_discarded() || !metadata.is_object()) {
        throw NorthstarError(ErrorCode::InvalidPackage, "metadata is not a JSON object: " + path);
    }

    Package package;
    package.path = path;
    try {
        metadata.at("manifest").get_to(package.manifest);
        metadata.at("fs").at("size").get_to(package.fs_size);
        metadata.at("fs").at("verity").get_to(package.verity);
        metadata.at("signature").get_to(package.signature);
        package.signed_payload = npk_signed_payload(metadata);
    } catch (const json::exception& e) {
        throw NorthstarError(ErrorCode::InvalidPackage, "malformed metadata in " + path + ": " + e.what());
    }

    const Manifest& manifest = package.manifest;
    if (!valid_name(manifest.name) || !valid_name(manifest.version)) {
        throw NorthstarError(ErrorCode::InvalidPackage, "invalid package name or version in " + path);
    }
    if (manifest.init.empty() || manifest.init.front() != '/') {
        throw NorthstarError(ErrorCode::InvalidPackage, "init must be an absolute path in " + path);
    }
    const VerityParams& verity = package.verity;
    if (verity.block_size != VERITY_BLOCK_SIZE || verity.algorithm != "sha256") {
        throw NorthstarError(ErrorCode::InvalidPackage, "unsupported verity parameters in " + path);
    }
    if (package.fs_size == 0 || package.fs_size % verity.block_size != 0 ||
        verity.data_blocks * verity.block_size != package.fs_size) {
        throw NorthstarError(ErrorCode::InvalidPackage, "filesystem size does not match verity data blocks in " + path);
    }
    if (verity.hash_offset < package.fs_size || verity.hash_offset % verity.block_size != 0 ||
        verity.hash_offset >= body_size - metadata_size) {
        throw NorthstarError(ErrorCode::InvalidPackage, "verity hash tree outside of image in " + path);
    }
    if (verity.root_hash.size() != 64) {
        throw NorthstarError(ErrorCode::InvalidPackage, "verity root hash must be a sha256 hex digest in " + path);
    }
    return package;
}

std::string host_architecture() {
    struct utsname uts {};
    if (uname(&uts) != 0) {
        return "unknown";
    }
    return uts.machine;
}
