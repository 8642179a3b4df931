#pragma once

#include <string>
#include <vector>

#include "northstar/config.h"
#include "northstar/supervisor.h"

// Maps manifest namespace names (mnt, uts, ipc, net, pid, cgroup) to CLONE_NEW* flags.
// Throws ProcessSpawnFailure on an unknown name.
int namespace_flags(const std::vector<std::string>& namespaces, bool mount_namespace);

// Drops every capability not listed from the bounding, permitted, effective and
// inheritable sets. Listed ones are raised as ambient so a non-root init keeps them.
bool restrict_capabilities(const std::vector<std::string>& keep, uid_t uid, std::string& error_message);

// Moves the runtime into a private mount namespace so container mounts stay invisible
// to the host. Must be called before any thread is started.
void enter_runtime_mount_namespace(const Config& config);

class IsolatedLauncher : public Launcher {
public:
    SpawnedProcess spawn(const LaunchSpec& spec) override;
};
