#include "northstar/isolation.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <grp.h>
#include <map>
#include <linux/sched.h>
#include <sched.h>
#include <sys/capability.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/options.h"

namespace {

volatile pid_t g_forward_pid = -1;

void forward_signal(int signum) {
    if (g_forward_pid > 0) {
        kill(g_forward_pid, signum);
    }
}

// Everything the child needs, prepared before fork.
struct ChildPlan {
    const LaunchSpec* spec = nullptr;
    int flags = 0;
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
    std::string data_target;
};

void fail(int status_fd, const std::string& what) {
    report_spawn_failure(status_fd, what + ": " + std::strerror(errno));
}

void enter_root(const ChildPlan& plan, int status_fd) {
    const LaunchSpec& spec = *plan.spec;
    if (chdir(spec.root.c_str()) != 0) {
        fail(status_fd, "chdir to " + spec.root);
    }
    if (spec.mount_namespace) {
        // Stacks the old root on top of the new one, then detaches it.
        if (syscall(SYS_pivot_root, ".", ".") != 0) {
            fail(status_fd, "pivot_root to " + spec.root);
        }
        if (umount2(".", MNT_DETACH) != 0) {
            fail(status_fd, "detaching old root");
        }
    } else if (chroot(".") != 0) {
        // Only with debug.runtime.disable_mount_namespace.
        fail(status_fd, "chroot to " + spec.root);
    }
    if (chdir("/") != 0) {
        fail(status_fd, "chdir to /");
    }
}

void run_child(ChildPlan& plan, int go_fd, int status_fd) {
    const LaunchSpec& spec = *plan.spec;
    reset_child_signals();
    if (!wait_for_go(go_fd)) {
        _exit(1);
    }
    close(go_fd);

    if (plan.flags != 0 && unshare(plan.flags) != 0) {
        fail(status_fd, "unshare");
    }
    if (spec.mount_namespace) {
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
            fail(status_fd, "making / private");
        }
        if (!plan.data_target.empty() &&
            mount(spec.data_dir.c_str(), plan.data_target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            fail(status_fd, "binding " + spec.data_dir);
        }
    }

    if (plan.flags & CLONE_NEWPID) {
        pid_t inner = fork();
        if (inner == -1) {
            fail(status_fd, "fork into pid namespace");
        }
        if (inner != 0) {
            // Stays outside the namespace and relays signals to the init.
            close(status_fd);
            g_forward_pid = inner;
            struct sigaction action{};
            action.sa_handler = forward_signal;
            sigemptyset(&action.sa_mask);
            for (int signum : {SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2}) {
                sigaction(signum, &action, nullptr);
            }
            int status = 0;
            while (waitpid(inner, &status, 0) == -1 && errno == EINTR) {
            }
            if (WIFEXITED(status)) {
                _exit(WEXITSTATUS(status));
            }
            if (WIFSIGNALED(status)) {
                signal(WTERMSIG(status), SIG_DFL);
                kill(getpid(), WTERMSIG(status));
            }
            _exit(1);
        }
        prctl(PR_SET_PDEATHSIG, SIGKILL);
    }

    enter_root(plan, status_fd);
    if (plan.flags & CLONE_NEWPID) {
        // Images without a /proc directory run without it.
        if (is_directory("/proc") &&
            mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0) {
            fail(status_fd, "mounting /proc");
        }
    }

    if (setgroups(0, nullptr) != 0 && errno != EPERM) {
        fail(status_fd, "setgroups");
    }
    if (setgid(spec.gid) != 0) {
        fail(status_fd, "setgid " + std::to_string(spec.gid));
    }
    if (spec.uid != 0 && prctl(PR_SET_KEEPCAPS, 1) != 0) {
        fail(status_fd, "keeping capabilities");
    }
    if (setuid(spec.uid) != 0) {
        fail(status_fd, "setuid " + std::to_string(spec.uid));
    }
    std::string cap_error;
    if (!restrict_capabilities(spec.capabilities, spec.uid, cap_error)) {
        report_spawn_failure(status_fd, cap_error);
    }
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        fail(status_fd, "no_new_privs");
    }

    execve(plan.argv[0], plan.argv.data(), plan.envp.data());
    fail(status_fd, "exec " + spec.init);
}

} // namespace

int namespace_flags(const std::vector<std::string>& namespaces, bool mount_namespace) {
    static const std::map<std::string, int> known = {
            {"mnt", CLONE_NEWNS}, {"uts", CLONE_NEWUTS}, {"ipc", CLONE_NEWIPC},
            {"net", CLONE_NEWNET}, {"pid", CLONE_NEWPID}, {"cgroup", CLONE_NEWCGROUP}
    };
    int flags = mount_namespace ? CLONE_NEWNS : 0;
    for (const auto& name : namespaces) {
        auto it = known.find(name);
        if (it == known.end()) {
            throw NorthstarError(ErrorCode::ProcessSpawnFailure, "unsupported namespace '" + name + "'");
        }
        if (it->second == CLONE_NEWNS && !mount_namespace) {
            continue;
        }
        flags |= it->second;
    }
    return flags;
}

bool restrict_capabilities(const std::vector<std::string>& keep, uid_t uid, std::string& error_message) {
    std::vector<cap_value_t> kept;
    for (const auto& name : keep) {
        cap_value_t value;
        if (cap_from_name(name.c_str(), &value) != 0) {
            error_message = "unknown capability " + name;
            return false;
        }
        kept.push_back(value);
    }
    for (cap_value_t cap = 0; cap <= CAP_LAST_CAP; ++cap) {
        if (std::find(kept.begin(), kept.end(), cap) != kept.end()) {
            continue;
        }
        if (cap_drop_bound(cap) != 0 && errno != EINVAL) {
            error_message = "dropping bounding capability " + std::to_string(cap) + ": " + std::strerror(errno);
            return false;
        }
    }

    cap_t caps = cap_init();
    if (caps == nullptr) {
        error_message = std::string("cap_init: ") + std::strerror(errno);
        return false;
    }
    if (!kept.empty()) {
        for (cap_flag_t flag : {CAP_EFFECTIVE, CAP_PERMITTED, CAP_INHERITABLE}) {
            cap_set_flag(caps, flag, static_cast<int>(kept.size()), kept.data(), CAP_SET);
        }
    }
    if (cap_set_proc(caps) != 0) {
        error_message = std::string("cap_set_proc: ") + std::strerror(errno);
        cap_free(caps);
        return false;
    }
    cap_free(caps);

    if (uid != 0) {
        for (cap_value_t cap : kept) {
            if (cap_set_ambient(cap, CAP_SET) != 0) {
                error_message = "raising ambient capability " + std::to_string(cap) + ": " + std::strerror(errno);
                return false;
            }
        }
    }
    return true;
}

void enter_runtime_mount_namespace(const Config& config) {
    if (config.debug.runtime.disable_mount_namespace) {
        log_warn("Mount namespace disabled, container mounts are visible on the host");
        return;
    }
    if (unshare(CLONE_NEWNS) != 0) {
        throw system_failure(ErrorCode::ConfigError, "Cannot create the runtime mount namespace", errno);
    }
    const std::string root = config.devices.unshare_root.empty() ? "/" : config.devices.unshare_root;
    if (mount(nullptr, root.c_str(), nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        throw system_failure(ErrorCode::ConfigError, "Cannot make " + root + " private", errno);
    }
    log_debug("Entered private mount namespace, " + root + " is private");
}

SpawnedProcess IsolatedLauncher::spawn(const LaunchSpec& spec) {
    ChildPlan plan;
    plan.spec = &spec;
    plan.flags = namespace_flags(spec.namespaces, spec.mount_namespace);
    plan.argv_storage.push_back(spec.init);
    plan.argv_storage.insert(plan.argv_storage.end(), spec.args.begin(), spec.args.end());
    for (const auto& entry : spec.env) {
        plan.env_storage.push_back(entry.first + "=" + entry.second);
    }
    plan.env_storage.push_back("NORTHSTAR_CONTAINER=" + spec.container_id);
    plan.argv = to_argv(plan.argv_storage);
    plan.envp = to_argv(plan.env_storage);
    if (!spec.data_dir.empty() && is_directory(path_join(spec.root, "data"))) {
        plan.data_target = path_join(spec.root, "data");
    }

    Pipe go = make_pipe();
    Pipe status = make_pipe();

    pid_t pid = fork();
    if (pid == -1) {
        throw system_failure(ErrorCode::ProcessSpawnFailure, "fork for " + spec.container_id, errno);
    }
    if (pid == 0) {
        go.write.reset();
        status.read.reset();
        run_child(plan, go.read.release(), status.write.release());
        _exit(127);
    }

    SpawnedProcess child;
    child.pid = pid;
    child.go = std::move(go.write);
    child.status = std::move(status.read);
    return child;
}
