#include <atomic>
#include <csignal>
#include <fstream>
#include <gtest/gtest.h>
#include <mutex>
#include <sched.h>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/isolation.h"
#include "northstar/process.h"
#include "northstar/supervisor.h"
#include "test_support.h"

namespace {

LaunchSpec shell_spec(const std::string& id, const std::string& script) {
    LaunchSpec spec;
    spec.container_id = id;
    spec.name = "hello";
    spec.root = "/";
    spec.init = "/bin/sh";
    spec.args = {"-c", script};
    return spec;
}

// Blocks and ignores signals the way the daemon does before it starts containers.
class DaemonSignalMask {
public:
    DaemonSignalMask() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, &previous_);
        previous_pipe_ = signal(SIGPIPE, SIG_IGN);
    }

    ~DaemonSignalMask() {
        signal(SIGPIPE, previous_pipe_);
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

private:
    sigset_t previous_;
    void (*previous_pipe_)(int) = SIG_DFL;
};

std::string write_script(const ScratchDir& scratch, const std::string& name, const std::string& body) {
    const std::string path = scratch.file(name);
    std::ofstream(path) << "#!/bin/sh\n" << body;
    if (chmod(path.c_str(), 0755) != 0) {
        ADD_FAILURE() << "cannot make " << path << " executable";
    }
    return path;
}

// Stands in for perf: creates its -o file after a delay and flushes on SIGINT.
const char* FAKE_PERF =
        "while [ $# -gt 0 ]; do\n"
        "    if [ \"$1\" = -o ]; then out=\"$2\"; fi\n"
        "    shift\n"
        "done\n"
        "trap 'touch \"$out.done\"; exit 0' INT\n"
        "sleep 0.3\n"
        "touch \"$out\"\n"
        "while :; do sleep 0.1; done\n";

} // namespace

class SupervisorTest : public ::testing::Test {
protected:
    ScratchDir scratch{"ns-sup"};
    FakeLauncher launcher;
    Supervisor supervisor{launcher, NoDebug{}, scratch.path()};
};

TEST_F(SupervisorTest, StopTerminatesTheProcess) {
    pid_t prepared = -1;
    pid_t pid = supervisor.start(shell_spec("hello-0.1.0-1", "sleep 30"),
                                 [&](pid_t child) { prepared = child; }, nullptr);
    EXPECT_EQ(pid, prepared);
    EXPECT_TRUE(supervisor.supervised(pid));
    EXPECT_TRUE(process_alive(pid));

    ExitStatus status = supervisor.stop(pid, std::chrono::milliseconds(2000));
    EXPECT_TRUE(status.crashed());
    EXPECT_EQ(SIGTERM, status.code);
    supervisor.release(pid);
    EXPECT_FALSE(supervisor.supervised(pid));
    EXPECT_FALSE(process_alive(pid));
}

TEST_F(SupervisorTest, IgnoredTermEscalatesToKill) {
    const std::string ready = scratch.file("ready");
    pid_t pid = supervisor.start(
            shell_spec("stubborn-1.0-1", "trap '' TERM; touch " + ready + "; while :; do sleep 0.1; done"), nullptr,
            nullptr);
    ASSERT_TRUE(wait_until([&] { return path_exists(ready); }, std::chrono::milliseconds(5000)));

    ExitStatus status = supervisor.stop(pid, std::chrono::milliseconds(200));
    EXPECT_TRUE(status.crashed());
    EXPECT_EQ(SIGKILL, status.code);
    supervisor.release(pid);
}

TEST_F(SupervisorTest, ExitIsReportedToCallback) {
    std::mutex mutex;
    std::string container;
    ExitStatus reported;
    std::atomic<bool> called{false};
    supervisor.set_exit_callback([&](const std::string& id, pid_t, const ExitStatus& status) {
        std::lock_guard<std::mutex> lock(mutex);
        container = id;
        reported = status;
        called = true;
    });

    pid_t pid = supervisor.start(shell_spec("short-1.0-1", "exit 3"), nullptr, nullptr);
    ASSERT_TRUE(wait_until([&] { return called.load(); }, std::chrono::milliseconds(5000)));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ("short-1.0-1", container);
        EXPECT_FALSE(reported.crashed());
        EXPECT_EQ(3, reported.code);
    }

    ExitStatus status = supervisor.stop(pid, std::chrono::milliseconds(100));
    EXPECT_EQ(3, status.code);
    supervisor.release(pid);
}

TEST_F(SupervisorTest, ExecFailureIsASpawnFailure) {
    LaunchSpec spec = shell_spec("broken-1.0-1", "");
    spec.init = "/nonexistent/init";
    EXPECT_EQ(ErrorCode::ProcessSpawnFailure, error_code_of([&] { supervisor.start(spec, nullptr, nullptr); }));
}

TEST_F(SupervisorTest, CancelledStartReapsTheChild) {
    pid_t child = -1;
    EXPECT_EQ(ErrorCode::InvalidState, error_code_of([&] {
        supervisor.start(shell_spec("hello-0.1.0-1", "sleep 30"), [&](pid_t pid) { child = pid; },
                         [] { return true; });
    }));
    ASSERT_GT(child, 0);
    EXPECT_FALSE(process_alive(child));
    EXPECT_FALSE(supervisor.supervised(child));
}

TEST_F(SupervisorTest, FailedPreparationReapsTheChild) {
    pid_t child = -1;
    EXPECT_EQ(ErrorCode::CgroupFailure, error_code_of([&] {
        supervisor.start(shell_spec("hello-0.1.0-1", "sleep 30"),
                         [&](pid_t pid) {
                             child = pid;
                             throw NorthstarError(ErrorCode::CgroupFailure, "cannot attach");
                         },
                         nullptr);
    }));
    ASSERT_GT(child, 0);
    EXPECT_FALSE(process_alive(child));
    EXPECT_EQ(1u, launcher.launched().size());
}

TEST_F(SupervisorTest, TransientForkFailuresAreRetried) {
    launcher.fork_failures = 2;
    pid_t pid = supervisor.start(shell_spec("hello-0.1.0-1", "sleep 30"), nullptr, nullptr);
    EXPECT_TRUE(supervisor.supervised(pid));
    supervisor.stop(pid, std::chrono::milliseconds(2000));
    supervisor.release(pid);

    launcher.fork_failures = 3;
    EXPECT_EQ(ErrorCode::ProcessSpawnFailure, error_code_of([&] {
        supervisor.start(shell_spec("hello-0.1.0-2", "sleep 30"), nullptr, nullptr);
    }));
}

TEST_F(SupervisorTest, UnknownPidCannotBeStopped) {
    EXPECT_EQ(ErrorCode::NotFound, error_code_of([&] { supervisor.stop(99999999, std::chrono::milliseconds(10)); }));
    supervisor.release(99999999);
}

TEST(SupervisorShutdownTest, DestructionKillsRemainingProcesses) {
    FakeLauncher launcher;
    pid_t pid;
    {
        Supervisor supervisor(launcher, NoDebug{}, "/tmp");
        pid = supervisor.start(shell_spec("hello-0.1.0-1", "sleep 30"), nullptr, nullptr);
        ASSERT_TRUE(process_alive(pid));
    }
    EXPECT_FALSE(process_alive(pid));
}

TEST(SignalResetTest, ExecutedChildrenReceiveTerm) {
    DaemonSignalMask mask;
    pid_t pid = fork();
    if (pid == 0) {
        reset_child_signals();
        execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }
    ASSERT_GT(pid, 0);
    kill(pid, SIGTERM);
    int status = 0;
    ASSERT_TRUE(wait_for_process(pid, 5, status));
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(SIGTERM, WTERMSIG(status));
}

TEST(IsolatedLauncherTest, ContainerInitHonoursTerm) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "isolation needs root";
    }
    DaemonSignalMask mask;
    IsolatedLauncher launcher;
    Supervisor supervisor(launcher, NoDebug{}, "/tmp");
    LaunchSpec spec = shell_spec("hello-0.1.0-1", "");
    spec.init = "/bin/sleep";
    spec.args = {"30"};
    spec.mount_namespace = false;

    pid_t pid = supervisor.start(spec, nullptr, nullptr);
    ExitStatus status = supervisor.stop(pid, std::chrono::milliseconds(5000));
    EXPECT_TRUE(status.crashed());
    EXPECT_EQ(SIGTERM, status.code);
    supervisor.release(pid);
}

TEST(IsolatedLauncherTest, FailedPivotRootIsFatal) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "isolation needs root";
    }
    // A plain directory is not a mount point, so pivot_root refuses it.
    ScratchDir root("ns-pivot");
    IsolatedLauncher launcher;
    Supervisor supervisor(launcher, NoDebug{}, "/tmp");
    LaunchSpec spec = shell_spec("hello-0.1.0-1", "");
    spec.root = root.path();
    spec.init = "/bin/sleep";
    spec.args = {"30"};
    try {
        supervisor.start(spec, nullptr, nullptr);
        ADD_FAILURE() << "start succeeded without a pivotable root";
    } catch (const NorthstarError& e) {
        EXPECT_EQ(ErrorCode::ProcessSpawnFailure, e.code());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("pivot_root"));
    }
}

TEST(InstrumentTest, ChildRunsOnlyAfterAttach) {
    ScratchDir scratch("ns-instr");
    DaemonSignalMask mask;
    ProfileDebug profile;
    profile.path = write_script(scratch, "perf", FAKE_PERF);
    FakeLauncher launcher;
    Supervisor supervisor(launcher, profile, scratch.path());

    const std::string ready = scratch.file("ready");
    const std::string output = path_join(scratch.path(), "perf-$$-hello.perf");
    pid_t pid = supervisor.start(
            shell_spec("hello-0.1.0-1", "if [ -e " + output + " ]; then touch " + ready + "; fi; sleep 30"), nullptr,
            nullptr);
    ASSERT_TRUE(wait_until([&] { return path_exists(ready); }, std::chrono::milliseconds(5000)));

    ExitStatus status = supervisor.stop(pid, std::chrono::milliseconds(2000));
    EXPECT_EQ(SIGTERM, status.code);
    supervisor.release(pid);
    const std::string perf_data = path_join(scratch.path(), "perf-" + std::to_string(pid) + "-hello.perf");
    EXPECT_TRUE(path_exists(perf_data));
    EXPECT_TRUE(path_exists(perf_data + ".done"));
}

TEST(InstrumentTest, EarlyInstrumentExitFailsTheStart) {
    ScratchDir scratch("ns-instr");
    ProfileDebug profile;
    profile.path = write_script(scratch, "perf", "exit 3\n");
    FakeLauncher launcher;
    Supervisor supervisor(launcher, profile, scratch.path());

    pid_t child = -1;
    EXPECT_EQ(ErrorCode::ProcessSpawnFailure, error_code_of([&] {
        supervisor.start(shell_spec("hello-0.1.0-1", "sleep 30"), [&](pid_t pid) { child = pid; }, nullptr);
    }));
    ASSERT_GT(child, 0);
    EXPECT_FALSE(process_alive(child));
    EXPECT_FALSE(supervisor.supervised(child));
}

TEST(InstrumentTest, InstrumentThatNeverAttachesTimesOut) {
    ScratchDir scratch("ns-instr");
    ProfileDebug profile;
    profile.path = write_script(scratch, "perf", "exec sleep 30\n");
    FakeLauncher launcher;
    Supervisor supervisor(launcher, profile, scratch.path());

    pid_t child = -1;
    EXPECT_EQ(ErrorCode::Timeout, error_code_of([&] {
        supervisor.start(shell_spec("hello-0.1.0-1", "sleep 30"), [&](pid_t pid) { child = pid; }, nullptr);
    }));
    ASSERT_GT(child, 0);
    EXPECT_FALSE(process_alive(child));
}

TEST(IsolationTest, NamespaceNamesMapToCloneFlags) {
    EXPECT_EQ(CLONE_NEWNS, namespace_flags({}, true));
    EXPECT_EQ(0, namespace_flags({}, false));
    EXPECT_EQ(CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWUTS, namespace_flags({"pid", "uts"}, true));
    EXPECT_EQ(CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWCGROUP, namespace_flags({"net", "ipc", "cgroup"}, false));
    EXPECT_EQ(0, namespace_flags({"mnt"}, false));
    EXPECT_EQ(ErrorCode::ProcessSpawnFailure, error_code_of([] { namespace_flags({"user"}, true); }));
}
