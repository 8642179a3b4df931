#include "northstar/lifecycle.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <exception>
#include <unistd.h>

#include "northstar/filesystem.h"
#include "northstar/options.h"
#include "northstar/process.h"

namespace {

constexpr auto ORPHAN_KILL_WAIT = std::chrono::seconds(2);

template <typename T>
void reply_error(const std::shared_ptr<std::promise<T>>& reply, std::exception_ptr error) {
    if (reply) {
        reply->set_exception(error);
    }
}

} // namespace

json exit_status_json(const ExitStatus& status) {
    if (status.kind == ExitStatus::Kind::Signaled) {
        return json{{"signaled", status.code}};
    }
    return json{{"exited", status.code}};
}

json StateEvent::to_json() const {
    json j = {
            {"container", container},
            {"ref", ref},
            {"state", container_state_name(state)},
            {"timestamp", timestamp}
    };
    if (exit) {
        j["exit"] = exit_status_json(*exit);
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

json ContainerInfo::to_json() const {
    json j = {
            {"ref", ref},
            {"state", container_state_name(state)}
    };
    if (!id.empty()) {
        j["id"] = id;
    }
    if (pid > 0) {
        j["pid"] = pid;
    }
    if (!mount_point.empty()) {
        j["mount_point"] = mount_point;
    }
    if (limits.memory > 0 || limits.cpu_shares > 0) {
        j["resources"] = {{"memory", limits.memory}, {"cpu_shares", limits.cpu_shares}};
    }
    if (exit) {
        j["exit"] = exit_status_json(*exit);
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

Lifecycle::Lifecycle(const Config& config, RepositoryManager& repositories, MountEngine& mounts,
                     CgroupController& cgroups, Supervisor& supervisor)
    : config_(config), repositories_(repositories), mounts_(mounts), cgroups_(cgroups), supervisor_(supervisor) {
    supervisor_.set_exit_callback([this](const std::string& instance, pid_t pid, const ExitStatus& status) {
        on_process_exit(instance, pid, status);
    });
}

Lifecycle::~Lifecycle() {
    shutdown();
    supervisor_.set_exit_callback(nullptr);
}

int Lifecycle::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int token = next_listener_++;
    listeners_[token] = std::move(listener);
    return token;
}

void Lifecycle::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(token);
}

// Listeners run under the lock, so once unsubscribe returns the listener is never called again.
void Lifecycle::emit(const StateEvent& event) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& entry : listeners_) {
        entry.second(event);
    }
}

Lifecycle::Slot& Lifecycle::slot_for(const PackageRef& ref) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(ref);
    if (it != slots_.end()) {
        return *it->second;
    }
    if (shutting_down_) {
        throw NorthstarError(ErrorCode::InvalidState, "runtime is shutting down");
    }
    auto slot = std::make_unique<Slot>();
    slot->ref = ref;
    Slot& created = *slot;
    created.worker = std::thread(&Lifecycle::run_slot, this, std::ref(created));
    slots_.emplace(ref, std::move(slot));
    return created;
}

Lifecycle::Slot* Lifecycle::find_slot(const PackageRef& ref) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(ref);
    return it == slots_.end() ? nullptr : it->second.get();
}

std::future<ContainerInfo> Lifecycle::post(Slot& slot, Message message, bool internal) {
    message.reply = std::make_shared<std::promise<ContainerInfo>>();
    std::future<ContainerInfo> result = message.reply->get_future();
    {
        std::lock_guard<std::mutex> guard(slots_mutex_);
        if (shutting_down_ && !internal && message.kind != Message::Kind::Exited) {
            throw NorthstarError(ErrorCode::InvalidState, "runtime is shutting down");
        }
    }
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.closing) {
            throw NorthstarError(ErrorCode::InvalidState, "runtime is shutting down");
        }
        if (message.kind == Message::Kind::Stop) {
            bool start_pending = slot.starting ||
                                 std::any_of(slot.inbox.begin(), slot.inbox.end(), [](const Message& queued) {
                                     return queued.kind == Message::Kind::Start;
                                 });
            if (start_pending) {
                log_debug("Stop of " + slot.ref.to_string() + " cancels its pending start");
                slot.cancel = true;
            }
        }
        slot.inbox.push_back(std::move(message));
    }
    slot.wakeup.notify_one();
    return result;
}

void Lifecycle::run_slot(Slot& slot) {
    while (true) {
        Message message;
        {
            std::unique_lock<std::mutex> lock(slot.mutex);
            slot.wakeup.wait(lock, [&] { return slot.closing || !slot.inbox.empty(); });
            if (slot.inbox.empty()) {
                return;
            }
            message = std::move(slot.inbox.front());
            slot.inbox.pop_front();
            slot.starting = message.kind == Message::Kind::Start;
        }

        try {
            switch (message.kind) {
                case Message::Kind::Start:
                    message.reply->set_value(handle_start(slot));
                    break;
                case Message::Kind::Stop:
                    message.reply->set_value(handle_stop(slot, message.timeout));
                    break;
                case Message::Kind::Exited:
                    handle_exited(slot, message);
                    message.reply->set_value(info(slot));
                    break;
            }
        } catch (const NorthstarError& e) {
            log_debug(slot.ref.to_string() + ": " + error_code_name(e.code()) + ": " + e.what());
            reply_error(message.reply, std::current_exception());
        } catch (const std::exception& e) {
            log_error("Unexpected failure handling " + slot.ref.to_string() + ": " + e.what());
            reply_error(message.reply, std::make_exception_ptr(NorthstarError(ErrorCode::Io, e.what())));
        }

        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.starting) {
            slot.starting = false;
            slot.cancel = false;
        }
    }
}

ContainerInfo Lifecycle::start(const PackageRef& ref) {
    Message message;
    message.kind = Message::Kind::Start;
    return post(slot_for(ref), std::move(message)).get();
}

ContainerInfo Lifecycle::stop(const PackageRef& ref, std::chrono::milliseconds timeout) {
    Slot* slot = find_slot(ref);
    if (slot == nullptr) {
        repositories_.resolve(ref);
        throw NorthstarError(ErrorCode::InvalidState, ref.to_string() + " is not running");
    }
    Message message;
    message.kind = Message::Kind::Stop;
    message.timeout = timeout;
    return post(*slot, std::move(message)).get();
}

void Lifecycle::on_process_exit(const std::string& instance, pid_t pid, const ExitStatus& status) {
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = instances_.find(instance);
        if (it != instances_.end()) {
            auto found = slots_.find(it->second);
            slot = found == slots_.end() ? nullptr : found->second.get();
        }
    }
    if (slot == nullptr) {
        log_warn("Exit of unknown container " + instance + " (pid " + std::to_string(pid) + ")");
        return;
    }
    Message message;
    message.kind = Message::Kind::Exited;
    message.instance = instance;
    message.exit = status;
    try {
        post(*slot, std::move(message), true);
    } catch (const NorthstarError& e) {
        log_debug("Exit of " + instance + " not delivered: " + e.what());
    }
}

void Lifecycle::transition(Slot& slot, ContainerState to, const std::function<void(Container&)>& update) {
    StateEvent event;
    Container snapshot;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        Container& container = *slot.container;
        if (!transition_allowed(container.state, to)) {
            throw NorthstarError(ErrorCode::InvalidState, container.id + ": transition from " +
                                                                  container_state_name(container.state) + " to " +
                                                                  container_state_name(to) + " is not allowed");
        }
        container.state = to;
        if (update) {
            update(container);
        }
        snapshot = container;
    }
    log_info(snapshot.id + " -> " + container_state_name(to));
    persist(snapshot, slot.ref);

    event.container = snapshot.id;
    event.ref = slot.ref.to_string();
    event.state = to;
    if (terminal_state(to)) {
        event.exit = snapshot.exit;
        event.error = snapshot.error;
    }
    event.timestamp = iso8601_now();
    emit(event);
}

void Lifecycle::persist(const Container& container, const PackageRef& ref) {
    if (terminal_state(container.state)) {
        remove_record(config_.run_dir, container.id);
        return;
    }
    ContainerRecord record;
    record.id = container.id;
    record.ref = ref.to_string();
    record.state = container.state;
    record.pid = container.pid;
    record.loop_device = container.chain.loop_device;
    record.verity_name = container.chain.verity_name;
    record.mount_point = container.chain.mount_point;
    record.cgroup_memory = container.cgroup.memory_path;
    record.cgroup_cpu = container.cgroup.cpu_path;
    save_record(config_.run_dir, record);
}

ResourceLimits Lifecycle::limits_for(const Package& package) const {
    ResourceLimits limits = package.manifest.resources;
    auto it = config_.limits.find(package.manifest.name);
    if (it != config_.limits.end()) {
        if (it->second.memory > 0) {
            limits.memory = it->second.memory;
        }
        if (it->second.cpu_shares > 0) {
            limits.cpu_shares = it->second.cpu_shares;
        }
    }
    return limits;
}

LaunchSpec Lifecycle::launch_spec(const Container& container) const {
    const Manifest& manifest = container.package->manifest;
    LaunchSpec spec;
    spec.container_id = container.id;
    spec.name = manifest.name;
    spec.root = container.chain.mount_point;
    spec.init = manifest.init;
    spec.args = manifest.args;
    spec.env = manifest.env;
    spec.uid = manifest.uid;
    spec.gid = manifest.gid;
    spec.namespaces = manifest.namespaces;
    spec.capabilities = manifest.capabilities;
    spec.mount_namespace = !config_.debug.runtime.disable_mount_namespace;
    if (!config_.data_dir.empty() && is_directory(path_join(spec.root, "data"))) {
        const std::string host_dir = path_join(config_.data_dir, manifest.name);
        if (!ensure_directory(host_dir, 0700)) {
            throw system_failure(ErrorCode::ProcessSpawnFailure, "cannot create data directory " + host_dir, errno);
        }
        spec.data_dir = host_dir;
    }
    return spec;
}

ContainerInfo Lifecycle::handle_start(Slot& slot) {
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.container && !terminal_state(slot.container->state)) {
            throw NorthstarError(ErrorCode::InvalidState, slot.ref.to_string() + " is already " +
                                                                  container_state_name(slot.container->state));
        }
    }
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        if (shutting_down_) {
            throw NorthstarError(ErrorCode::InvalidState, "runtime is shutting down");
        }
    }
    PackagePtr package = repositories_.resolve(slot.ref);

    Container fresh;
    fresh.id = package->manifest.name + "-" + package->manifest.version + "-" + std::to_string(++instance_counter_);
    fresh.package = package;
    fresh.limits = limits_for(*package);
    std::string previous;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.container) {
            const Container& old = *slot.container;
            previous = old.id;
            if (old.chain.held() || old.cgroup.valid()) {
                slot.leftovers.push_back(Leftover{old.id, old.chain, old.cgroup});
            }
        }
        slot.container = fresh;
    }
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        if (!previous.empty()) {
            instances_.erase(previous);
        }
        instances_.emplace(fresh.id, slot.ref);
    }
    release_leftovers(slot);
    StateEvent installed;
    installed.container = fresh.id;
    installed.ref = slot.ref.to_string();
    installed.state = ContainerState::Installed;
    installed.timestamp = iso8601_now();
    persist(fresh, slot.ref);
    emit(installed);

    MountChain chain;
    try {
        chain = mounts_.mount_package(fresh.id, *package, container_mount_point(config_.run_dir, fresh.id));
    } catch (const NorthstarError& e) {
        fail(slot, e.what());
        throw;
    }
    transition(slot, ContainerState::Mounted, [&](Container& container) { container.chain = chain; });
    if (slot.cancel) {
        abort_start(slot, -1);
        throw NorthstarError(ErrorCode::InvalidState, "start of " + fresh.id + " cancelled");
    }

    transition(slot, ContainerState::Starting);
    pid_t pid = -1;
    try {
        CgroupHandle cgroup = cgroups_.create(fresh.id, fresh.limits);
        Container current;
        {
            std::lock_guard<std::mutex> lock(slot.mutex);
            slot.container->cgroup = cgroup;
            current = *slot.container;
        }
        persist(current, slot.ref);
        pid = supervisor_.start(
                launch_spec(current),
                [&](pid_t child) { cgroups_.attach(cgroup, child); },
                [&] { return slot.cancel.load(); });
    } catch (const NorthstarError& e) {
        if (slot.cancel) {
            abort_start(slot, -1);
            throw NorthstarError(ErrorCode::InvalidState, "start of " + fresh.id + " cancelled");
        }
        std::string cleanup_error = teardown(slot);
        fail(slot, cleanup_error.empty() ? e.what() : std::string(e.what()) + "; " + cleanup_error);
        throw;
    }

    if (slot.cancel) {
        abort_start(slot, pid);
        throw NorthstarError(ErrorCode::InvalidState, "start of " + fresh.id + " cancelled");
    }
    transition(slot, ContainerState::Running, [&](Container& container) {
        container.pid = pid;
        container.start_order = ++start_counter_;
    });
    return info(slot);
}

void Lifecycle::abort_start(Slot& slot, pid_t pid) {
    log_info("Aborting start of " + slot.ref.to_string());
    transition(slot, ContainerState::Stopping, [&](Container& container) {
        if (pid > 0) {
            container.pid = pid;
        }
    });
    std::optional<ExitStatus> exit;
    std::string error;
    if (pid > 0) {
        try {
            exit = supervisor_.stop(pid, std::chrono::milliseconds(config_.stop_timeout_ms));
        } catch (const NorthstarError& e) {
            error = e.what();
        }
    }
    finish_stop(slot, exit, error, false);
}

ContainerInfo Lifecycle::handle_stop(Slot& slot, std::chrono::milliseconds timeout) {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (!slot.container) {
            throw NorthstarError(ErrorCode::InvalidState, slot.ref.to_string() + " is not running");
        }
        if (terminal_state(slot.container->state)) {
            Container settled = *slot.container;
            return info(slot.ref, settled);
        }
        if (slot.container->state != ContainerState::Running) {
            throw NorthstarError(ErrorCode::InvalidState, slot.container->id + " is " +
                                                                  container_state_name(slot.container->state));
        }
        pid = slot.container->pid;
    }
    transition(slot, ContainerState::Stopping);
    std::optional<ExitStatus> exit;
    std::string error;
    try {
        exit = supervisor_.stop(pid, timeout);
    } catch (const NorthstarError& e) {
        error = e.what();
    }
    finish_stop(slot, exit, error, false);
    return info(slot);
}

void Lifecycle::handle_exited(Slot& slot, const Message& message) {
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (!slot.container || slot.container->id != message.instance ||
            slot.container->state != ContainerState::Running) {
            return;
        }
    }
    log_warn(message.instance + " " + message.exit.to_string() + " unexpectedly");
    transition(slot, ContainerState::Stopping);
    finish_stop(slot, message.exit, std::string(), message.exit.crashed());
}

void Lifecycle::finish_stop(Slot& slot, const std::optional<ExitStatus>& exit, std::string error, bool crashed) {
    std::string cleanup_error = teardown(slot);
    if (!cleanup_error.empty()) {
        error = error.empty() ? cleanup_error : error + "; " + cleanup_error;
    }
    if (error.empty() && crashed) {
        error = "crashed: " + exit->to_string();
    }
    if (error.empty()) {
        transition(slot, ContainerState::Stopped, [&](Container& container) { container.exit = exit; });
    } else {
        transition(slot, ContainerState::Failed, [&](Container& container) {
            container.exit = exit;
            container.error = error;
        });
    }
}

void Lifecycle::fail(Slot& slot, const std::string& error) {
    transition(slot, ContainerState::Failed, [&](Container& container) { container.error = error; });
}

std::string Lifecycle::teardown(Slot& slot) {
    Container current;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        current = *slot.container;
    }
    std::vector<std::string> errors;
    if (current.pid > 0) {
        supervisor_.release(current.pid);
    }
    try {
        cgroups_.destroy(current.cgroup);
    } catch (const NorthstarError& e) {
        errors.push_back(e.what());
    }
    try {
        mounts_.unmount(current.chain);
    } catch (const NorthstarError& e) {
        errors.push_back(e.what());
    }
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        slot.container->pid = -1;
        slot.container->cgroup = current.cgroup;
        slot.container->chain = current.chain;
    }
    if (!errors.empty()) {
        log_error("Teardown of " + current.id + " incomplete: " + join_strings(errors, "; "));
    }
    return join_strings(errors, "; ");
}

void Lifecycle::release_leftovers(Slot& slot) {
    std::vector<Leftover> pending;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        pending.swap(slot.leftovers);
    }
    if (pending.empty()) {
        return;
    }
    std::vector<Leftover> remaining;
    for (auto& leftover : pending) {
        try {
            cgroups_.destroy(leftover.cgroup);
        } catch (const NorthstarError& e) {
            log_warn("Removing cgroups of " + leftover.id + " failed again: " + e.what());
        }
        try {
            mounts_.unmount(leftover.chain);
        } catch (const NorthstarError& e) {
            log_warn("Unmounting " + leftover.id + " failed again: " + e.what());
        }
        if (leftover.chain.held() || leftover.cgroup.valid()) {
            remaining.push_back(std::move(leftover));
        } else {
            log_info("Released the leftovers of " + leftover.id);
        }
    }
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.leftovers.insert(slot.leftovers.end(), remaining.begin(), remaining.end());
}

ContainerInfo Lifecycle::info(const PackageRef& ref, const Container& container) {
    ContainerInfo result;
    result.id = container.id;
    result.ref = ref.to_string();
    result.state = container.state;
    result.pid = container.pid;
    result.mount_point = container.chain.mount_point;
    result.limits = container.limits;
    result.exit = container.exit;
    result.error = container.error;
    return result;
}

ContainerInfo Lifecycle::info(const Slot& slot) const {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (!slot.container) {
        ContainerInfo installed;
        installed.ref = slot.ref.to_string();
        return installed;
    }
    return info(slot.ref, *slot.container);
}

ContainerInfo Lifecycle::status(const std::string& target) const {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto instance = instances_.find(target);
        if (instance != instances_.end()) {
            Slot& slot = *slots_.at(instance->second);
            std::lock_guard<std::mutex> slot_lock(slot.mutex);
            if (slot.container && slot.container->id == target) {
                return info(slot.ref, *slot.container);
            }
            throw NorthstarError(ErrorCode::NotFound, "container " + target + " is gone");
        }
    }
    if (target.find('@') == std::string::npos) {
        throw NorthstarError(ErrorCode::NotFound, "no container " + target);
    }
    PackageRef ref = PackageRef::parse(target);
    if (Slot* slot = find_slot(ref)) {
        return info(*slot);
    }
    PackagePtr package = repositories_.resolve(ref);
    ContainerInfo installed;
    installed.ref = ref.to_string();
    installed.limits = limits_for(*package);
    return installed;
}

std::vector<ContainerInfo> Lifecycle::list() const {
    std::vector<ContainerInfo> result;
    for (const auto& package : repositories_.packages()) {
        const PackageRef ref = package->ref();
        if (Slot* slot = find_slot(ref)) {
            result.push_back(info(*slot));
            continue;
        }
        ContainerInfo installed;
        installed.ref = ref.to_string();
        installed.limits = limits_for(*package);
        result.push_back(installed);
    }
    return result;
}

PackagePtr Lifecycle::install(const std::string& repository, const std::string& npk_path) {
    return repositories_.install(repository, npk_path);
}

void Lifecycle::uninstall(const PackageRef& ref) {
    if (Slot* slot = find_slot(ref)) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->starting || !slot->inbox.empty() ||
            (slot->container && !terminal_state(slot->container->state))) {
            throw NorthstarError(ErrorCode::InvalidState, ref.to_string() + " is in use");
        }
    }
    repositories_.uninstall(ref);
}

// The recorded pid may have been reused since, so only current members of the
// container's cgroup are killed.
void Lifecycle::kill_orphans(const ContainerRecord& record) {
    const CgroupHandle cgroup{record.cgroup_memory, record.cgroup_cpu};
    if (!cgroup.valid()) {
        if (record.pid > 0) {
            log_warn("No cgroup recorded for " + record.id + ", leaving pid " + std::to_string(record.pid) + " alone");
        }
        return;
    }
    std::vector<pid_t> pids;
    try {
        pids = cgroups_.members(cgroup);
    } catch (const NorthstarError& e) {
        log_error("Cannot list the processes of " + record.id + ": " + e.what());
        return;
    }
    for (pid_t pid : pids) {
        log_warn("Killing pid " + std::to_string(pid) + " left in the cgroup of " + record.id);
        kill(pid, SIGKILL);
    }
    auto deadline = std::chrono::steady_clock::now() + ORPHAN_KILL_WAIT;
    for (pid_t pid : pids) {
        while (process_alive(pid) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
}

void Lifecycle::reconcile() {
    for (const auto& record : load_records(config_.run_dir)) {
        log_warn("Cleaning up " + record.id + " left " + container_state_name(record.state) + " by a previous run");
        kill_orphans(record);
        try {
            mounts_.release_orphan(record.mount_point, record.verity_name, record.loop_device);
        } catch (const NorthstarError& e) {
            log_error("Releasing devices of " + record.id + " failed: " + e.what());
        }
        CgroupHandle cgroup{record.cgroup_memory, record.cgroup_cpu};
        try {
            cgroups_.destroy(cgroup);
        } catch (const NorthstarError& e) {
            log_error("Removing cgroups of " + record.id + " failed: " + e.what());
        }
        remove_record(config_.run_dir, record.id);
    }
}

void Lifecycle::shutdown() {
    std::vector<Slot*> slots;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        if (shut_down_) {
            return;
        }
        shutting_down_ = true;
        for (auto& entry : slots_) {
            slots.push_back(entry.second.get());
        }
    }

    std::vector<std::pair<uint64_t, Slot*>> running;
    std::vector<Slot*> busy;
    for (Slot* slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->container && slot->container->state == ContainerState::Running) {
            running.emplace_back(slot->container->start_order, slot);
        } else if (slot->starting) {
            busy.push_back(slot);
        }
    }
    std::sort(running.begin(), running.end(),
              [](const std::pair<uint64_t, Slot*>& a, const std::pair<uint64_t, Slot*>& b) { return a.first > b.first; });
    for (Slot* slot : busy) {
        running.emplace_back(0, slot);
    }

    const std::chrono::milliseconds timeout(config_.stop_timeout_ms);
    for (const auto& entry : running) {
        Message message;
        message.kind = Message::Kind::Stop;
        message.timeout = timeout;
        try {
            post(*entry.second, std::move(message), true).get();
        } catch (const NorthstarError& e) {
            log_warn("Stopping " + entry.second->ref.to_string() + " during shutdown: " + e.what());
        }
    }

    for (Slot* slot : slots) {
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->closing = true;
        }
        slot->wakeup.notify_all();
    }
    for (Slot* slot : slots) {
        if (slot->worker.joinable()) {
            slot->worker.join();
        }
    }

    for (Slot* slot : slots) {
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->container && terminal_state(slot->container->state) &&
                (slot->container->chain.held() || slot->container->cgroup.valid())) {
                Container& container = *slot->container;
                slot->leftovers.push_back(Leftover{container.id, container.chain, container.cgroup});
                container.chain = MountChain();
                container.cgroup = CgroupHandle();
            }
        }
        release_leftovers(*slot);
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& leftover : slot->leftovers) {
            log_error("Resources of " + leftover.id + " are still held at shutdown");
        }
    }
    std::lock_guard<std::mutex> lock(slots_mutex_);
    shut_down_ = true;
}
