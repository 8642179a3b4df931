#include "northstar/console.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "northstar/error.h"
#include "northstar/options.h"

namespace {

constexpr int LISTEN_BACKLOG = 16;

std::string string_field(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || !it->is_string()) {
        throw NorthstarError(ErrorCode::ProtocolError, std::string("request needs a string '") + key + "'");
    }
    return it->get<std::string>();
}

json package_json(const Package& package) {
    return json{
            {"ref", package.ref().to_string()},
            {"repository", package.repository},
            {"arch", package.manifest.arch},
            {"init", package.manifest.init}
    };
}

sockaddr_un unix_address(const std::string& path) {
    sockaddr_un address{};
    address.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(address.sun_path)) {
        throw NorthstarError(ErrorCode::ConfigError, "invalid console socket path '" + path + "'");
    }
    std::strncpy(address.sun_path, path.c_str(), sizeof(address.sun_path) - 1);
    return address;
}

// Resolves host:port and runs action on each candidate until one returns a valid socket.
template <typename Action>
UniqueFd with_tcp_address(const ConsoleEndpoint& endpoint, bool passive, Action action) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = passive ? AI_PASSIVE : 0;
    addrinfo* result = nullptr;
    const std::string port = std::to_string(endpoint.port);
    int rc = getaddrinfo(endpoint.host.empty() ? nullptr : endpoint.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw NorthstarError(ErrorCode::Io, "cannot resolve " + endpoint.host + ": " + gai_strerror(rc));
    }
    int last_errno = 0;
    for (addrinfo* candidate = result; candidate != nullptr; candidate = candidate->ai_next) {
        UniqueFd fd(socket(candidate->ai_family, candidate->ai_socktype | SOCK_CLOEXEC, candidate->ai_protocol));
        if (!fd.valid()) {
            last_errno = errno;
            continue;
        }
        if (action(fd.get(), candidate->ai_addr, candidate->ai_addrlen)) {
            freeaddrinfo(result);
            return fd;
        }
        last_errno = errno;
    }
    freeaddrinfo(result);
    throw system_failure(ErrorCode::Io, "cannot use " + endpoint.host + ":" + port, last_errno);
}

} // namespace

json ok_response(const json& id, const json& payload) {
    return json{{"id", id}, {"response", "ok"}, {"payload", payload}};
}

json error_response(const json& id, ErrorCode code, const std::string& message) {
    return json{
            {"id", id},
            {"response", "error"},
            {"error", {{"kind", error_code_name(code)}, {"message", message}}}
    };
}

ConsoleServer::ConsoleServer(const ConsoleEndpoint& endpoint, Lifecycle& lifecycle, int default_stop_timeout_ms)
    : endpoint_(endpoint), lifecycle_(lifecycle), default_stop_timeout_ms_(default_stop_timeout_ms) {}

ConsoleServer::~ConsoleServer() {
    stop();
}

void ConsoleServer::start() {
    if (endpoint_.kind == EndpointKind::Unix) {
        sockaddr_un address = unix_address(endpoint_.path);
        listener_.reset(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
        if (!listener_.valid()) {
            throw system_failure(ErrorCode::Io, "console socket", errno);
        }
        if (unlink(endpoint_.path.c_str()) != 0 && errno != ENOENT) {
            throw system_failure(ErrorCode::Io, "cannot remove stale socket " + endpoint_.path, errno);
        }
        if (bind(listener_.get(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
            throw system_failure(ErrorCode::Io, "cannot bind " + endpoint_.path, errno);
        }
    } else {
        listener_ = with_tcp_address(endpoint_, true, [](int fd, const sockaddr* address, socklen_t length) {
            int reuse = 1;
            return setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == 0 &&
                   bind(fd, address, length) == 0;
        });
        sockaddr_storage bound{};
        socklen_t length = sizeof(bound);
        if (getsockname(listener_.get(), reinterpret_cast<sockaddr*>(&bound), &length) == 0) {
            if (bound.ss_family == AF_INET) {
                bound_port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
            } else if (bound.ss_family == AF_INET6) {
                bound_port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
            }
        }
    }
    if (listen(listener_.get(), LISTEN_BACKLOG) != 0) {
        throw system_failure(ErrorCode::Io, "console listen", errno);
    }

    subscription_ = lifecycle_.subscribe([this](const StateEvent& event) { broadcast(event); });
    running_ = true;
    acceptor_ = std::thread(&ConsoleServer::accept_loop, this);
    if (endpoint_.kind == EndpointKind::Unix) {
        log_info("Console listening on unix://" + endpoint_.path);
    } else {
        log_info("Console listening on tcp://" + endpoint_.host + ":" + std::to_string(bound_port_));
    }
}

void ConsoleServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    lifecycle_.unsubscribe(subscription_);
    shutdown(listener_.get(), SHUT_RDWR);
    if (acceptor_.joinable()) {
        acceptor_.join();
    }
    listener_.reset();
    if (endpoint_.kind == EndpointKind::Unix && unlink(endpoint_.path.c_str()) != 0 && errno != ENOENT) {
        log_warn("Cannot remove console socket " + endpoint_.path + ": " + std::strerror(errno));
    }

    std::map<uint64_t, std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& entry : connections) {
        shutdown(entry.second->fd.get(), SHUT_RDWR);
    }
    for (auto& entry : connections) {
        if (entry.second->reader.joinable()) {
            entry.second->reader.join();
        }
    }
    log_debug("Console stopped");
}

void ConsoleServer::accept_loop() {
    while (running_) {
        int fd = accept4(listener_.get(), nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (!running_) {
                break;
            }
            const int error = errno;
            if (error == EINTR || error == ECONNABORTED) {
                continue;
            }
            log_error(std::string("Console accept failed: ") + std::strerror(error));
            if (error == EBADF || error == EINVAL) {
                break;
            }
            continue;
        }
        reap_connections();

        auto connection = std::make_shared<Connection>();
        connection->fd.reset(fd);
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connection->id = next_connection_++;
            connections_[connection->id] = connection;
        }
        log_debug("Console connection " + std::to_string(connection->id) + " opened");
        connection->writer = std::thread(&ConsoleServer::drain, this, connection);
        connection->reader = std::thread(&ConsoleServer::serve, this, connection);
    }
}

void ConsoleServer::reap_connections() {
    std::vector<std::shared_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second->finished) {
                finished.push_back(it->second);
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : finished) {
        if (connection->reader.joinable()) {
            connection->reader.join();
        }
    }
}

void ConsoleServer::serve(std::shared_ptr<Connection> connection) {
    try {
        json request;
        while (recv_frame(connection->fd.get(), request)) {
            log_trace("Console connection " + std::to_string(connection->id) + " <- " + request.dump());
            const json id = request.is_object() ? request.value("id", json()) : json();
            bool subscribe = false;
            json response;
            try {
                response = dispatch(request, subscribe);
            } catch (const NorthstarError& e) {
                log_warn("Closing console connection " + std::to_string(connection->id) + ": " + e.what());
                enqueue(*connection, error_response(id, e.code(), e.what()));
                break;
            }
            if (subscribe) {
                connection->subscribed = true;
            }
            enqueue(*connection, std::move(response));
        }
    } catch (const NorthstarError& e) {
        log_warn("Closing console connection " + std::to_string(connection->id) + ": " + e.what());
        enqueue(*connection, error_response(json(), e.code(), e.what()));
    }

    close_connection(*connection);
    if (connection->writer.joinable()) {
        connection->writer.join();
    }
    shutdown(connection->fd.get(), SHUT_RDWR);
    log_debug("Console connection " + std::to_string(connection->id) + " closed");
    connection->finished = true;
}

void ConsoleServer::drain(std::shared_ptr<Connection> connection) {
    while (true) {
        json message;
        {
            std::unique_lock<std::mutex> lock(connection->mutex);
            connection->ready.wait(lock, [&] { return connection->closed || !connection->outbox.empty(); });
            if (connection->outbox.empty()) {
                return;
            }
            message = std::move(connection->outbox.front());
            connection->outbox.pop_front();
        }
        if (!send_frame(connection->fd.get(), message)) {
            log_debug("Console connection " + std::to_string(connection->id) + " write failed: " +
                      std::strerror(errno));
            {
                std::lock_guard<std::mutex> lock(connection->mutex);
                connection->closed = true;
                connection->outbox.clear();
            }
            // Wakes the reader.
            shutdown(connection->fd.get(), SHUT_RDWR);
            return;
        }
    }
}

void ConsoleServer::enqueue(Connection& connection, json message) {
    {
        std::lock_guard<std::mutex> lock(connection.mutex);
        if (connection.closed) {
            return;
        }
        connection.outbox.push_back(std::move(message));
    }
    connection.ready.notify_one();
}

void ConsoleServer::close_connection(Connection& connection) {
    {
        std::lock_guard<std::mutex> lock(connection.mutex);
        connection.closed = true;
    }
    connection.ready.notify_all();
}

void ConsoleServer::broadcast(const StateEvent& event) {
    const json message = {{"event", event.to_json()}};
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& entry : connections_) {
        if (entry.second->subscribed) {
            enqueue(*entry.second, message);
        }
    }
}

json ConsoleServer::dispatch(const json& request, bool& subscribe) {
    if (!request.is_object() || !request.contains("id")) {
        throw NorthstarError(ErrorCode::ProtocolError, "request must be an object with an id");
    }
    const json id = request["id"];
    const std::string command = string_field(request, "request");
    log_debug("Console request " + id.dump() + ": " + command);

    try {
        if (command == "list") {
            json payload = json::array();
            for (const auto& info : lifecycle_.list()) {
                payload.push_back(info.to_json());
            }
            return ok_response(id, payload);
        }
        if (command == "status") {
            return ok_response(id, lifecycle_.status(string_field(request, "container")).to_json());
        }
        if (command == "start") {
            const PackageRef ref = PackageRef::parse(string_field(request, "ref"));
            return ok_response(id, lifecycle_.start(ref).to_json());
        }
        if (command == "stop") {
            const PackageRef ref = PackageRef::parse(string_field(request, "ref"));
            int timeout_ms = default_stop_timeout_ms_;
            if (request.contains("timeout_ms")) {
                const json& timeout = request["timeout_ms"];
                if (!timeout.is_number_unsigned()) {
                    throw NorthstarError(ErrorCode::ProtocolError, "timeout_ms must be a non-negative integer");
                }
                timeout_ms = static_cast<int>(std::min<uint64_t>(timeout.get<uint64_t>(), INT_MAX));
            }
            return ok_response(id, lifecycle_.stop(ref, std::chrono::milliseconds(timeout_ms)).to_json());
        }
        if (command == "install") {
            PackagePtr package = lifecycle_.install(string_field(request, "repository"), string_field(request, "path"));
            return ok_response(id, package_json(*package));
        }
        if (command == "uninstall") {
            const PackageRef ref = PackageRef::parse(string_field(request, "ref"));
            lifecycle_.uninstall(ref);
            return ok_response(id, json{{"ref", ref.to_string()}});
        }
        if (command == "subscribe") {
            subscribe = true;
            return ok_response(id, json{{"subscribed", true}});
        }
    } catch (const NorthstarError& e) {
        if (e.code() == ErrorCode::ProtocolError) {
            throw;
        }
        log_info("Console " + command + " failed: " + error_code_name(e.code()) + ": " + e.what());
        return error_response(id, e.code(), e.what());
    }
    throw NorthstarError(ErrorCode::ProtocolError, "unknown request '" + command + "'");
}

UniqueFd connect_console(const ConsoleEndpoint& endpoint) {
    if (endpoint.kind == EndpointKind::Unix) {
        sockaddr_un address = unix_address(endpoint.path);
        UniqueFd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
        if (!fd.valid()) {
            throw system_failure(ErrorCode::Io, "console socket", errno);
        }
        if (connect(fd.get(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
            throw system_failure(ErrorCode::Io, "cannot connect to " + endpoint.path, errno);
        }
        return fd;
    }
    return with_tcp_address(endpoint, false, [](int fd, const sockaddr* address, socklen_t length) {
        return connect(fd, address, length) == 0;
    });
}
