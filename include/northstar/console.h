#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "northstar/config.h"
#include "northstar/lifecycle.h"
#include "northstar/pipe.h"

json ok_response(const json& id, const json& payload);
json error_response(const json& id, ErrorCode code, const std::string& message);

// Control endpoint. Every connection gets a reader thread that executes requests and a
// writer thread that drains the connection's outbound queue.
class ConsoleServer {
public:
    ConsoleServer(const ConsoleEndpoint& endpoint, Lifecycle& lifecycle, int default_stop_timeout_ms);
    ~ConsoleServer();

    ConsoleServer(const ConsoleServer&) = delete;
    ConsoleServer& operator=(const ConsoleServer&) = delete;

    void start();
    void stop();

    // Port actually bound, useful with tcp port 0.
    int port() const { return bound_port_; }

    // Executes one request. Throws ProtocolError for a malformed one.
    json dispatch(const json& request, bool& subscribe);

private:
    struct Connection {
        uint64_t id = 0;
        UniqueFd fd;
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<json> outbox;
        bool closed = false;
        std::atomic<bool> subscribed{false};
        std::atomic<bool> finished{false};
        std::thread reader;
        std::thread writer;
    };

    void accept_loop();
    void serve(std::shared_ptr<Connection> connection);
    void drain(std::shared_ptr<Connection> connection);
    void enqueue(Connection& connection, json message);
    void close_connection(Connection& connection);
    void broadcast(const StateEvent& event);
    void reap_connections();

    ConsoleEndpoint endpoint_;
    Lifecycle& lifecycle_;
    int default_stop_timeout_ms_;

    UniqueFd listener_;
    int bound_port_ = 0;
    std::thread acceptor_;
    std::atomic<bool> running_{false};
    int subscription_ = 0;

    std::mutex connections_mutex_;
    std::map<uint64_t, std::shared_ptr<Connection>> connections_;
    uint64_t next_connection_ = 1;
};

// Client side connect, used by tooling and tests.
UniqueFd connect_console(const ConsoleEndpoint& endpoint);
