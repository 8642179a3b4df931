#include <csignal>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>

#include "northstar/cgroups.h"
#include "northstar/console.h"
#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/lifecycle.h"
#include "northstar/mount.h"
#include "northstar/pipe.h"
#include "northstar/repository.h"
#include "northstar/supervisor.h"
#include "test_support.h"

namespace {

// Console client that fails instead of hanging when the server goes quiet.
class Client {
public:
    explicit Client(const ConsoleEndpoint& endpoint) : fd_(connect_console(endpoint)) {
        timeval timeout{10, 0};
        setsockopt(fd_.get(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    }

    void send(const json& message) { ASSERT_TRUE(send_frame(fd_.get(), message)); }

    json receive() {
        json message;
        if (!recv_frame(fd_.get(), message)) {
            return json();
        }
        return message;
    }

    // Skips events until the response carrying id arrives.
    json response(int id) {
        while (true) {
            json message = receive();
            if (message.is_null() || (message.contains("id") && message["id"] == id)) {
                return message;
            }
            if (message.contains("event")) {
                events.push_back(message["event"]);
            }
        }
    }

    json request(int id, json body) {
        body["id"] = id;
        send(body);
        return response(id);
    }

    std::vector<json> events;

private:
    UniqueFd fd_;
};

} // namespace

class ConsoleTest : public ::testing::Test {
protected:
    ScratchDir scratch{"ns-con"};
    SigningKey key;
    Config config = test_config(scratch.path());
    FakeBlockDevices devices;
    FakeCgroupFs cgroupfs{true};
    FakeLauncher launcher;

    std::unique_ptr<RepositoryManager> repositories;
    std::unique_ptr<MountEngine> mounts;
    std::unique_ptr<CgroupController> cgroups;
    std::unique_ptr<Supervisor> supervisor;
    std::unique_ptr<Lifecycle> lifecycle;
    std::unique_ptr<ConsoleServer> console;
    ConsoleEndpoint endpoint;

    void SetUp() override {
        signal(SIGPIPE, SIG_IGN);
        const std::string dir = scratch.file("npk");
        ASSERT_TRUE(ensure_directory(dir));
        write_npk(path_join(dir, "hello-0.1.0.npk"), test_manifest("hello", "0.1.0"), key);
        write_npk(path_join(dir, "evil-1.0.npk"), test_manifest("evil", "1.0"), key, true);

        repositories = std::make_unique<RepositoryManager>();
        repositories->add(std::make_shared<Repository>("default", dir, key.public_key()));
        repositories->scan_all();
        mounts = std::make_unique<MountEngine>(devices, 3, std::chrono::milliseconds(5000));
        cgroups = std::make_unique<CgroupController>(cgroupfs, config.cgroups);
        supervisor = std::make_unique<Supervisor>(launcher, NoDebug{}, config.log_dir);
        lifecycle = std::make_unique<Lifecycle>(config, *repositories, *mounts, *cgroups, *supervisor);

        endpoint = parse_console_endpoint(config.console);
        console = std::make_unique<ConsoleServer>(endpoint, *lifecycle, config.stop_timeout_ms);
        console->start();
    }

    void TearDown() override {
        console.reset();
        lifecycle.reset();
        supervisor.reset();
    }
};

TEST(ConsoleResponseTest, ResponsesCarryTheRequestId) {
    EXPECT_EQ(json({{"id", 4}, {"response", "ok"}, {"payload", {{"a", 1}}}}), ok_response(4, json{{"a", 1}}));
    json error = error_response("x", ErrorCode::ResourceExhausted, "no loop devices");
    EXPECT_EQ("x", error["id"]);
    EXPECT_EQ("error", error["response"]);
    EXPECT_EQ("ResourceExhausted", error["error"]["kind"]);
    EXPECT_EQ("no loop devices", error["error"]["message"]);
}

TEST_F(ConsoleTest, DispatchRejectsMalformedRequests) {
    bool subscribe = false;
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] { console->dispatch(json::array(), subscribe); }));
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] { console->dispatch(json{{"request", "list"}}, subscribe); }));
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] { console->dispatch(json{{"id", 1}}, subscribe); }));
    EXPECT_EQ(ErrorCode::ProtocolError,
              error_code_of([&] { console->dispatch(json{{"id", 1}, {"request", "reboot"}}, subscribe); }));
    EXPECT_EQ(ErrorCode::ProtocolError,
              error_code_of([&] { console->dispatch(json{{"id", 1}, {"request", "start"}}, subscribe); }));
    EXPECT_EQ(ErrorCode::ProtocolError, error_code_of([&] {
        console->dispatch(json{{"id", 1}, {"request", "stop"}, {"ref", "hello@0.1.0"}, {"timeout_ms", -5}},
                          subscribe);
    }));
    EXPECT_FALSE(subscribe);

    json response = console->dispatch(json{{"id", 2}, {"request", "subscribe"}}, subscribe);
    EXPECT_TRUE(subscribe);
    EXPECT_EQ("ok", response["response"]);
}

TEST_F(ConsoleTest, ListStartStatusStop) {
    Client client(endpoint);
    json list = client.request(1, {{"request", "list"}});
    ASSERT_EQ("ok", list["response"]);
    ASSERT_EQ(1u, list["payload"].size());
    EXPECT_EQ("hello@0.1.0", list["payload"][0]["ref"]);
    EXPECT_EQ("installed", list["payload"][0]["state"]);

    json started = client.request(2, {{"request", "start"}, {"ref", "hello@0.1.0"}});
    ASSERT_EQ("ok", started["response"]) << started.dump();
    EXPECT_EQ("running", started["payload"]["state"]);
    const std::string id = started["payload"]["id"].get<std::string>();
    EXPECT_EQ("hello-0.1.0-1", id);

    json status = client.request(3, {{"request", "status"}, {"container", id}});
    EXPECT_EQ("running", status["payload"]["state"]);
    EXPECT_GT(status["payload"]["pid"].get<int>(), 0);

    json stopped = client.request(4, {{"request", "stop"}, {"ref", "hello@0.1.0"}, {"timeout_ms", 2000}});
    ASSERT_EQ("ok", stopped["response"]) << stopped.dump();
    EXPECT_EQ("stopped", stopped["payload"]["state"]);
    EXPECT_EQ(json({{"signaled", SIGTERM}}), stopped["payload"]["exit"]);
}

TEST_F(ConsoleTest, FailuresAreTypedErrors) {
    Client client(endpoint);
    json missing = client.request(1, {{"request", "start"}, {"ref", "nothing@1.0"}});
    EXPECT_EQ("error", missing["response"]);
    EXPECT_EQ("NotFound", missing["error"]["kind"]);

    json evil = client.request(2, {{"request", "start"}, {"ref", "evil@1.0"}});
    EXPECT_EQ("SignatureInvalid", evil["error"]["kind"]);

    json idle = client.request(3, {{"request", "stop"}, {"ref", "hello@0.1.0"}});
    EXPECT_EQ("InvalidState", idle["error"]["kind"]);

    json bad_ref = client.request(4, {{"request", "start"}, {"ref", "hello"}});
    EXPECT_EQ("error", bad_ref["response"]);

    devices.integrity_failure = true;
    json corrupt = client.request(5, {{"request", "start"}, {"ref", "hello@0.1.0"}});
    EXPECT_EQ("IntegrityMismatch", corrupt["error"]["kind"]);

    json list = client.request(6, {{"request", "list"}});
    EXPECT_EQ("ok", list["response"]);
}

TEST_F(ConsoleTest, MalformedRequestClosesConnection) {
    Client client(endpoint);
    client.send(json{{"id", 9}, {"request", "explode"}});
    json response = client.receive();
    EXPECT_EQ(9, response["id"]);
    EXPECT_EQ("ProtocolError", response["error"]["kind"]);
    EXPECT_TRUE(client.receive().is_null());

    Client next(endpoint);
    EXPECT_EQ("ok", next.request(1, {{"request", "list"}})["response"]);
}

TEST_F(ConsoleTest, SubscribersReceiveStateEvents) {
    Client watcher(endpoint);
    ASSERT_EQ("ok", watcher.request(1, {{"request", "subscribe"}})["response"]);
    Client client(endpoint);
    ASSERT_EQ("ok", client.request(1, {{"request", "start"}, {"ref", "hello@0.1.0"}})["response"]);
    ASSERT_EQ("ok", client.request(2, {{"request", "stop"}, {"ref", "hello@0.1.0"}})["response"]);
    EXPECT_TRUE(client.events.empty());

    std::vector<std::string> states;
    while (states.empty() || states.back() != "stopped") {
        json message = watcher.receive();
        ASSERT_TRUE(message.contains("event")) << message.dump();
        EXPECT_EQ("hello-0.1.0-1", message["event"]["container"]);
        EXPECT_EQ("hello@0.1.0", message["event"]["ref"]);
        EXPECT_FALSE(message["event"]["timestamp"].get<std::string>().empty());
        states.push_back(message["event"]["state"].get<std::string>());
    }
    const std::vector<std::string> expected = {"installed", "mounted", "starting", "running", "stopping", "stopped"};
    EXPECT_EQ(expected, states);
}

TEST_F(ConsoleTest, InstallAndUninstall) {
    const std::string upload = scratch.file("fresh.npk");
    write_npk(upload, test_manifest("fresh", "2.0"), key);
    Client client(endpoint);
    json installed = client.request(1, {{"request", "install"}, {"repository", "default"}, {"path", upload}});
    ASSERT_EQ("ok", installed["response"]) << installed.dump();
    EXPECT_EQ("fresh@2.0", installed["payload"]["ref"]);
    EXPECT_EQ(2u, client.request(2, {{"request", "list"}})["payload"].size());

    json removed = client.request(3, {{"request", "uninstall"}, {"ref", "fresh@2.0"}});
    EXPECT_EQ("ok", removed["response"]);
    EXPECT_EQ(1u, client.request(4, {{"request", "list"}})["payload"].size());
}

TEST_F(ConsoleTest, TcpEndpointWorks) {
    ConsoleEndpoint tcp = parse_console_endpoint("tcp://127.0.0.1:0");
    ConsoleServer server(tcp, *lifecycle, 1000);
    server.start();
    ASSERT_GT(server.port(), 0);
    tcp.port = server.port();
    Client client(tcp);
    EXPECT_EQ("ok", client.request(1, {{"request", "list"}})["response"]);
    server.stop();
}
