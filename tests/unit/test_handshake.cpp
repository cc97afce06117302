#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/crucible_errors.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "protocol/codec.hpp"
#include "protocol/handshake_contract.hpp"
#include "runtime/bootstrap.hpp"
#include "runtime/code_registry.hpp"
#include "runtime/handshake.hpp"
#include "runtime/identifier_pool.hpp"
#include "session/server_client.hpp"
#include "transport/message_channel.hpp"
#include "transport/process.hpp"
#include "runtime_events.hpp"
#include "test_support.hpp"

namespace {

using crucible::core::errors::ErrorCategory;
using crucible::core::errors::get_error;
using crucible::core::errors::get_value;
using crucible::core::errors::is_error;
using crucible::core::errors::take_value;
using crucible::runtime::HandshakeOptions;
using crucible::runtime::HandshakeProtocol;
using crucible::runtime::IdentifierPool;
using crucible::runtime::IdentityOrigin;
using crucible::runtime::NodeClient;
using crucible::testing::EventLog;
using crucible::testing::TempWorkspace;
using crucible::testing::eventually;
using crucible::transport::ChildProcess;
using crucible::transport::SpawnRequest;
using nlohmann::json;

constexpr auto kRequestTimeout = std::chrono::milliseconds(5000);

HandshakeOptions handshake_options(const TempWorkspace& workspace) {
    HandshakeOptions options;
    options.node_executable = CRUCIBLE_TEST_NODE_EXECUTABLE;
    options.socket_dir = workspace.root();
    options.connect_timeout = std::chrono::milliseconds(10000);
    options.request_timeout = kRequestTimeout;
    options.bootstrap.code_units.push_back({"crucible_runtime_module", CRUCIBLE_TEST_RUNTIME_MODULE});
    options.bootstrap.manager_options = json{{"log_level", "info"}};
    return options;
}

ChildProcess spawn_node(const TempWorkspace& workspace, const std::string& identity,
                        const std::string& script, std::vector<std::string> leading = {}) {
    SpawnRequest request;
    request.executable = CRUCIBLE_TEST_NODE_EXECUTABLE;
    request.args = std::move(leading);
    const std::vector<std::string> rest = {
        "--sname", identity, "--socket-dir", workspace.root().string(),
        "--eval", script, "--",
        crucible::protocol::parent_address(workspace.root(), identity)};
    request.args.insert(request.args.end(), rest.begin(), rest.end());
    auto spawned = crucible::transport::spawn_executable(request);
    EXPECT_FALSE(is_error(spawned));
    return take_value(spawned);
}

TEST(HandshakeTest, MissingExecutableAcquiresNothing) {
    TempWorkspace workspace;
    IdentifierPool pool(std::chrono::milliseconds(0));
    HandshakeOptions options = handshake_options(workspace);
    options.node_executable = workspace.root() / "no-such-node";

    auto connected = HandshakeProtocol(pool).connect(options);
    ASSERT_TRUE(is_error(connected));
    EXPECT_EQ(get_error(connected).category, ErrorCategory::Spawn);
    EXPECT_EQ(get_error(connected).code, "executable_not_found");
    EXPECT_EQ(pool.synthesized_count(), 0u);
}

TEST(HandshakeTest, RejectsMultiLineInitScript) {
    TempWorkspace workspace;
    IdentifierPool pool(std::chrono::milliseconds(0));
    HandshakeOptions options = handshake_options(workspace);
    options.init_script = "ready;\nawait_manager";

    auto connected = HandshakeProtocol(pool).connect(options);
    ASSERT_TRUE(is_error(connected));
    EXPECT_EQ(get_error(connected).code, "invalid_init_script");
    EXPECT_EQ(pool.synthesized_count(), 0u);
}

TEST(HandshakeTest, EarlyExitIsReportedAndNameReturned) {
    TempWorkspace workspace;
    IdentifierPool pool(std::chrono::milliseconds(0));
    HandshakeOptions options = handshake_options(workspace);
    options.node_executable = "/bin/false";

    auto connected = HandshakeProtocol(pool).connect(options);
    ASSERT_TRUE(is_error(connected));
    EXPECT_EQ(get_error(connected).category, ErrorCategory::Handshake);
    EXPECT_EQ(get_error(connected).code, "process_terminated");
    EXPECT_EQ(get_error(connected).message,
              "Runtime process terminated unexpectedly (exited with status 1)");
    EXPECT_TRUE(eventually([&pool] { return pool.free_count() == 1u; }));
}

TEST(HandshakeTest, SilentRuntimeTimesOut) {
    TempWorkspace workspace;
    IdentifierPool pool(std::chrono::milliseconds(0));
    HandshakeOptions options = handshake_options(workspace);
    options.init_script = "sleep 5000";
    options.connect_timeout = std::chrono::milliseconds(300);

    const auto started = std::chrono::steady_clock::now();
    auto connected = HandshakeProtocol(pool).connect(options);
    ASSERT_TRUE(is_error(connected));
    EXPECT_EQ(get_error(connected).code, "handshake_timeout");
    EXPECT_EQ(get_error(connected).message, "Runtime connection timed out");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(3000));
    EXPECT_TRUE(eventually([&pool] { return pool.free_count() == 1u; }));
}

TEST(HandshakeTest, ConnectsWithExternalIdentityAndEvaluates) {
    TempWorkspace workspace;
    IdentifierPool pool(std::chrono::milliseconds(0));
    HandshakeOptions options = handshake_options(workspace);
    options.external_identity = "abcd1234-main";

    auto connected = HandshakeProtocol(pool).connect(options);
    ASSERT_FALSE(is_error(connected)) << get_error(connected).message;
    auto runtime = take_value(connected);

    EXPECT_EQ(runtime.identity.name, "abcd1234-main");
    EXPECT_EQ(runtime.identity.origin, IdentityOrigin::External);
    EXPECT_EQ(runtime.node_address,
              crucible::protocol::node_address(workspace.root(), "abcd1234-main"));
    EXPECT_EQ(runtime.server.address,
              crucible::protocol::server_address(workspace.root(), "abcd1234-main", 1));
    EXPECT_GT(runtime.manager_pid, 0);
    EXPECT_TRUE(runtime.process.running());
    EXPECT_EQ(pool.synthesized_count(), 0u);

    {
        auto client = crucible::session::ServerClient::connect(runtime.server.address, kRequestTimeout);
        ASSERT_FALSE(is_error(client)) << get_error(client).message;
        auto owner = take_value(client);
        EventLog<crucible::session::ServerClient> events(*owner);

        crucible::protocol::EvaluationRequest request;
        request.container = "main";
        request.evaluation = "e1";
        request.code = "1 + 1";
        ASSERT_FALSE(is_error(owner->evaluate(request)));
        const auto response = events.response("e1");
        ASSERT_TRUE(response.has_value());
        EXPECT_EQ(response->result.text, "2");

        owner->stop();
        owner->close();
    }

    // The last server going away takes the manager and then the node down.
    const int status = runtime.process.wait_or_kill(std::chrono::milliseconds(5000));
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_FALSE(std::filesystem::exists(crucible::protocol::code_dir(workspace.root(), "abcd1234-main")));
}

TEST(HandshakeTest, TwoRuntimesGetDistinctNames) {
    TempWorkspace workspace;
    IdentifierPool pool(std::chrono::milliseconds(60000));
    HandshakeProtocol handshake(pool);

    auto first = handshake.connect(handshake_options(workspace));
    ASSERT_FALSE(is_error(first)) << get_error(first).message;
    auto second = handshake.connect(handshake_options(workspace));
    ASSERT_FALSE(is_error(second)) << get_error(second).message;

    auto a = take_value(first);
    auto b = take_value(second);
    EXPECT_NE(a.identity.name, b.identity.name);
    EXPECT_NE(a.server.address, b.server.address);

    a.process.wait_or_kill(std::chrono::milliseconds(0));
    b.process.wait_or_kill(std::chrono::milliseconds(0));
}

TEST(NodeTest, ServesControlRequestsWhileSleeping) {
    TempWorkspace workspace;
    ChildProcess node = spawn_node(workspace, "probe-node", "sleep 10000");
    const std::string address = crucible::protocol::node_address(workspace.root(), "probe-node");
    ASSERT_TRUE(eventually([&address] { return std::filesystem::exists(address); }));

    auto connected = NodeClient::connect(address, kRequestTimeout);
    ASSERT_FALSE(is_error(connected)) << get_error(connected).message;
    auto client = take_value(connected);

    auto version = client->platform_version();
    ASSERT_FALSE(is_error(version));
    EXPECT_EQ(get_value(version).rfind("crucible ", 0), 0u);

    auto present = client->is_code_present("crucible_runtime_module");
    ASSERT_FALSE(is_error(present));
    EXPECT_FALSE(get_value(present));

    auto no_entry = client->start_management_process(json::object());
    ASSERT_TRUE(is_error(no_entry));
    EXPECT_EQ(get_error(no_entry).code, "manager_entry_missing");

    auto no_manager = client->start_connection_server(json::object());
    ASSERT_TRUE(is_error(no_manager));
    EXPECT_EQ(get_error(no_manager).code, "manager_not_running");

    auto binary = crucible::runtime::read_binary_file(CRUCIBLE_TEST_RUNTIME_MODULE);
    ASSERT_FALSE(is_error(binary));
    ASSERT_FALSE(is_error(client->load_code("crucible_runtime_module", get_value(binary))));
    present = client->is_code_present("crucible_runtime_module");
    ASSERT_FALSE(is_error(present));
    EXPECT_TRUE(get_value(present));

    auto first = client->start_management_process(json{{"log_level", "info"}});
    ASSERT_FALSE(is_error(first)) << get_error(first).message;
    auto again = client->start_management_process(json::object());
    ASSERT_FALSE(is_error(again));
    EXPECT_EQ(get_value(first), get_value(again));

    auto status = client->is_management_process_running();
    ASSERT_FALSE(is_error(status));
    EXPECT_TRUE(get_value(status).running);
    EXPECT_EQ(get_value(status).pid, get_value(first));

    auto server = client->start_connection_server(json{{"await_owner_timeout_ms", 2000}});
    ASSERT_FALSE(is_error(server)) << get_error(server).message;
    auto second_server = client->start_connection_server(json{{"await_owner_timeout_ms", 2000}});
    ASSERT_FALSE(is_error(second_server));
    EXPECT_NE(get_value(server).address, get_value(second_server).address);
    EXPECT_NE(get_value(server).pid, get_value(second_server).pid);

    node.wait_or_kill(std::chrono::milliseconds(0));
}

TEST(NodeTest, RejectsUnknownControlRequest) {
    TempWorkspace workspace;
    ChildProcess node = spawn_node(workspace, "odd-node", "sleep 10000");
    const std::string address = crucible::protocol::node_address(workspace.root(), "odd-node");
    ASSERT_TRUE(eventually([&address] { return std::filesystem::exists(address); }));

    auto connected = crucible::transport::connect_unix(address);
    ASSERT_FALSE(is_error(connected));
    auto channel = take_value(connected);
    auto reply = crucible::transport::request_reply(
        *channel, crucible::transport::make_message("reboot"), kRequestTimeout);
    ASSERT_FALSE(is_error(reply));
    auto unwrapped = crucible::protocol::unwrap_reply(get_value(reply), ErrorCategory::Bootstrap);
    ASSERT_TRUE(is_error(unwrapped));
    EXPECT_EQ(get_error(unwrapped).code, "unknown_request");

    node.wait_or_kill(std::chrono::milliseconds(0));
}

TEST(NodeTest, ExitsWithoutAcknowledgement) {
    TempWorkspace workspace;
    const std::string identity = "lonely-node";
    auto bound = crucible::transport::UnixListener::bind(
        crucible::protocol::parent_address(workspace.root(), identity));
    ASSERT_FALSE(is_error(bound));
    auto listener = take_value(bound);

    ChildProcess node = spawn_node(workspace, identity, "ready;await_ack 200;await_manager");

    auto accepted = listener->accept();
    ASSERT_FALSE(is_error(accepted));
    auto channel = take_value(accepted);
    auto ready = channel->receive(kRequestTimeout);
    ASSERT_FALSE(is_error(ready));
    auto signal = crucible::protocol::decode<crucible::protocol::ReadySignal>(get_value(ready));
    ASSERT_FALSE(is_error(signal));
    EXPECT_EQ(get_value(signal).identity, identity);
    EXPECT_EQ(get_value(signal).address, crucible::protocol::node_address(workspace.root(), identity));
    EXPECT_EQ(get_value(signal).pid, node.pid());

    const int status = node.wait_or_kill(std::chrono::milliseconds(5000));
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 1);
}

TEST(NodeTest, RejectsBadCommandLine) {
    SpawnRequest request;
    request.executable = CRUCIBLE_TEST_NODE_EXECUTABLE;
    request.args = {"--sname", "x"};
    auto spawned = crucible::transport::spawn_executable(request);
    ASSERT_FALSE(is_error(spawned));
    auto node = take_value(spawned);

    const int status = node.wait_or_kill(std::chrono::milliseconds(5000));
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 2);
}

TEST(NodeTest, RejectsMalformedLifeline) {
    TempWorkspace workspace;
    ChildProcess node = spawn_node(workspace, "bad-lifeline", "sleep 10000", {"--lifeline-fd", "three"});

    const int status = node.wait_or_kill(std::chrono::milliseconds(5000));
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 2);
}

TEST(NodeTest, ExitsWhenLifelineCloses) {
    TempWorkspace workspace;
    int lifeline[2] = {-1, -1};
    ASSERT_EQ(::pipe(lifeline), 0);
    // Only the read end may reach the node.
    ASSERT_EQ(::fcntl(lifeline[1], F_SETFD, FD_CLOEXEC), 0);

    ChildProcess node = spawn_node(workspace, "tethered-node", "sleep 10000",
                                   {"--lifeline-fd", std::to_string(lifeline[0])});
    static_cast<void>(::close(lifeline[0]));
    const std::string address = crucible::protocol::node_address(workspace.root(), "tethered-node");
    ASSERT_TRUE(eventually([&address] { return std::filesystem::exists(address); }));
    EXPECT_TRUE(node.running());

    static_cast<void>(::close(lifeline[1]));
    const int status = node.wait_or_kill(std::chrono::milliseconds(5000));
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 1);
}

}  // namespace
