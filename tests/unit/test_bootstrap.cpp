#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/platform.hpp"
#include "core/errors/crucible_errors.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "protocol/codec.hpp"
#include "runtime/bootstrap.hpp"
#include "runtime/code_registry.hpp"
#include "transport/message_channel.hpp"
#include "test_support.hpp"

namespace {

using crucible::core::errors::CrucibleError;
using crucible::core::errors::ErrorCategory;
using crucible::core::errors::get_error;
using crucible::core::errors::get_value;
using crucible::core::errors::is_error;
using crucible::core::errors::take_value;
using crucible::runtime::BootstrapOptions;
using crucible::runtime::CodeRegistry;
using crucible::runtime::describe_load_failure;
using crucible::runtime::NodeClient;
using crucible::runtime::read_binary_file;
using crucible::runtime::RuntimeBootstrap;
using crucible::testing::TempWorkspace;
using nlohmann::json;

// Serves the control requests of a node from plain state, on the other end
// of a socket pair.
class FakeNode {
public:
    bool code_present = false;
    bool fail_load = false;
    bool manager_running = false;
    std::string version = crucible::core::config::platform_version();

    FakeNode() {
        auto pair = crucible::transport::make_channel_pair();
        auto channels = take_value(pair);
        client_end_ = std::move(channels.first);
        node_end_ = std::move(channels.second);
    }

    ~FakeNode() {
        stop_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::unique_ptr<NodeClient> start() {
        thread_ = std::thread([this] { serve(); });
        return std::make_unique<NodeClient>(std::move(client_end_), std::chrono::milliseconds(2000));
    }

    std::vector<std::string> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        while (!stop_) {
            auto received = node_end_->receive(std::chrono::milliseconds(50));
            if (is_error(received)) {
                if (get_error(received).code == "channel_timeout") {
                    continue;
                }
                return;
            }
            const json& request = get_value(received);
            const std::string type = crucible::transport::message_type(request);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(type);
            }
            static_cast<void>(node_end_->send(reply(type, request)));
        }
    }

    json reply(const std::string& type, const json& request) {
        using namespace crucible::protocol;
        if (type == kIsCodePresent) {
            return ok_reply(json{{"present", code_present}});
        }
        if (type == kLoadCode) {
            if (fail_load || !request.contains("binary") || !request["binary"].is_binary()) {
                return error_reply(CrucibleError{ErrorCategory::Bootstrap,
                                                 "invalid ELF header", "code_load_failed"});
            }
            code_present = true;
            return ok_reply();
        }
        if (type == kPlatformVersion) {
            return ok_reply(json{{"version", version}});
        }
        if (type == kIsManagerRunning) {
            return ok_reply(json{{"running", manager_running}, {"pid", manager_running ? 4242 : -1}});
        }
        if (type == kStartManager) {
            manager_running = true;
            return ok_reply(json{{"pid", 4242}});
        }
        if (type == kStartConnectionServer) {
            return ok_reply(json{{"server", ServerHandle{"/tmp/fake.server.1.sock", 77}}});
        }
        return error_reply(CrucibleError{ErrorCategory::Input, "unknown", "unknown_request"});
    }

    std::unique_ptr<crucible::transport::MessageChannel> client_end_;
    std::unique_ptr<crucible::transport::MessageChannel> node_end_;
    std::atomic<bool> stop_{false};
    std::mutex mutex_;
    std::vector<std::string> requests_;
    std::thread thread_;
};

BootstrapOptions options_with_unit(const TempWorkspace& workspace) {
    BootstrapOptions options;
    options.code_units.push_back({"unit", workspace.write("unit.so", "not really a library")});
    options.manager_options = json{{"log_level", "info"}};
    return options;
}

TEST(DescribeLoadFailureTest, MentionsBothVersionsOnMismatch) {
    const CrucibleError error = describe_load_failure("unit", "bad", "crucible 1", "crucible 2");
    EXPECT_EQ(error.category, ErrorCategory::Bootstrap);
    EXPECT_EQ(error.code, "version_mismatch");
    EXPECT_NE(error.message.find("version mismatch"), std::string::npos);
    EXPECT_NE(error.message.find("crucible 1"), std::string::npos);
    EXPECT_NE(error.message.find("crucible 2"), std::string::npos);
}

TEST(DescribeLoadFailureTest, ReportsReasonWhenVersionsMatch) {
    const CrucibleError error = describe_load_failure("unit", "bad symbol", "crucible 1", "crucible 1");
    EXPECT_EQ(error.code, "code_load_failed");
    EXPECT_NE(error.message.find("bad symbol"), std::string::npos);
}

TEST(RuntimeBootstrapTest, LoadsCodeAndStartsManagerOnFreshNode) {
    TempWorkspace workspace;
    FakeNode node;
    auto client = node.start();
    RuntimeBootstrap bootstrap(*client, options_with_unit(workspace));

    auto result = bootstrap.initialize();
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(get_value(result).manager_pid, 4242);
    EXPECT_EQ(get_value(result).server.address, "/tmp/fake.server.1.sock");
    EXPECT_EQ(get_value(result).server.pid, 77);
    EXPECT_TRUE(bootstrap.code_known_present());
    EXPECT_TRUE(bootstrap.manager_known_running());

    const std::vector<std::string> expected = {
        "is_code_present", "load_code", "is_management_process_running",
        "start_management_process", "start_connection_server"};
    EXPECT_EQ(node.requests(), expected);
}

TEST(RuntimeBootstrapTest, SkipsStepsAlreadySatisfied) {
    TempWorkspace workspace;
    FakeNode node;
    node.code_present = true;
    node.manager_running = true;
    auto client = node.start();
    RuntimeBootstrap bootstrap(*client, options_with_unit(workspace));

    ASSERT_FALSE(is_error(bootstrap.initialize()));
    const std::vector<std::string> expected = {
        "is_code_present", "is_management_process_running", "start_connection_server"};
    EXPECT_EQ(node.requests(), expected);
}

TEST(RuntimeBootstrapTest, DoesNotReprobeOnSecondInitialize) {
    TempWorkspace workspace;
    FakeNode node;
    auto client = node.start();
    RuntimeBootstrap bootstrap(*client, options_with_unit(workspace));

    ASSERT_FALSE(is_error(bootstrap.initialize()));
    const std::size_t first = client->request_count();
    ASSERT_FALSE(is_error(bootstrap.initialize()));
    EXPECT_EQ(client->request_count(), first + 1);
}

TEST(RuntimeBootstrapTest, ReportsVersionMismatchOnLoadFailure) {
    TempWorkspace workspace;
    FakeNode node;
    node.fail_load = true;
    node.version = "crucible 9.9.9 (other)";
    auto client = node.start();
    RuntimeBootstrap bootstrap(*client, options_with_unit(workspace));

    auto result = bootstrap.initialize();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "version_mismatch");
    EXPECT_FALSE(bootstrap.manager_known_running());
}

TEST(RuntimeBootstrapTest, ReportsLoadFailureWithSameVersion) {
    TempWorkspace workspace;
    FakeNode node;
    node.fail_load = true;
    auto client = node.start();
    RuntimeBootstrap bootstrap(*client, options_with_unit(workspace));

    auto result = bootstrap.initialize();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "code_load_failed");
    EXPECT_NE(get_error(result).message.find("invalid ELF header"), std::string::npos);
}

TEST(RuntimeBootstrapTest, FailsWhenUnitFileMissing) {
    TempWorkspace workspace;
    FakeNode node;
    auto client = node.start();
    BootstrapOptions options;
    options.code_units.push_back({"unit", workspace.root() / "absent.so"});
    RuntimeBootstrap bootstrap(*client, options);

    auto result = bootstrap.initialize();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "code_unit_unreadable");
}

TEST(CodeRegistryTest, LoadsRuntimeModuleAndResolvesEntry) {
    TempWorkspace workspace;
    auto binary = read_binary_file(CRUCIBLE_TEST_RUNTIME_MODULE);
    ASSERT_FALSE(is_error(binary));

    CodeRegistry registry(workspace.root() / "code");
    ASSERT_FALSE(is_error(registry.load("crucible_runtime_module", get_value(binary))));
    EXPECT_TRUE(registry.is_loaded("crucible_runtime_module"));
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "code" / "crucible_runtime_module.so"));
    EXPECT_NE(registry.find_symbol(crucible::protocol::kManagerEntrySymbol), nullptr);
    EXPECT_EQ(registry.find_symbol("no_such_symbol"), nullptr);

    crucible::runtime::unload(registry);
    EXPECT_TRUE(registry.loaded_units().empty());
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "code" / "crucible_runtime_module.so"));
}

TEST(CodeRegistryTest, RejectsGarbageAndCleansUp) {
    TempWorkspace workspace;
    CodeRegistry registry(workspace.root() / "code");
    const std::vector<std::uint8_t> garbage = {'n', 'o', 'p', 'e'};

    auto loaded = registry.load("broken", garbage);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).category, ErrorCategory::Bootstrap);
    EXPECT_EQ(get_error(loaded).code, "code_load_failed");
    EXPECT_FALSE(registry.is_loaded("broken"));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "code" / "broken.so"));
}

}  // namespace
