#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "transport/message_channel.hpp"
#include "test_support.hpp"

namespace {

using crucible::core::errors::get_error;
using crucible::core::errors::get_value;
using crucible::core::errors::is_error;
using crucible::core::errors::take_value;
using crucible::testing::TempWorkspace;
using crucible::transport::connect_unix;
using crucible::transport::make_channel_pair;
using crucible::transport::make_message;
using crucible::transport::message_type;
using crucible::transport::MessageChannel;
using crucible::transport::UnixListener;
using nlohmann::json;

TEST(MessageChannelTest, DeliversMessagesInOrder) {
    auto pair = make_channel_pair();
    ASSERT_FALSE(is_error(pair));
    auto [left, right] = take_value(pair);

    ASSERT_FALSE(is_error(left->send(make_message("first", {{"n", 1}}))));
    ASSERT_FALSE(is_error(left->send(make_message("second", {{"n", 2}}))));

    auto first = right->receive(std::chrono::milliseconds(1000));
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(message_type(get_value(first)), "first");
    EXPECT_EQ(get_value(first)["n"], 1);

    auto second = right->receive(std::chrono::milliseconds(1000));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(message_type(get_value(second)), "second");
}

TEST(MessageChannelTest, CarriesBinaryPayloads) {
    auto pair = make_channel_pair();
    ASSERT_FALSE(is_error(pair));
    auto [left, right] = take_value(pair);

    std::vector<std::uint8_t> bytes(200000);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>(i % 251);
    }
    ASSERT_FALSE(is_error(left->send(make_message("blob", {{"data", json::binary(bytes)}}))));

    auto received = right->receive(std::chrono::milliseconds(2000));
    ASSERT_FALSE(is_error(received));
    const json& data = get_value(received)["data"];
    ASSERT_TRUE(data.is_binary());
    EXPECT_EQ(data.get_binary(), bytes);
}

TEST(MessageChannelTest, TimesOutWithoutTraffic) {
    auto pair = make_channel_pair();
    ASSERT_FALSE(is_error(pair));
    auto [left, right] = take_value(pair);

    auto received = right->receive(std::chrono::milliseconds(50));
    ASSERT_TRUE(is_error(received));
    EXPECT_EQ(get_error(received).code, "channel_timeout");
}

TEST(MessageChannelTest, HandsOutBufferedMessagesBeforeClose) {
    auto pair = make_channel_pair();
    ASSERT_FALSE(is_error(pair));
    auto [left, right] = take_value(pair);

    ASSERT_FALSE(is_error(left->send(make_message("last_words"))));
    left->close();

    auto drained = right->drain();
    ASSERT_FALSE(is_error(drained));
    ASSERT_EQ(get_value(drained).size(), 1u);
    EXPECT_EQ(message_type(get_value(drained)[0]), "last_words");

    auto closed = right->receive(std::chrono::milliseconds(100));
    ASSERT_TRUE(is_error(closed));
    EXPECT_EQ(get_error(closed).code, "channel_closed");
}

TEST(MessageChannelTest, RejectsMalformedFrame) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    MessageChannel reader(fds[0]);

    const std::uint8_t garbage[] = {0, 0, 0, 2, 0xff, 0xff};
    ASSERT_EQ(::write(fds[1], garbage, sizeof(garbage)), static_cast<ssize_t>(sizeof(garbage)));
    ::close(fds[1]);

    auto received = reader.receive(std::chrono::milliseconds(500));
    ASSERT_TRUE(is_error(received));
    EXPECT_EQ(get_error(received).code, "malformed_message");
}

TEST(MessageChannelTest, SendAfterCloseFails) {
    auto pair = make_channel_pair();
    ASSERT_FALSE(is_error(pair));
    auto [left, right] = take_value(pair);
    left->close();
    EXPECT_FALSE(left->is_open());

    auto sent = left->send(make_message("late"));
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "channel_closed");
}

TEST(UnixListenerTest, AcceptsConnectionsAndRemovesSocketFile) {
    TempWorkspace workspace;
    const std::string address = (workspace.root() / "nested" / "test.sock").string();
    {
        auto bound = UnixListener::bind(address);
        ASSERT_FALSE(is_error(bound));
        auto listener = take_value(bound);
        EXPECT_TRUE(std::filesystem::exists(address));

        auto client = connect_unix(address);
        ASSERT_FALSE(is_error(client));
        auto accepted = listener->accept();
        ASSERT_FALSE(is_error(accepted));

        auto server_side = take_value(accepted);
        auto client_side = take_value(client);
        auto reply = std::thread([&server_side] {
            auto request = server_side->receive(std::chrono::milliseconds(1000));
            if (!is_error(request)) {
                static_cast<void>(server_side->send(make_message("pong")));
            }
        });
        auto answered = crucible::transport::request_reply(
            *client_side, make_message("ping"), std::chrono::milliseconds(1000));
        reply.join();
        ASSERT_FALSE(is_error(answered));
        EXPECT_EQ(message_type(get_value(answered)), "pong");
    }
    EXPECT_FALSE(std::filesystem::exists(address));
}

TEST(UnixListenerTest, RejectsOverlongAddress) {
    auto bound = UnixListener::bind("/tmp/" + std::string(200, 'x') + ".sock");
    ASSERT_TRUE(is_error(bound));
    EXPECT_EQ(get_error(bound).code, "invalid_address");
}

TEST(UnixListenerTest, ConnectFailsWithoutListener) {
    TempWorkspace workspace;
    auto client = connect_unix((workspace.root() / "nobody.sock").string());
    ASSERT_TRUE(is_error(client));
    EXPECT_EQ(get_error(client).code, "connect_failed");
}

TEST(MessageTypeTest, ReadsTypeTag) {
    EXPECT_EQ(message_type(make_message("attach")), "attach");
    EXPECT_EQ(message_type(json::array()), "");
    EXPECT_EQ(message_type(json{{"type", 3}}), "");
}

}  // namespace
