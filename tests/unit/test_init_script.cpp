#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/crucible_errors.hpp"
#include "protocol/init_script.hpp"

namespace {

using crucible::core::errors::get_error;
using crucible::core::errors::get_value;
using crucible::core::errors::is_error;
using crucible::protocol::child_init_script;
using crucible::protocol::contains_newline;
using crucible::protocol::DirectiveKind;
using crucible::protocol::kChildInitScript;
using crucible::protocol::parse_init_script;

TEST(InitScriptTest, DefaultScriptIsSingleLine) {
    EXPECT_FALSE(contains_newline(kChildInitScript));
    EXPECT_TRUE(contains_newline("ready;\nawait_manager"));
    EXPECT_TRUE(contains_newline("ready\r"));
}

TEST(InitScriptTest, ParsesDefaultScript) {
    auto parsed = parse_init_script(std::string(kChildInitScript));
    ASSERT_FALSE(is_error(parsed));
    const auto& directives = get_value(parsed);
    ASSERT_EQ(directives.size(), 3u);
    EXPECT_EQ(directives[0].kind, DirectiveKind::Ready);
    EXPECT_EQ(directives[1].kind, DirectiveKind::AwaitAck);
    EXPECT_EQ(directives[1].duration, std::chrono::milliseconds(10000));
    EXPECT_EQ(directives[2].kind, DirectiveKind::AwaitManager);
}

TEST(InitScriptTest, CustomAckTimeout) {
    const std::string script = child_init_script(std::chrono::milliseconds(250));
    EXPECT_EQ(script, "ready;await_ack 250;await_manager");
    auto parsed = parse_init_script(script);
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed)[1].duration, std::chrono::milliseconds(250));
}

TEST(InitScriptTest, ToleratesWhitespaceAndEmptyStatements) {
    auto parsed = parse_init_script("  sleep 50 ;; ready  ");
    ASSERT_FALSE(is_error(parsed));
    const auto& directives = get_value(parsed);
    ASSERT_EQ(directives.size(), 2u);
    EXPECT_EQ(directives[0].kind, DirectiveKind::Sleep);
    EXPECT_EQ(directives[0].duration, std::chrono::milliseconds(50));
    EXPECT_EQ(directives[1].kind, DirectiveKind::Ready);
}

TEST(InitScriptTest, RejectsNewlines) {
    auto parsed = parse_init_script("ready\nawait_manager");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_init_script");
}

TEST(InitScriptTest, RejectsUnknownDirective) {
    auto parsed = parse_init_script("ready;launch_missiles");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_NE(get_error(parsed).message.find("launch_missiles"), std::string::npos);
}

TEST(InitScriptTest, RejectsBadDurations) {
    EXPECT_TRUE(is_error(parse_init_script("await_ack")));
    EXPECT_TRUE(is_error(parse_init_script("await_ack soon")));
    EXPECT_TRUE(is_error(parse_init_script("sleep 10ms")));
    EXPECT_TRUE(is_error(parse_init_script("ready now")));
}

TEST(InitScriptTest, RejectsEmptyScript) {
    auto parsed = parse_init_script(" ; ");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_init_script");
}

}  // namespace
