#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "evaluator/intellisense.hpp"

namespace {

using crucible::core::errors::get_value;
using crucible::core::errors::is_error;
using crucible::evaluator::format_code;
using crucible::evaluator::handle_intellisense;
using crucible::protocol::IntellisenseKind;
using crucible::protocol::IntellisenseRequest;
using nlohmann::json;

json ask(IntellisenseKind kind, const std::string& hint, const json& context = json::object()) {
    return handle_intellisense(IntellisenseRequest{kind, hint}, context);
}

TEST(IntellisenseTest, CompletesVariablesAndBuiltinsSorted) {
    const json context = {{"sleepy", 1}, {"total", 2}};
    const json reply = ask(IntellisenseKind::Completion, "s", context);

    const auto& items = reply["items"];
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]["label"], "sleep");
    EXPECT_EQ(items[0]["kind"], "function");
    EXPECT_EQ(items[1]["label"], "sleepy");
    EXPECT_EQ(items[1]["kind"], "variable");
    EXPECT_EQ(items[1]["detail"], "1");
    EXPECT_EQ(items[2]["label"], "str");
}

TEST(IntellisenseTest, EmptyPrefixListsEverything) {
    const json reply = ask(IntellisenseKind::Completion, "", json{{"a", 1}});
    EXPECT_EQ(reply["items"].size(), 8u);
}

TEST(IntellisenseTest, DetailsForVariableAndBuiltin) {
    const json variable = ask(IntellisenseKind::Details, "x", json{{"x", "hi"}});
    EXPECT_EQ(variable["kind"], "variable");
    EXPECT_EQ(variable["contents"], "x = \"hi\"");

    const json builtin = ask(IntellisenseKind::Details, "len");
    EXPECT_EQ(builtin["kind"], "function");
    EXPECT_EQ(builtin["contents"].get<std::string>().rfind("len(text)", 0), 0u);

    EXPECT_TRUE(ask(IntellisenseKind::Details, "nope").is_null());
}

TEST(IntellisenseTest, SignatureTracksInnermostCallAndArgument) {
    const json outer = ask(IntellisenseKind::Signature, "print(");
    EXPECT_EQ(outer["name"], "print");
    EXPECT_EQ(outer["active_argument"], 0);

    const json inner = ask(IntellisenseKind::Signature, "print(str(1), len(\"a\",");
    EXPECT_EQ(inner["name"], "len");
    EXPECT_EQ(inner["active_argument"], 1);

    EXPECT_TRUE(ask(IntellisenseKind::Signature, "print(1)").is_null());
    EXPECT_TRUE(ask(IntellisenseKind::Signature, "unknown(").is_null());
}

TEST(IntellisenseTest, FormatsCode) {
    const json reply = ask(IntellisenseKind::Format, "x=1;y =x+  2\n\nprint( y ,\"a\\n\")");
    ASSERT_TRUE(reply.contains("code"));
    EXPECT_EQ(reply["code"], "x = 1\ny = x + 2\nprint(y, \"a\\n\")");
}

TEST(IntellisenseTest, FormatReportsSyntaxErrors) {
    const json reply = ask(IntellisenseKind::Format, "x = \"open");
    ASSERT_TRUE(reply.contains("error"));
    EXPECT_EQ(reply["error"], "1: syntax error: unterminated string literal");
}

TEST(IntellisenseTest, FormatIsStable) {
    auto once = format_code("a=\"b\"+c");
    ASSERT_FALSE(is_error(once));
    auto twice = format_code(get_value(once));
    ASSERT_FALSE(is_error(twice));
    EXPECT_EQ(get_value(once), get_value(twice));
}

}  // namespace
