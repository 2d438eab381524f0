#include <gtest/gtest.h>

#include "core/message.hpp"
#include "test_util.hpp"

using namespace converse;

TEST(MessageTest, CreateUserMessage) {
  auto msg = Message::user("Hello, world!");

  EXPECT_EQ(msg.role(), Role::User);
  EXPECT_EQ(msg.text(), "Hello, world!");
  EXPECT_FALSE(msg.has_tool_request());
  EXPECT_FALSE(msg.id().empty());
}

TEST(MessageTest, EmptyFactoryHasNoParts) {
  auto msg = Message::assistant();
  EXPECT_TRUE(msg.empty());
  EXPECT_EQ(msg.text(), "");
}

TEST(MessageTest, AddToolRequest) {
  auto msg = Message::assistant("Looking");
  msg.add_tool_request("tc_123", ToolCallResult::success(ToolCall{"dev__shell", {{"command", "ls -la"}}}));

  auto requests = msg.tool_requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0]->id, "tc_123");
  ASSERT_TRUE(requests[0]->tool_call.ok());
  EXPECT_EQ(requests[0]->tool_call.value->name, "dev__shell");
  EXPECT_TRUE(msg.has_tool_request());
}

TEST(MessageTest, AsConcatTextIncludesToolResponses) {
  auto msg = Message::user("prefix");
  msg.add_tool_response("tc_1", ToolOutput::success({text_content("file1.txt")}));
  msg.add_tool_response("tc_2", ToolOutput::failure(ToolError::execution("boom")));

  EXPECT_EQ(msg.as_concat_text(), "prefix file1.txt");
  EXPECT_EQ(msg.tool_responses().size(), 2u);
}

TEST(MessageTest, WithoutToolRequestsKeepsOtherParts) {
  auto msg = test_util::tool_request_message("tc_1", "calc__add", {{"a", 1}}, "thinking");
  msg.add_frontend_tool_request("tc_2", ToolCallResult::success(ToolCall{"ui__pick", json::object()}));

  auto filtered = msg.without_tool_requests();
  EXPECT_FALSE(filtered.has_tool_request());
  EXPECT_EQ(filtered.parts().size(), 2u);
  EXPECT_EQ(filtered.id(), msg.id());
  EXPECT_EQ(filtered.text(), "thinking");
}

TEST(MessageTest, JsonRoundTripKeepsEveryPartKind) {
  auto msg = Message::assistant("hello");
  msg.add_image("aGVsbG8=", "image/png");
  msg.add_tool_request("tc_ok", ToolCallResult::success(ToolCall{"calc__add", {{"a", 2}}}));
  msg.add_tool_request("tc_bad", ToolCallResult::failure(ToolError::invalid_parameters("bad json")));
  msg.add_tool_confirmation_request("tc_ok", "calc__add", {{"a", 2}}, std::string("Allow?"));

  auto j = msg.to_json();
  EXPECT_EQ(j["role"], "assistant");
  ASSERT_EQ(j["content"].size(), 5u);
  EXPECT_EQ(j["content"][2]["type"], "tool_request");
  EXPECT_TRUE(j["content"][3]["tool_call"].contains("error"));

  auto parsed = Message::from_json(j);
  EXPECT_EQ(parsed.id(), msg.id());
  EXPECT_EQ(parsed.role(), Role::Assistant);
  ASSERT_EQ(parsed.parts().size(), 5u);

  auto requests = parsed.tool_requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_TRUE(requests[0]->tool_call.ok());
  EXPECT_EQ(requests[0]->tool_call.value->arguments["a"], 2);
  ASSERT_FALSE(requests[1]->tool_call.ok());
  EXPECT_EQ(requests[1]->tool_call.error->kind, ToolError::Kind::InvalidParameters);

  auto* confirm = std::get_if<ToolConfirmationRequestPart>(&parsed.parts()[4]);
  ASSERT_NE(confirm, nullptr);
  EXPECT_EQ(confirm->prompt.value_or(""), "Allow?");
}

TEST(MessageTest, RoleStrings) {
  EXPECT_EQ(to_string(Role::User), "user");
  EXPECT_EQ(to_string(Role::Assistant), "assistant");
  EXPECT_EQ(role_from_string("assistant"), Role::Assistant);
  EXPECT_EQ(role_from_string("anything"), Role::User);
}
