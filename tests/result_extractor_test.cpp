#include "taskwarden/executor/result_extractor.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace taskwarden;
using json = nlohmann::json;

namespace {

auto agent_message(std::string_view text) -> Event {
  return test::make_event({{"type", "item.completed"},
                           {"itemId", "m"},
                           {"data", {{"type", "agent_message"},
                                     {"text", text}}}});
}

auto command(std::string_view cmd, int exit_code) -> Event {
  return test::make_event({{"type", "item.completed"},
                           {"itemId", "c"},
                           {"data", {{"type", "command_execution"},
                                     {"command", cmd},
                                     {"exit_code", exit_code}}}});
}

}  // namespace

TEST(ExtractSummaryTest, TurnCompletedSummary_Wins) {
  std::vector<Event> events{
      agent_message("intermediate"),
      test::make_event({{"type", "turn.completed"},
                        {"data", {{"summary", "Refactored parser"}}}})};

  EXPECT_EQ(extract_summary(events), "Refactored parser");
}

TEST(ExtractSummaryTest, NoSummary_UsesLastAgentMessage) {
  std::vector<Event> events{agent_message("first"), agent_message("second"),
                            test::make_event({{"type", "turn.completed"}})};

  EXPECT_EQ(extract_summary(events), "second");
}

TEST(ExtractSummaryTest, NoEvents_UsesDefault) {
  EXPECT_EQ(extract_summary({}), kDefaultSummary);
}

TEST(ExtractFileChangesTest, CollectsCompletedChangesWithDefaults) {
  std::vector<Event> events{
      test::make_event({{"type", "item.started"},
                        {"data", {{"type", "file_change"},
                                  {"path", "ignored.txt"}}}}),
      test::make_event({{"type", "item.completed"},
                        {"data", {{"type", "file_change"},
                                  {"path", "src/a.cpp"},
                                  {"operation", "created"}}}}),
      test::make_event({{"type", "item.completed"},
                        {"data", {{"type", "file_change"}}}})};

  auto changes = extract_file_changes(events);

  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[0].path, "src/a.cpp");
  EXPECT_EQ(changes[0].operation, "created");
  EXPECT_EQ(changes[1].path, "unknown");
  EXPECT_EQ(changes[1].operation, "modified");
}

TEST(ExtractCommandsTest, KeepsOrderAndExitCodes) {
  std::vector<Event> events{command("make", 0), agent_message("x"),
                            command("make test", 2)};

  auto commands = extract_commands(events);

  ASSERT_EQ(commands.size(), 2u);
  EXPECT_EQ(commands[0].command, "make");
  EXPECT_EQ(commands[0].exit_code, 0);
  EXPECT_EQ(commands[1].command, "make test");
  EXPECT_EQ(commands[1].exit_code, 2);
  EXPECT_EQ(to_json(commands[1]), (json{{"command", "make test"},
                                        {"exit_code", 2}}));
}

TEST(ExtractWarningsTest, PicksWarningMarkedLinesOnly) {
  auto warnings = extract_warnings(
      "warning: deprecated flag\n"
      "info: all good\n"
      "  [WARN] slow disk\n"
      "Warnings are fine in prose\n"
      "WARNING low memory\n");

  EXPECT_EQ(warnings, (std::vector<std::string>{"warning: deprecated flag",
                                                "  [WARN] slow disk",
                                                "WARNING low memory"}));
}

TEST(ExtractWarningsTest, EmptyInput_NoWarnings) {
  EXPECT_TRUE(extract_warnings("").empty());
}

TEST(ExtractStructuredOutputTest, LastMessageJson_IsParsed) {
  std::vector<Event> events{agent_message("thinking"),
                            agent_message(R"({"answer": 42})")};

  auto out = extract_structured_output(events);

  ASSERT_TRUE(out.has_value());
  EXPECT_EQ((*out)["answer"], 42);
}

TEST(ExtractStructuredOutputTest, PlainTextOrScalar_IsIgnored) {
  EXPECT_FALSE(extract_structured_output({agent_message("done")}).has_value());
  EXPECT_FALSE(extract_structured_output({agent_message("42")}).has_value());
  EXPECT_FALSE(extract_structured_output({}).has_value());
}
