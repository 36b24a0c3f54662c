#include "taskwarden/executor/progress.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace taskwarden;
using json = nlohmann::json;

class ProgressEngineTest : public ::testing::Test {
protected:
  void feed(const json& j) {
    engine_.process_event(test::make_event(j));
  }

  void start_item(const std::string& id, const std::string& kind,
                  json extra = json::object()) {
    extra["type"] = kind;
    feed({{"type", "item.started"}, {"itemId", id}, {"data", extra}});
  }

  void complete_item(const std::string& id, const std::string& kind,
                     json extra = json::object()) {
    extra["type"] = kind;
    feed({{"type", "item.completed"}, {"itemId", id}, {"data", extra}});
  }

  ProgressEngine engine_;
};

TEST_F(ProgressEngineTest, InitialState_IsEmpty) {
  auto p = engine_.progress();

  EXPECT_EQ(p.total_steps, 0u);
  EXPECT_EQ(p.percent, 0);
  EXPECT_FALSE(p.current_action.has_value());
  EXPECT_FALSE(p.is_complete);
}

TEST_F(ProgressEngineTest, TurnStarted_AddsInFlightStep) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});

  auto p = engine_.progress();
  ASSERT_EQ(p.steps.size(), 1u);
  EXPECT_EQ(p.steps[0].kind, StepKind::Turn);
  EXPECT_EQ(p.steps[0].status, StepStatus::Started);
  EXPECT_EQ(p.current_action, "Processing turn t1");
  EXPECT_EQ(p.percent, 50);
}

TEST_F(ProgressEngineTest, ItemLifecycle_CountsFilesAndCommands) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});
  start_item("i1", "command_execution", {{"command", "make"}});
  complete_item("i1", "command_execution", {{"exit_code", 0}});
  start_item("i2", "file_change", {{"path", "src/main.cpp"}});
  complete_item("i2", "file_change");

  auto p = engine_.progress();
  EXPECT_EQ(p.total_steps, 3u);
  EXPECT_EQ(p.completed_steps, 2u);
  EXPECT_EQ(p.commands_executed, 1u);
  EXPECT_EQ(p.files_changed, 1u);
  EXPECT_EQ(p.current_action, "Processing turn t1");
}

TEST_F(ProgressEngineTest, CurrentAction_IsNewestInFlightStep) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});
  start_item("i1", "command_execution", {{"command", "cargo test"}});

  EXPECT_EQ(engine_.progress().current_action,
            "Running command: cargo test");

  complete_item("i1", "command_execution");
  start_item("i2", "file_change", {{"path", "lib.rs"}});

  EXPECT_EQ(engine_.progress().current_action, "Editing lib.rs");
}

TEST_F(ProgressEngineTest, DuplicateCompletion_CountsOnce) {
  start_item("i1", "file_change", {{"path", "a"}});
  complete_item("i1", "file_change");
  complete_item("i1", "file_change");

  EXPECT_EQ(engine_.progress().files_changed, 1u);
}

TEST_F(ProgressEngineTest, CompletionWithoutStart_CreatesFinishedStep) {
  complete_item("i9", "command_execution", {{"command", "ls"}});

  auto p = engine_.progress();
  ASSERT_EQ(p.steps.size(), 1u);
  EXPECT_EQ(p.steps[0].status, StepStatus::Completed);
  EXPECT_EQ(p.commands_executed, 1u);
  EXPECT_EQ(p.percent, 100);
}

TEST_F(ProgressEngineTest, ItemWithoutId_AttachesToInFlightItemOfSameKind) {
  feed({{"type", "item.started"},
        {"data", {{"type", "command_execution"}, {"command", "ls"}}}});
  feed({{"type", "item.completed"},
        {"data", {{"type", "command_execution"}, {"exit_code", 0}}}});

  auto p = engine_.progress();
  ASSERT_EQ(p.steps.size(), 1u);
  EXPECT_EQ(p.steps[0].status, StepStatus::Completed);
  EXPECT_EQ(p.steps[0].details["exit_code"], 0);
}

TEST_F(ProgressEngineTest, TurnCompleted_ForcesHundredPercent) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});
  start_item("i1", "command_execution");
  start_item("i2", "command_execution");
  feed({{"type", "turn.completed"}, {"turnId", "t1"}});

  auto p = engine_.progress();
  EXPECT_TRUE(p.is_complete);
  EXPECT_EQ(p.percent, 100);
  EXPECT_EQ(p.completed_steps, p.total_steps);
}

TEST_F(ProgressEngineTest, TurnFailed_MarksFailureAndCompletes) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});
  feed({{"type", "turn.failed"},
        {"turnId", "t1"},
        {"data", {{"error", {{"message", "boom"}}}}}});

  auto p = engine_.progress();
  EXPECT_TRUE(p.has_failed);
  EXPECT_TRUE(p.is_complete);
  ASSERT_EQ(p.steps.size(), 1u);
  EXPECT_EQ(p.steps[0].status, StepStatus::Failed);
  EXPECT_EQ(p.steps[0].details["error"], "boom");
}

TEST_F(ProgressEngineTest, Percent_NeverRetreatsWhenStepsAppear) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});
  start_item("i1", "command_execution");
  complete_item("i1", "command_execution");
  int previous = engine_.progress().percent;

  for (int i = 2; i < 12; ++i) {
    start_item("i" + std::to_string(i), "command_execution");
    int now = engine_.progress().percent;
    EXPECT_GE(now, previous);
    previous = now;
  }
}

TEST_F(ProgressEngineTest, UnknownEvents_AreCountedButIgnored) {
  feed({{"type", "session.configured"}});

  EXPECT_EQ(engine_.events_seen(), 1u);
  EXPECT_EQ(engine_.progress().total_steps, 0u);
}

TEST_F(ProgressEngineTest, Reset_ReturnsToInitialState) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});
  feed({{"type", "turn.completed"}, {"turnId", "t1"}});

  engine_.reset();

  auto p = engine_.progress();
  EXPECT_EQ(p.total_steps, 0u);
  EXPECT_EQ(p.percent, 0);
  EXPECT_FALSE(p.is_complete);
  EXPECT_EQ(engine_.events_seen(), 0u);
}

TEST_F(ProgressEngineTest, Json_PreservesSummary) {
  feed({{"type", "turn.started"}, {"turnId", "t1"}});
  start_item("i1", "file_change", {{"path", "x.txt"}});

  auto original = engine_.progress();
  auto restored = progress_from_json(progress_to_json(original));

  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->percent, original.percent);
  EXPECT_EQ(restored->current_action, original.current_action);
  ASSERT_EQ(restored->steps.size(), 2u);
  EXPECT_EQ(restored->steps[1].description, "Editing x.txt");
  EXPECT_EQ(restored->steps[0].kind, StepKind::Turn);
}

TEST(ProgressJsonTest, FromJson_RejectsNonObject) {
  EXPECT_FALSE(progress_from_json(json::array()).has_value());
  EXPECT_FALSE(progress_from_json(json("x")).has_value());
}
