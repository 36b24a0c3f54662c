#include "taskwarden/security/input_validator.hpp"

#include "gtest/gtest.h"

using namespace taskwarden;

TEST(InputValidatorTest, Instruction_EmptyOrBlank_Rejected) {
  EXPECT_FALSE(InputValidator::validate_instruction(""));
  auto r = InputValidator::validate_instruction("  \n\t ");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().field, "instruction");
}

TEST(InputValidatorTest, Instruction_AtLimit_Accepted) {
  EXPECT_TRUE(InputValidator::validate_instruction(
      std::string(kMaxInstructionChars, 'a')));
}

TEST(InputValidatorTest, Instruction_OverLimit_Rejected) {
  auto r = InputValidator::validate_instruction(
      std::string(kMaxInstructionChars + 1, 'a'));

  ASSERT_FALSE(r);
  EXPECT_NE(r.error().message.find("10001"), std::string::npos);
}

TEST(InputValidatorTest, Mode_KnownOrEmpty_Accepted) {
  EXPECT_TRUE(InputValidator::validate_mode(""));
  for (auto mode : kSandboxModes) {
    EXPECT_TRUE(InputValidator::validate_mode(mode)) << mode;
  }
}

TEST(InputValidatorTest, Mode_Unknown_Rejected) {
  auto r = InputValidator::validate_mode("yolo");

  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().field, "mode");
  EXPECT_NE(r.error().message.find("workspace-write"), std::string::npos);
}

TEST(InputValidatorTest, Model_Charset) {
  EXPECT_TRUE(InputValidator::validate_model(""));
  EXPECT_TRUE(InputValidator::validate_model("gpt-5.1-codex"));
  EXPECT_TRUE(InputValidator::validate_model("org/model:latest"));
  EXPECT_FALSE(InputValidator::validate_model("model; rm -rf /"));
  EXPECT_FALSE(InputValidator::validate_model(std::string(129, 'm')));
}

TEST(InputValidatorTest, WorkingDir_MustBeAbsoluteWithoutTraversal) {
  EXPECT_TRUE(InputValidator::validate_working_dir(""));
  EXPECT_TRUE(InputValidator::validate_working_dir("/home/dev/project"));
  EXPECT_FALSE(InputValidator::validate_working_dir("relative/dir"));

  auto r = InputValidator::validate_working_dir("/home/dev/../root");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().field, "working_dir");
}

TEST(InputValidatorTest, OutputSchema_MustBeObjectWithStringType) {
  EXPECT_TRUE(InputValidator::validate_output_schema(std::nullopt));
  EXPECT_TRUE(InputValidator::validate_output_schema(
      nlohmann::json{{"type", "object"}}));
  EXPECT_FALSE(InputValidator::validate_output_schema(nlohmann::json::array()));
  EXPECT_FALSE(
      InputValidator::validate_output_schema(nlohmann::json{{"type", 3}}));
}

TEST(InputValidatorTest, ValidateAll_ReportsFirstFailingField) {
  auto r = InputValidator::validate_all("do it", "bad-mode", "bad model",
                                        "rel", std::nullopt);

  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().field, "mode");
  EXPECT_TRUE(InputValidator::validate_all("do it", "read-only", "", "/tmp",
                                           std::nullopt));
}
