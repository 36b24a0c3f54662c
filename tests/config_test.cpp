#include "taskwarden/config/config.hpp"

#include "test_utils.hpp"

#include <fstream>

#include "gtest/gtest.h"

using namespace taskwarden;

TEST(ConfigTest, Defaults_AreValid) {
  SystemConfig config;

  EXPECT_EQ(config.storage.db_file, "taskwarden.db");
  EXPECT_EQ(config.executor.worker, "codex");
  EXPECT_EQ(config.executor.max_concurrency, 2);
  EXPECT_EQ(config.executor.env_policy, EnvPolicy::InheritNone);
  EXPECT_EQ(config.executor.env_always,
            (std::vector<std::string>{"PATH", "HOME"}));
  EXPECT_EQ(config.watchdog.idle_timeout_ms, 5 * 60 * 1000);
  EXPECT_EQ(config.watchdog.hard_timeout_ms, 20 * 60 * 1000);
  EXPECT_EQ(config.registry.stuck_task_max_age_sec, 3600);
  EXPECT_TRUE(ConfigLoader::validate(config).has_value());
}

TEST(ConfigTest, LoadFromString_OverridesOnlyGivenFields) {
  auto config = ConfigLoader::load_from_string(R"(
storage:
  db_file: /var/lib/taskwarden/tasks.db
executor:
  worker: /opt/bin/codex
  worker_args: [--profile, ci]
  max_concurrency: 4
  env_policy: allow_list
  env_allow_list: [LANG, TERM]
watchdog:
  idle_timeout_ms: 60000
registry:
  result_keep_alive_ms: 1000
logging:
  level: debug
)");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->storage.db_file, "/var/lib/taskwarden/tasks.db");
  EXPECT_EQ(config->storage.busy_timeout_ms, 5000);
  EXPECT_EQ(config->executor.worker, "/opt/bin/codex");
  EXPECT_EQ(config->executor.worker_args,
            (std::vector<std::string>{"--profile", "ci"}));
  EXPECT_EQ(config->executor.max_concurrency, 4);
  EXPECT_EQ(config->executor.env_policy, EnvPolicy::AllowList);
  EXPECT_EQ(config->executor.env_allow_list,
            (std::vector<std::string>{"LANG", "TERM"}));
  EXPECT_EQ(config->executor.default_mode, "read-only");
  EXPECT_EQ(config->watchdog.idle_timeout_ms, 60000);
  EXPECT_EQ(config->watchdog.hard_timeout_ms, 20 * 60 * 1000);
  EXPECT_EQ(config->registry.result_keep_alive_ms, 1000);
  EXPECT_EQ(config->logging.level, "debug");
}

TEST(ConfigTest, LoadFromString_EmptyDocument_IsParseError) {
  auto config = ConfigLoader::load_from_string("");

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_MalformedYaml_IsParseError) {
  auto config = ConfigLoader::load_from_string("executor: [unclosed");

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_UnknownEnvPolicy_IsParseError) {
  auto config = ConfigLoader::load_from_string(
      "executor:\n  env_policy: everything\n");

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_WrongType_IsParseError) {
  auto config = ConfigLoader::load_from_string(
      "executor:\n  max_concurrency: lots\n");

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::ParseError);
}

TEST(ConfigTest, Validate_RejectsUnusableValues) {
  SystemConfig zero_workers;
  zero_workers.executor.max_concurrency = 0;
  EXPECT_EQ(ConfigLoader::validate(zero_workers).error(),
            Error::InvalidArgument);

  SystemConfig bad_mode;
  bad_mode.executor.default_mode = "anything-goes";
  EXPECT_FALSE(ConfigLoader::validate(bad_mode).has_value());

  SystemConfig bad_level;
  bad_level.logging.level = "verbose";
  EXPECT_FALSE(ConfigLoader::validate(bad_level).has_value());

  SystemConfig no_idle;
  no_idle.watchdog.idle_timeout_ms = 0;
  EXPECT_FALSE(ConfigLoader::validate(no_idle).has_value());

  SystemConfig no_worker;
  no_worker.executor.worker.clear();
  EXPECT_FALSE(ConfigLoader::validate(no_worker).has_value());
}

TEST(ConfigTest, LoadFromString_InvalidValue_FailsValidation) {
  auto config = ConfigLoader::load_from_string(
      "executor:\n  max_concurrency: 0\n");

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::InvalidArgument);
}

TEST(ConfigTest, LoadFromFile_MissingFile_IsFileNotFound) {
  auto config = ConfigLoader::load_from_file("/nonexistent/taskwarden.yaml");

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::FileNotFound);
}

TEST(ConfigTest, LoadFromFile_ReadsYaml) {
  test::TempDir dir;
  auto path = dir.file("taskwarden.yaml");
  {
    std::ofstream out(path);
    out << "executor:\n  worker: my-worker\n";
  }

  auto config = ConfigLoader::load_from_file(path);

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->executor.worker, "my-worker");
}

TEST(ConfigTest, ToString_RoundTripsNonDefaults) {
  SystemConfig config;
  config.storage.db_file = "other.db";
  config.executor.max_concurrency = 3;
  config.executor.env_policy = EnvPolicy::InheritAll;
  config.executor.env_always = {"PATH"};
  config.watchdog.hard_timeout_ms = 90000;
  config.registry.default_poll_frequency_ms = 1000;

  auto yaml = ConfigLoader::to_string(config);
  auto loaded = ConfigLoader::load_from_string(yaml);

  ASSERT_TRUE(loaded.has_value()) << yaml;
  EXPECT_EQ(loaded->storage.db_file, "other.db");
  EXPECT_EQ(loaded->executor.max_concurrency, 3);
  EXPECT_EQ(loaded->executor.env_policy, EnvPolicy::InheritAll);
  EXPECT_EQ(loaded->executor.env_always, (std::vector<std::string>{"PATH"}));
  EXPECT_EQ(loaded->watchdog.hard_timeout_ms, 90000);
  EXPECT_EQ(loaded->registry.default_poll_frequency_ms, 1000);
  EXPECT_EQ(yaml.find("idle_timeout_ms"), std::string::npos);
}
