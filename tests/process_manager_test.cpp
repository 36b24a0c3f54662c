#include "taskwarden/executor/process_manager.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <mutex>
#include <vector>

#include "gtest/gtest.h"

extern char** environ;

using namespace taskwarden;
using namespace std::chrono_literals;

namespace {

auto shell(std::string_view script) -> ExecuteOptions {
  ExecuteOptions options;
  options.spawn.program = "/bin/sh";
  options.spawn.args = {"-c", std::string(script)};
  options.spawn.extra_env = {{"PATH", "/usr/bin:/bin"}};
  options.watchdog.idle_timeout = 10s;
  options.watchdog.hard_timeout = 20s;
  options.watchdog.warn_lead = 0ms;
  options.watchdog.progress_interval = 0ms;
  options.watchdog.kill_grace = 500ms;
  options.label = "test";
  return options;
}

auto await(std::future<ProcessResult>& future,
           std::chrono::milliseconds timeout = 10s)
    -> std::optional<ProcessResult> {
  if (future.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  return future.get();
}

constexpr std::string_view kEventScript =
    "printf '%s\\n' '{\"type\":\"turn.started\",\"turnId\":\"t1\"}'\n"
    "echo 'plain log line'\n"
    "printf '%s\\n' '{\"type\":\"item.completed\",\"itemId\":\"i1\","
    "\"data\":{\"type\":\"agent_message\",\"text\":\"hi\"}}'\n"
    "echo 'a warning' >&2\n"
    "printf '%s\\n' '{\"type\":\"turn.completed\",\"turnId\":\"t1\"}'\n";

}  // namespace

class ProcessManagerTest : public ::testing::Test {
protected:
  ProcessManager manager_{2};
};

TEST_F(ProcessManagerTest, Execute_EventStream_CollectsEventsAndOutput) {
  auto submission = manager_.execute(shell(kEventScript));

  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->succeeded());
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->process_id, submission.id);
  EXPECT_GT(result->pid, 0);
  ASSERT_EQ(result->events.size(), 3u);
  EXPECT_EQ(result->events[0].type(), EventType::TurnStarted);
  EXPECT_EQ(result->events[1].type(), EventType::ItemCompleted);
  EXPECT_EQ(result->events[2].type(), EventType::TurnCompleted);
  EXPECT_EQ(result->parser_stats.parse_errors, 1u);
  EXPECT_NE(result->stdout_output.find("plain log line"), std::string::npos);
  EXPECT_EQ(result->stderr_output, "a warning\n");
  EXPECT_FALSE(result->output_truncated);
}

TEST_F(ProcessManagerTest, Execute_NonZeroExit_ReportsCode) {
  auto submission = manager_.execute(shell("echo broken >&2; exit 3"));

  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->succeeded());
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_FALSE(result->signal.has_value());
  EXPECT_EQ(result->stderr_output, "broken\n");
}

TEST_F(ProcessManagerTest, Execute_MissingProgram_ReportsSpawnError) {
  ExecuteOptions options = shell("");
  options.spawn.program = "/nonexistent/worker-binary";
  options.spawn.args.clear();

  auto submission = manager_.execute(std::move(options));
  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->spawn_error.has_value());
  EXPECT_EQ(result->spawn_error->code, std::errc::no_such_file_or_directory);
  EXPECT_NE(result->spawn_error->message.find("worker-binary"),
            std::string::npos);
  EXPECT_FALSE(result->exit_code.has_value());
}

TEST_F(ProcessManagerTest, Execute_MissingWorkingDir_ReportsSpawnError) {
  ExecuteOptions options = shell("true");
  options.spawn.working_dir = "/nonexistent/dir/for/taskwarden";

  auto submission = manager_.execute(std::move(options));
  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->spawn_error.has_value());
  EXPECT_EQ(result->spawn_error->code, std::errc::no_such_file_or_directory);
}

TEST_F(ProcessManagerTest, Execute_WorkingDir_IsChildCwd) {
  test::TempDir dir;
  ExecuteOptions options = shell("pwd");
  options.spawn.working_dir = dir.path().string();

  auto submission = manager_.execute(std::move(options));
  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stdout_output, dir.path().string() + "\n");
}

TEST_F(ProcessManagerTest, Execute_Silence_ResolvesWithTimeoutAndPartials) {
  ExecuteOptions options = shell(
      "printf '%s\\n' '{\"type\":\"turn.started\",\"turnId\":\"t1\"}'\n"
      "echo progress >&2\n"
      "exec sleep 30");
  options.watchdog.idle_timeout = 300ms;

  auto started = std::chrono::steady_clock::now();
  auto submission = manager_.execute(std::move(options));
  auto result = await(submission.result);
  auto waited = std::chrono::steady_clock::now() - started;

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->timeout.has_value());
  EXPECT_EQ(result->timeout->kind, TimeoutKind::Inactivity);
  EXPECT_LT(waited, 5s);
  ASSERT_TRUE(result->partial.has_value());
  EXPECT_EQ(result->partial->event_count, 1u);
  EXPECT_NE(result->partial->stdout_tail.find("turn.started"),
            std::string::npos);
  EXPECT_EQ(result->partial->stderr_tail, "progress\n");
  EXPECT_FALSE(result->succeeded());

  EXPECT_TRUE(test::wait_until(
      [&] { return manager_.stats().active_processes == 0; }, 5s));
}

TEST_F(ProcessManagerTest, Cancel_RunningJob_TerminatesProcess) {
  std::promise<pid_t> spawned;
  ExecuteOptions options = shell("exec sleep 30");
  options.on_spawn = [&spawned](pid_t pid) { spawned.set_value(pid); };

  auto submission = manager_.execute(std::move(options));
  auto pid_future = spawned.get_future();
  ASSERT_EQ(pid_future.wait_for(5s), std::future_status::ready);
  auto pid = pid_future.get();

  EXPECT_TRUE(manager_.cancel(submission.id));
  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->cancelled);
  EXPECT_EQ(result->pid, pid);
  EXPECT_EQ(result->signal, SIGTERM);
  EXPECT_FALSE(manager_.cancel(submission.id));
}

TEST_F(ProcessManagerTest, Cancel_QueuedJob_ResolvesWithoutSpawning) {
  ProcessManager manager(1);
  std::promise<void> spawned;
  ExecuteOptions blocker = shell("exec sleep 30");
  blocker.on_spawn = [&spawned](pid_t) { spawned.set_value(); };
  auto first = manager.execute(std::move(blocker));
  ASSERT_EQ(spawned.get_future().wait_for(5s), std::future_status::ready);

  std::atomic<bool> second_spawned{false};
  ExecuteOptions queued = shell("true");
  queued.on_spawn = [&second_spawned](pid_t) { second_spawned = true; };
  auto second = manager.execute(std::move(queued));
  EXPECT_EQ(manager.stats().queue.queued, 1u);

  EXPECT_TRUE(manager.cancel(second.id));
  auto result = await(second.result, 2s);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->cancelled);
  EXPECT_EQ(result->pid, -1);

  EXPECT_TRUE(manager.cancel(first.id));
  ASSERT_TRUE(await(first.result).has_value());
  manager.shutdown();
  EXPECT_FALSE(second_spawned.load());
}

TEST_F(ProcessManagerTest, Cancel_UnknownId_ReturnsFalse) {
  EXPECT_FALSE(manager_.cancel(ProcessId{"proc-missing"}));
}

TEST_F(ProcessManagerTest, CancelToken_AlreadyCancelled_NeverSpawns) {
  CancellationSource source;
  source.cancel();
  ExecuteOptions options = shell("true");
  options.cancel_token = source.token();

  auto submission = manager_.execute(std::move(options));
  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->cancelled);
  EXPECT_EQ(result->pid, -1);
}

TEST_F(ProcessManagerTest, OnEvent_CalledInStreamOrder) {
  std::mutex mu;
  std::vector<EventType> seen;
  ExecuteOptions options = shell(kEventScript);
  options.on_event = [&](const Event& e) {
    std::lock_guard lock(mu);
    seen.push_back(e.type());
  };

  auto submission = manager_.execute(std::move(options));
  ASSERT_TRUE(await(submission.result).has_value());

  std::lock_guard lock(mu);
  EXPECT_EQ(seen, (std::vector<EventType>{EventType::TurnStarted,
                                          EventType::ItemCompleted,
                                          EventType::TurnCompleted}));
}

TEST_F(ProcessManagerTest, Callback_ReceivesResult) {
  std::promise<ProcessResult> done;
  auto id = manager_.execute(shell("exit 0"), [&done](ProcessResult r) {
    done.set_value(std::move(r));
  });

  auto future = done.get_future();
  auto result = await(future);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->process_id, id);
  EXPECT_EQ(result->exit_code, 0);
}

TEST_F(ProcessManagerTest, MaxOutputBytes_TruncatesCapturedOutput) {
  ExecuteOptions options =
      shell("i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done");
  options.max_output_bytes = 100;

  auto submission = manager_.execute(std::move(options));
  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->stdout_output.size(), 100u);
  EXPECT_TRUE(result->output_truncated);
}

TEST_F(ProcessManagerTest, Execute_KilledBySignal_ReportsSignal) {
  auto submission = manager_.execute(shell("kill -KILL $$"));

  auto result = await(submission.result);

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->exit_code.has_value());
  EXPECT_EQ(result->signal, SIGKILL);
  EXPECT_FALSE(result->cancelled);
}

TEST_F(ProcessManagerTest, ActiveProcesses_ListsRunningJobs) {
  std::promise<void> spawned;
  ExecuteOptions options = shell("exec sleep 30");
  options.label = "long-job";
  options.on_spawn = [&spawned](pid_t) { spawned.set_value(); };

  auto submission = manager_.execute(std::move(options));
  ASSERT_EQ(spawned.get_future().wait_for(5s), std::future_status::ready);

  auto active = manager_.active_processes();
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].id, submission.id);
  EXPECT_EQ(active[0].label, "long-job");
  EXPECT_GT(active[0].pid, 0);
  EXPECT_EQ(manager_.stats().active_processes, 1u);

  manager_.kill_all();
  auto result = await(submission.result);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->cancelled);
}

TEST_F(ProcessManagerTest, Shutdown_RejectsLaterSubmissions) {
  manager_.shutdown();

  auto submission = manager_.execute(shell("true"));
  auto result = await(submission.result, 1s);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->cancelled);
}

TEST(BuildEnvironmentTest, InheritNone_OnlyExtraEnv) {
  SpawnOptions options;
  options.env_policy = EnvPolicy::InheritNone;
  options.extra_env = {{"PATH", "/bin"}};

  EXPECT_EQ(build_environment(options), std::vector<std::string>{"PATH=/bin"});
}

TEST(BuildEnvironmentTest, AllowList_PicksNamedVariables) {
  ::setenv("TASKWARDEN_TEST_ALLOWED", "yes", 1);
  ::setenv("TASKWARDEN_TEST_SECRET", "no", 1);
  SpawnOptions options;
  options.env_policy = EnvPolicy::AllowList;
  options.env_allow_list = {"TASKWARDEN_TEST_ALLOWED", "TASKWARDEN_TEST_UNSET"};

  auto env = build_environment(options);

  EXPECT_EQ(env, std::vector<std::string>{"TASKWARDEN_TEST_ALLOWED=yes"});
}

TEST(BuildEnvironmentTest, InheritAll_CopiesEnviron) {
  ::setenv("TASKWARDEN_TEST_INHERITED", "kept", 1);
  SpawnOptions options;
  options.env_policy = EnvPolicy::InheritAll;

  auto env = build_environment(options);

  std::size_t expected = 0;
  for (char** e = ::environ; *e != nullptr; ++e) {
    ++expected;
    EXPECT_EQ(std::count(env.begin(), env.end(), std::string{*e}), 1) << *e;
  }
  EXPECT_EQ(env.size(), expected);
  EXPECT_EQ(std::count(env.begin(), env.end(), "TASKWARDEN_TEST_INHERITED=kept"),
            1);
}

TEST(BuildEnvironmentTest, ExtraEnv_OverridesInherited) {
  ::setenv("TASKWARDEN_TEST_OVERRIDE", "old", 1);
  SpawnOptions options;
  options.env_policy = EnvPolicy::InheritAll;
  options.extra_env = {{"TASKWARDEN_TEST_OVERRIDE", "new"}};

  auto env = build_environment(options);

  EXPECT_EQ(std::count(env.begin(), env.end(), "TASKWARDEN_TEST_OVERRIDE=new"),
            1);
  EXPECT_EQ(std::count(env.begin(), env.end(), "TASKWARDEN_TEST_OVERRIDE=old"),
            0);
}

TEST(EnvPolicyTest, Parse_KnownNames) {
  EXPECT_EQ(parse_env_policy("inherit_none"), EnvPolicy::InheritNone);
  EXPECT_EQ(parse_env_policy("inherit_all"), EnvPolicy::InheritAll);
  EXPECT_EQ(parse_env_policy("allow_list"), EnvPolicy::AllowList);
  EXPECT_FALSE(parse_env_policy("everything").has_value());
}
