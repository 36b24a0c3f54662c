#include "taskwarden/executor/watchdog.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <csignal>
#include <mutex>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskwarden;
using namespace std::chrono_literals;

namespace {

class FakeProcess : public ProcessControl {
public:
  explicit FakeProcess(bool exits_on_term = true)
      : exits_on_term_(exits_on_term) {
  }

  [[nodiscard]] auto pid() const noexcept -> pid_t override {
    return 4242;
  }

  auto send_signal(int sig) noexcept -> bool override {
    std::lock_guard lock(mu_);
    if (exited_) {
      return false;
    }
    signals_.push_back(sig);
    if (sig == SIGKILL || (sig == SIGTERM && exits_on_term_)) {
      exited_ = true;
    }
    return true;
  }

  [[nodiscard]] auto has_exited() const noexcept -> bool override {
    std::lock_guard lock(mu_);
    return exited_;
  }

  [[nodiscard]] auto signals() const -> std::vector<int> {
    std::lock_guard lock(mu_);
    return signals_;
  }

private:
  bool exits_on_term_;
  mutable std::mutex mu_;
  bool exited_{false};
  std::vector<int> signals_;
};

auto quiet_config() -> WatchdogConfig {
  WatchdogConfig config;
  config.warn_lead = 0ms;
  config.progress_interval = 0ms;
  config.kill_grace = 100ms;
  return config;
}

}  // namespace

class WatchdogTest : public ::testing::Test {
protected:
  auto watch(WatchdogConfig config) -> Watchdog& {
    config.on_timeout = [this](const TimeoutInfo& info,
                               const PartialResults& partial) {
      timeouts_.push({info, partial});
    };
    watchdog_ = std::make_unique<Watchdog>("test", process_, std::move(config));
    return *watchdog_;
  }

  FakeProcess process_;
  test::BlockingQueue<std::pair<TimeoutInfo, PartialResults>> timeouts_;
  std::unique_ptr<Watchdog> watchdog_;
};

TEST_F(WatchdogTest, NoActivity_FiresInactivityTimeout) {
  auto config = quiet_config();
  config.idle_timeout = 100ms;
  config.hard_timeout = 10s;
  auto& wd = watch(std::move(config));

  auto started = std::chrono::steady_clock::now();
  wd.start();
  auto fired = timeouts_.try_pop_for(3s);
  auto waited = std::chrono::steady_clock::now() - started;

  ASSERT_TRUE(fired.has_value());
  EXPECT_EQ(fired->first.kind, TimeoutKind::Inactivity);
  EXPECT_EQ(fired->first.limit_ms, 100);
  EXPECT_EQ(fired->first.pid, 4242);
  EXPECT_TRUE(fired->first.terminating);
  EXPECT_GE(waited, 90ms);
  EXPECT_LT(waited, 2s);
  EXPECT_TRUE(wd.timed_out());
}

TEST_F(WatchdogTest, SteadyActivity_HardTimeoutStillFires) {
  auto config = quiet_config();
  config.idle_timeout = 200ms;
  config.hard_timeout = 300ms;
  auto& wd = watch(std::move(config));

  wd.start();
  std::atomic<bool> stop{false};
  std::thread feeder([&] {
    while (!stop.load()) {
      wd.record_stdout("tick\n");
      std::this_thread::sleep_for(20ms);
    }
  });
  auto fired = timeouts_.try_pop_for(3s);
  stop = true;
  feeder.join();

  ASSERT_TRUE(fired.has_value());
  EXPECT_EQ(fired->first.kind, TimeoutKind::Hard);
  EXPECT_GE(fired->first.elapsed_ms, 290);
  EXPECT_LT(fired->first.idle_ms, 200);
}

TEST_F(WatchdogTest, Activity_PostponesInactivityTimeout) {
  auto config = quiet_config();
  config.idle_timeout = 150ms;
  config.hard_timeout = 10s;
  auto& wd = watch(std::move(config));

  wd.start();
  for (int i = 0; i < 10; ++i) {
    std::this_thread::sleep_for(40ms);
    wd.record_activity();
  }
  EXPECT_EQ(timeouts_.size(), 0u);

  auto fired = timeouts_.try_pop_for(3s);
  ASSERT_TRUE(fired.has_value());
  EXPECT_EQ(fired->first.kind, TimeoutKind::Inactivity);
}

TEST_F(WatchdogTest, Timeout_ResolvesOnlyOnce) {
  auto config = quiet_config();
  config.idle_timeout = 50ms;
  config.hard_timeout = 60ms;
  auto& wd = watch(std::move(config));

  wd.start();
  ASSERT_TRUE(timeouts_.try_pop_for(3s).has_value());

  EXPECT_FALSE(wd.cancel());
  EXPECT_FALSE(timeouts_.try_pop_for(300ms).has_value());
}

TEST_F(WatchdogTest, Stop_BeforeDeadline_NoOutcome) {
  auto config = quiet_config();
  config.idle_timeout = 200ms;
  config.hard_timeout = 200ms;
  auto& wd = watch(std::move(config));

  wd.start();
  wd.stop();

  EXPECT_FALSE(timeouts_.try_pop_for(400ms).has_value());
  EXPECT_FALSE(wd.timed_out());
  EXPECT_TRUE(process_.signals().empty());
}

TEST_F(WatchdogTest, Timeout_ProcessExitsOnTerm_NoKill) {
  auto config = quiet_config();
  config.idle_timeout = 50ms;
  auto& wd = watch(std::move(config));

  wd.start();
  ASSERT_TRUE(timeouts_.try_pop_for(3s).has_value());
  ASSERT_TRUE(test::wait_until([&] { return !process_.signals().empty(); },
                               1s));
  test::sleep_ms(250ms);

  EXPECT_EQ(process_.signals(), std::vector<int>{SIGTERM});
}

TEST(WatchdogEscalationTest, ProcessIgnoresTerm_GetsKillAfterGrace) {
  FakeProcess stubborn(false);
  auto config = quiet_config();
  config.idle_timeout = 50ms;
  config.kill_grace = 100ms;
  Watchdog wd("stubborn", stubborn, std::move(config));

  wd.start();

  ASSERT_TRUE(test::wait_until(
      [&] { return stubborn.signals().size() == 2; }, 3s));
  EXPECT_EQ(stubborn.signals(), (std::vector<int>{SIGTERM, SIGKILL}));
  EXPECT_TRUE(stubborn.has_exited());
}

TEST_F(WatchdogTest, Cancel_TerminatesWithoutTimeout) {
  auto config = quiet_config();
  config.idle_timeout = 10s;
  auto& wd = watch(std::move(config));

  wd.start();
  EXPECT_TRUE(wd.cancel());

  EXPECT_EQ(process_.signals(), std::vector<int>{SIGTERM});
  EXPECT_FALSE(timeouts_.try_pop_for(200ms).has_value());
  EXPECT_FALSE(wd.timed_out());
  EXPECT_FALSE(wd.cancel());
}

TEST_F(WatchdogTest, WarnLead_WarnsBeforeInactivityTimeout) {
  std::atomic<int> warnings{0};
  std::atomic<int> kind{-1};
  WatchdogConfig config = quiet_config();
  config.idle_timeout = 300ms;
  config.hard_timeout = 10s;
  config.warn_lead = 200ms;
  config.on_warning = [&](const WatchdogWarning& w) {
    kind = static_cast<int>(w.kind);
    ++warnings;
  };
  auto& wd = watch(std::move(config));

  wd.start();
  ASSERT_TRUE(test::wait_until([&] { return warnings.load() > 0; }, 2s));
  EXPECT_EQ(timeouts_.size(), 0u);
  EXPECT_EQ(kind.load(), static_cast<int>(TimeoutKind::Inactivity));

  EXPECT_TRUE(timeouts_.try_pop_for(2s).has_value());
  EXPECT_EQ(warnings.load(), 1);
  wd.stop();
}

TEST_F(WatchdogTest, ProgressInterval_EmitsHeartbeats) {
  std::atomic<int> beats{0};
  auto config = quiet_config();
  config.idle_timeout = 10s;
  config.progress_interval = 50ms;
  config.on_progress = [&](const WatchdogHeartbeat&) { ++beats; };
  auto& wd = watch(std::move(config));

  wd.start();
  wd.record_stdout("hello");

  EXPECT_TRUE(test::wait_until([&] { return beats.load() >= 3; }, 2s));
  wd.stop();
}

TEST_F(WatchdogTest, PartialResults_KeepsLastEventsAndTails) {
  auto config = quiet_config();
  config.idle_timeout = 10s;
  auto& wd = watch(std::move(config));

  for (int i = 0; i < 60; ++i) {
    wd.record_event(test::make_event(
        {{"type", "item.completed"}, {"itemId", std::to_string(i)}}));
  }
  wd.record_stdout("out-1\n");
  wd.record_stderr(std::string(Watchdog::kMaxTailBytes + 10, 'e'));

  auto partial = wd.partial_results();

  EXPECT_EQ(partial.event_count, 60u);
  ASSERT_EQ(partial.events.size(), Watchdog::kMaxEvents);
  EXPECT_EQ(partial.events.front()["itemId"], "10");
  EXPECT_EQ(partial.events.back()["itemId"], "59");
  EXPECT_EQ(partial.stdout_tail, "out-1\n");
  EXPECT_EQ(partial.stderr_tail.size(), Watchdog::kMaxTailBytes);
  EXPECT_GT(partial.last_activity_at, 0);
}

TEST(TimeoutKindTest, Name_MatchesWireString) {
  EXPECT_EQ(timeout_kind_name(TimeoutKind::Inactivity), "inactivity");
  EXPECT_EQ(timeout_kind_name(TimeoutKind::Hard), "hard");
}
