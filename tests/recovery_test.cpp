#include "taskwarden/storage/recovery.hpp"
#include "taskwarden/util/time.hpp"

#include "test_utils.hpp"

#include <format>
#include <set>

#include "gtest/gtest.h"
#include <sqlite3.h>
#include <unistd.h>

using namespace taskwarden;

class RecoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_path_ = dir_.file("tasks.db");
    registry_ = std::make_unique<TaskRegistry>(RegistryOptions{db_path_});
    ASSERT_TRUE(registry_->open().has_value());
  }

  auto working(std::string instruction, std::optional<std::string> pid)
      -> Task {
    TaskParams p;
    p.instruction = std::move(instruction);
    p.working_dir = "/w";
    auto task = registry_->register_task(p);
    EXPECT_TRUE(task.has_value());
    TaskPatch patch;
    patch.external_id = std::move(pid);
    auto updated =
        registry_->update_status(task->id, TaskStatus::Working, patch);
    EXPECT_TRUE(updated.has_value());
    return *updated;
  }

  void exec_sql(const std::string& sql) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path_.c_str(), &db), SQLITE_OK);
    sqlite3_busy_timeout(db, 5000);
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK);
  }

  // Pids in `alive` exist; every other pid is gone.
  auto probe(std::set<int> alive) -> Recovery::ProcessProbe {
    return [alive = std::move(alive)](int pid) { return alive.contains(pid); };
  }

  test::TempDir dir_;
  std::string db_path_;
  std::unique_ptr<TaskRegistry> registry_;
};

TEST_F(RecoveryTest, DeadWorkerPid_MarksTaskUnknown) {
  auto orphan = working("orphan", "1111");
  auto alive = working("alive", "2222");

  Recovery recovery(*registry_, probe({2222}));
  auto result = recovery.recover(RecoveryOptions{});

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->orphaned.size(), 1u);
  EXPECT_EQ(result->orphaned[0], orphan.id);

  auto o = registry_->get(orphan.id);
  ASSERT_TRUE(o.has_value());
  EXPECT_EQ(o->status, TaskStatus::Unknown);
  EXPECT_NE(o->error_message().find("1111"), std::string::npos);
  EXPECT_EQ(registry_->get(alive.id)->status, TaskStatus::Working);
}

TEST_F(RecoveryTest, WorkingWithoutPid_IsLeftAlone) {
  auto task = working("no pid yet", std::nullopt);

  Recovery recovery(*registry_, probe({}));
  auto result = recovery.recover(RecoveryOptions{});

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->orphaned.empty());
  EXPECT_EQ(registry_->get(task.id)->status, TaskStatus::Working);
}

TEST_F(RecoveryTest, StuckTasks_AreReclaimedBeforeOrphanCheck) {
  auto stuck = working("stuck", "3333");
  exec_sql(std::format("UPDATE tasks SET created_at = {} WHERE id = '{}';",
                       now_ms() - 3 * 3600 * 1000, stuck.id.value()));

  Recovery recovery(*registry_, probe({}));
  auto result = recovery.recover(RecoveryOptions{.stuck_task_max_age_sec = 3600});

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->reclaimed, 1u);
  EXPECT_TRUE(result->orphaned.empty());
  auto s = registry_->get(stuck.id);
  EXPECT_EQ(s->status, TaskStatus::Failed);
  EXPECT_EQ(s->error_code, "TIMEOUT");
}

TEST_F(RecoveryTest, ExpiredHistory_IsPruned) {
  auto done = working("done", "4444");
  ASSERT_TRUE(registry_->update_status(done.id, TaskStatus::Completed));
  exec_sql("UPDATE tasks SET completed_at = 10;");

  Recovery recovery(*registry_, probe({}));
  auto result = recovery.recover(
      RecoveryOptions{.prune_max_age = std::chrono::hours(1)});

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->pruned, 1u);
  EXPECT_EQ(registry_->get(done.id).error(), Error::NotFound);
}

TEST(ProcessAliveTest, OwnPidIsAlive_InvalidPidIsNot) {
  EXPECT_TRUE(Recovery::process_alive(static_cast<int>(::getpid())));
  EXPECT_FALSE(Recovery::process_alive(0));
  EXPECT_FALSE(Recovery::process_alive(-5));
}
