#include "taskwarden/executor/process_queue.hpp"

#include "test_utils.hpp"

#include <array>
#include <atomic>
#include <future>
#include <vector>

#include "gtest/gtest.h"

using namespace taskwarden;
using namespace std::chrono_literals;

class ProcessQueueTest : public ::testing::Test {
protected:
  // Adds a job that reports its index once started and then blocks on its
  // gate.
  auto add_gated(ProcessQueue& queue, int index) -> bool {
    auto gate = gates_[index].get_future().share();
    return queue.add([this, index, gate] {
      started_.push(index);
      gate.wait();
    });
  }

  void release(int index) {
    gates_[index].set_value();
  }

  std::array<std::promise<void>, 8> gates_;
  test::BlockingQueue<int> started_;
};

TEST_F(ProcessQueueTest, LimitTwo_FourJobs_TwoRunAndTwoWait) {
  ProcessQueue queue(2);

  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(add_gated(queue, i));
  }

  auto a = started_.try_pop_for(2s);
  auto b = started_.try_pop_for(2s);
  ASSERT_TRUE(a && b);
  EXPECT_EQ(std::min(*a, *b), 0);
  EXPECT_EQ(std::max(*a, *b), 1);
  EXPECT_FALSE(started_.try_pop_for(100ms).has_value());

  auto stats = queue.stats();
  EXPECT_EQ(stats.running, 2u);
  EXPECT_EQ(stats.queued, 2u);
  EXPECT_EQ(stats.max_concurrency, 2u);

  release(0);
  auto next = started_.try_pop_for(2s);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, 2);
  EXPECT_EQ(queue.stats().queued, 1u);

  release(1);
  next = started_.try_pop_for(2s);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, 3);

  release(2);
  release(3);
  queue.wait_idle();
  EXPECT_EQ(queue.stats().running, 0u);
  EXPECT_EQ(queue.stats().queued, 0u);
}

TEST_F(ProcessQueueTest, WaitingJobs_StartInFifoOrder) {
  ProcessQueue queue(1);

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(add_gated(queue, i));
  }

  for (int i = 0; i < 5; ++i) {
    auto started = started_.try_pop_for(2s);
    ASSERT_TRUE(started.has_value());
    EXPECT_EQ(*started, i);
    release(i);
  }
  queue.wait_idle();
}

TEST_F(ProcessQueueTest, ZeroConcurrency_IsTreatedAsOne) {
  ProcessQueue queue(0);

  EXPECT_EQ(queue.stats().max_concurrency, 1u);
}

TEST_F(ProcessQueueTest, Shutdown_RejectsNewJobsAndDrainsAdmitted) {
  ProcessQueue queue(1);
  std::atomic<int> ran{0};
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(queue.add([&ran] {
      std::this_thread::sleep_for(20ms);
      ++ran;
    }));
  }

  queue.shutdown();

  EXPECT_EQ(ran.load(), 3);
  EXPECT_FALSE(queue.add([&ran] { ++ran; }));
  EXPECT_EQ(ran.load(), 3);
}

TEST_F(ProcessQueueTest, ThrowingJob_DoesNotLoseTheSlot) {
  ProcessQueue queue(1);
  std::atomic<bool> second_ran{false};

  ASSERT_TRUE(queue.add([] { throw std::runtime_error("boom"); }));
  ASSERT_TRUE(queue.add([&] { second_ran = true; }));
  queue.wait_idle();

  EXPECT_TRUE(second_ran.load());
  EXPECT_EQ(queue.stats().running, 0u);
}
