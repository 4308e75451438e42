#include <gtest/gtest.h>
#include <dbvh/core/threadPool.hpp>
#include <dbvh/core/diagnostics.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <type_traits>
#include <stdexcept>
#include <vector>

namespace dbvh {
namespace test {

TEST(ThreadPoolTest, ReturnsResults) {
  ThreadPool pool(4);
  std::vector<std::future<int>> results;
  for (int i = 0; i < 100; ++i)
    results.push_back(pool.Submit(TaskPriority::NORMAL, [](int a, int b) { return a * b; }, i, 2));

  for (int i = 0; i < 100; ++i)
    EXPECT_EQ(results[i].get(), i * 2);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
  ThreadPool pool(2);
  auto f = pool.Submit(TaskPriority::HIGH, []() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownRunsQueuedWorkAndRejectsNewTasks) {
  std::atomic<int> done{ 0 };
  ThreadPool pool(2);
  for (int i = 0; i < 50; ++i)
    pool.Submit(TaskPriority::LOW, [&done] { done.fetch_add(1); });

  pool.Shutdown();
  EXPECT_EQ(done.load(), 50);
  EXPECT_THROW(pool.Submit(TaskPriority::NORMAL, [] {}), std::runtime_error);

  pool.Shutdown();
}

TEST(ThreadPoolTest, ZeroThreadsFallsBackToOne) {
  ThreadPool pool(0);
  EXPECT_EQ(pool.GetThreadCount(), 1u);
  EXPECT_EQ(pool.Submit(TaskPriority::NORMAL, [] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, SubmitRacingShutdownNeverLosesTasks) {
  for (int round = 0; round < 50; ++round) {
    std::atomic<int> ran{ 0 };
    std::vector<std::future<void>> accepted;
    ThreadPool pool(2);

    std::thread submitter([&] {
      for (int i = 0; i < 200; ++i) {
        try {
          accepted.push_back(pool.Submit(TaskPriority::NORMAL, [&ran] { ran.fetch_add(1); }));
        } catch (const std::runtime_error&) {
          break;
        }
      }
    });
    pool.Shutdown();
    submitter.join();

    // tudo que foi aceito já rodou: Shutdown drena a fila
    for (auto& f : accepted)
      ASSERT_EQ(f.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(ran.load(), static_cast<int>(accepted.size()));
  }
}

TEST(ThreadPoolTest, WaitAllLetsEveryTaskFinishBeforeRethrowing) {
  ThreadPool pool(4);
  std::atomic<int> finished{ 0 };
  std::vector<std::future<int>> pending;
  pending.push_back(pool.Submit(TaskPriority::HIGH, []() -> int { throw std::runtime_error("first"); }));
  for (int i = 0; i < 6; ++i) {
    pending.push_back(pool.Submit(TaskPriority::NORMAL, [&finished, i] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      finished.fetch_add(1);
      return i;
    }));
  }

  EXPECT_THROW(WaitAll(pending), std::runtime_error);
  EXPECT_EQ(finished.load(), 6);
}

TEST(ThreadPoolTest, WaitAllReturnsResultsInOrder) {
  ThreadPool pool(3);
  std::vector<std::future<int>> pending;
  for (int i = 0; i < 10; ++i)
    pending.push_back(pool.Submit(TaskPriority::NORMAL, [i] { return i * i; }));

  const std::vector<int> results = WaitAll(pending);
  ASSERT_EQ(results.size(), 10u);
  for (int i = 0; i < 10; ++i)
    EXPECT_EQ(results[i], i * i);
}

TEST(DiagnosticsTest, ScopedTimerDestructorNeverThrows) {
  static_assert(std::is_nothrow_destructible_v<ScopedTimer>);

  DiagnosticsManager diagnostics;
  {
    ScopedTimer timer(diagnostics, "scope");
  }
  EXPECT_EQ(diagnostics.GetTimerSampler("scope").GetSampleCount(), 1u);
  EXPECT_EQ(diagnostics.GetDroppedSamples(), 0u);

  diagnostics.NoteDroppedSample();
  EXPECT_EQ(diagnostics.GetDroppedSamples(), 1u);
  EXPECT_NE(diagnostics.Summary().find("amostras perdidas: 1"), std::string::npos);
}

TEST(DiagnosticsTest, ScopedTimerRecordsSamples) {
  DiagnosticsManager diagnostics;
  for (int i = 0; i < 3; ++i) {
    diagnostics.BeginFrame();
    {
      ScopedTimer timer(diagnostics, "work");
    }
    diagnostics.EndFrame();
  }

  EXPECT_EQ(diagnostics.GetTotalFrames(), 3u);
  const TimerSampler work = diagnostics.GetTimerSampler("work");
  EXPECT_EQ(work.GetSampleCount(), 3u);
  EXPECT_GE(work.GetMax(), work.GetMin());
  EXPECT_EQ(diagnostics.GetTimerSampler("missing").GetSampleCount(), 0u);

  const std::string summary = diagnostics.Summary();
  EXPECT_NE(summary.find("work"), std::string::npos);
  EXPECT_NE(summary.find("frame"), std::string::npos);
}

} // namespace test
} // namespace dbvh
