#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/progress_dispatcher.hpp"
#include "test_support.hpp"

namespace conversion_service {
namespace {

using test_support::RecordingObserver;

ProgressUpdate progress(JobState stage, double fraction, bool final = false) {
  return ProgressUpdate{stage, fraction, 0, std::nullopt, final};
}

// Blocks inside onProgress until released, so events pile up behind it.
class GatedObserver : public RecordingObserver {
public:
  void onProgress(const JobId& id, const ProgressUpdate& update) override {
    if (!entered_) {
      entered_ = true;
      entered.set_value();
      gate.get_future().wait();
    }
    RecordingObserver::onProgress(id, update);
  }

  std::promise<void> entered;
  std::promise<void> gate;

private:
  bool entered_{false};
};

class ThrowingObserver : public RecordingObserver {
public:
  void onProgress(const JobId&, const ProgressUpdate&) override {
    throw std::runtime_error("chat api unavailable");
  }
};

TEST(ProgressDispatcherTest, DeliversInOrderAndFinishes) {
  ProgressDispatcher dispatcher;
  auto observer = std::make_shared<RecordingObserver>();
  dispatcher.open("a", observer);

  dispatcher.publish("a", progress(JobState::Downloading, 1.0, true));
  dispatcher.publish("a", progress(JobState::Encoding, 0.5, true));
  dispatcher.finish("a", JobOutcome{JobState::Succeeded, std::nullopt, RemoteRef{"file:///x.mp4", "x.mp4", 1}});

  auto outcome = observer->waitFinished();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->state, JobState::Succeeded);
  auto updates = observer->updates();
  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(updates[0].stage, JobState::Downloading);
  EXPECT_EQ(updates[1].stage, JobState::Encoding);
}

TEST(ProgressDispatcherTest, SlowObserverGetsCoalescedUpdatesButAllFinals) {
  ProgressDispatcher dispatcher(8);
  auto observer = std::make_shared<GatedObserver>();
  dispatcher.open("job", observer);

  dispatcher.publish("job", progress(JobState::Downloading, 0.0));
  observer->entered.get_future().wait();

  // the observer is stuck; none of these may block the producer
  for (int i = 1; i <= 1000; ++i) {
    dispatcher.publish("job", progress(JobState::Downloading, i / 1000.0));
  }
  dispatcher.publish("job", progress(JobState::Downloading, 1.0, true));
  for (int i = 1; i <= 1000; ++i) {
    dispatcher.publish("job", progress(JobState::Encoding, i / 1000.0));
  }
  dispatcher.publish("job", progress(JobState::Encoding, 1.0, true));
  dispatcher.finish("job", JobOutcome{JobState::Succeeded, std::nullopt, std::nullopt});

  EXPECT_LE(dispatcher.pendingCount("job"), 8u);
  observer->gate.set_value();
  ASSERT_TRUE(observer->waitFinished().has_value());

  auto updates = observer->updates();
  int finals = 0;
  for (std::size_t i = 1; i < updates.size(); ++i) {
    if (updates[i].stage == updates[i - 1].stage) {
      EXPECT_GE(updates[i].fraction, updates[i - 1].fraction);
    }
  }
  for (const auto& update : updates) {
    finals += update.final ? 1 : 0;
  }
  EXPECT_EQ(finals, 2);
  EXPECT_LT(updates.size(), 20u);
  EXPECT_EQ(updates.back().stage, JobState::Encoding);
  EXPECT_TRUE(updates.back().final);
}

TEST(ProgressDispatcherTest, OverflowDropsOldestNonFinal) {
  ProgressDispatcher dispatcher(4);
  auto observer = std::make_shared<GatedObserver>();
  dispatcher.open("job", observer);
  dispatcher.publish("job", progress(JobState::Queued, 0.0));
  observer->entered.get_future().wait();

  // alternating stages defeat coalescing, so the cap has to evict
  dispatcher.publish("job", progress(JobState::Downloading, 0.1));
  dispatcher.publish("job", progress(JobState::Downloading, 1.0, true));
  dispatcher.publish("job", progress(JobState::Validating, 0.2));
  dispatcher.publish("job", progress(JobState::Encoding, 0.3));
  dispatcher.publish("job", progress(JobState::Uploading, 0.4));
  EXPECT_EQ(dispatcher.pendingCount("job"), 4u);

  observer->gate.set_value();
  dispatcher.flush();
  auto updates = observer->updates();
  ASSERT_EQ(updates.size(), 5u);
  EXPECT_EQ(updates[1].stage, JobState::Downloading);
  EXPECT_TRUE(updates[1].final);
  EXPECT_EQ(updates[2].stage, JobState::Validating);
}

TEST(ProgressDispatcherTest, JobsDoNotInterfere) {
  ProgressDispatcher dispatcher;
  auto first = std::make_shared<RecordingObserver>();
  auto second = std::make_shared<RecordingObserver>();
  dispatcher.open("first", first);
  dispatcher.open("second", second);

  dispatcher.publish("first", progress(JobState::Encoding, 0.5, true));
  dispatcher.finish("second", JobOutcome{JobState::Cancelled, std::nullopt, std::nullopt});
  dispatcher.finish("first", JobOutcome{JobState::Failed, JobError::cancelled(), std::nullopt});

  ASSERT_TRUE(first->waitFinished().has_value());
  ASSERT_TRUE(second->waitFinished().has_value());
  EXPECT_EQ(first->updates().size(), 1u);
  EXPECT_TRUE(second->updates().empty());
  EXPECT_EQ(second->waitFinished()->state, JobState::Cancelled);
}

TEST(ProgressDispatcherTest, BlockedObserverDoesNotHoldBackOtherJobs) {
  ProgressDispatcher dispatcher;
  auto slow = std::make_shared<GatedObserver>();
  auto fast = std::make_shared<RecordingObserver>();
  dispatcher.open("slow", slow);
  dispatcher.open("fast", fast);

  dispatcher.publish("slow", progress(JobState::Uploading, 1.0, true));
  slow->entered.get_future().wait();
  dispatcher.finish("slow", JobOutcome{JobState::Succeeded, std::nullopt, std::nullopt});

  auto started = std::chrono::steady_clock::now();
  dispatcher.publish("fast", progress(JobState::Encoding, 1.0, true));
  dispatcher.finish("fast", JobOutcome{JobState::Succeeded, std::nullopt, std::nullopt});

  auto outcome = fast->waitFinished(std::chrono::seconds(2));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->state, JobState::Succeeded);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
  EXPECT_EQ(fast->updates().size(), 1u);
  EXPECT_EQ(slow->finishedCalls(), 0);

  slow->gate.set_value();
  ASSERT_TRUE(slow->waitFinished().has_value());
  EXPECT_EQ(slow->updates().size(), 1u);
}

// Counts overlapping calls; a job's events must never be delivered concurrently.
class OverlapCheckingObserver : public RecordingObserver {
public:
  void onProgress(const JobId& id, const ProgressUpdate& update) override {
    if (++inside_ > 1) {
      ++overlaps;
    }
    std::this_thread::sleep_for(std::chrono::microseconds(200));
    RecordingObserver::onProgress(id, update);
    --inside_;
  }

  std::atomic<int> overlaps{0};

private:
  std::atomic<int> inside_{0};
};

TEST(ProgressDispatcherTest, EachJobStaysOrderedAcrossDeliveryThreads) {
  ProgressDispatcher dispatcher(ProgressDispatcher::kDefaultQueueCapacity, 4);
  std::vector<std::shared_ptr<OverlapCheckingObserver>> observers;
  for (int job = 0; job < 3; ++job) {
    observers.push_back(std::make_shared<OverlapCheckingObserver>());
    dispatcher.open("job-" + std::to_string(job), observers.back());
  }

  constexpr int kSteps = 100;
  for (int step = 1; step <= kSteps; ++step) {
    for (int job = 0; job < 3; ++job) {
      // finals are never coalesced, so every step has to arrive
      dispatcher.publish("job-" + std::to_string(job), progress(JobState::Encoding, step / 100.0, true));
    }
  }
  for (int job = 0; job < 3; ++job) {
    dispatcher.finish("job-" + std::to_string(job), JobOutcome{JobState::Succeeded, std::nullopt, std::nullopt});
  }

  for (const auto& observer : observers) {
    ASSERT_TRUE(observer->waitFinished().has_value());
    auto updates = observer->updates();
    ASSERT_EQ(updates.size(), static_cast<std::size_t>(kSteps));
    for (std::size_t i = 1; i < updates.size(); ++i) {
      EXPECT_GT(updates[i].fraction, updates[i - 1].fraction);
    }
    EXPECT_EQ(observer->overlaps.load(), 0);
  }
}

TEST(ProgressDispatcherTest, ObserverExceptionsAreContained) {
  ProgressDispatcher dispatcher;
  auto observer = std::make_shared<ThrowingObserver>();
  dispatcher.open("job", observer);
  dispatcher.publish("job", progress(JobState::Encoding, 0.5));
  dispatcher.finish("job", JobOutcome{JobState::Succeeded, std::nullopt, std::nullopt});
  ASSERT_TRUE(observer->waitFinished().has_value());
}

TEST(ProgressDispatcherTest, EventsAfterFinishOrWithoutObserverAreDropped) {
  ProgressDispatcher dispatcher;
  auto observer = std::make_shared<RecordingObserver>();
  dispatcher.open("job", observer);
  dispatcher.finish("job", JobOutcome{JobState::Succeeded, std::nullopt, std::nullopt});
  dispatcher.publish("job", progress(JobState::Encoding, 0.5));
  dispatcher.finish("job", JobOutcome{JobState::Failed, std::nullopt, std::nullopt});
  dispatcher.publish("unknown", progress(JobState::Encoding, 0.5));
  dispatcher.open("silent", nullptr);
  dispatcher.publish("silent", progress(JobState::Encoding, 0.5));
  dispatcher.flush();

  EXPECT_EQ(observer->finishedCalls(), 1);
  EXPECT_TRUE(observer->updates().empty());
  EXPECT_EQ(dispatcher.pendingCount("silent"), 0u);
}

TEST(ProgressDispatcherTest, StopDeliversWhatIsPending) {
  auto observer = std::make_shared<RecordingObserver>();
  {
    ProgressDispatcher dispatcher;
    dispatcher.open("job", observer);
    dispatcher.publish("job", progress(JobState::Encoding, 0.5, true));
    dispatcher.finish("job", JobOutcome{JobState::Cancelled, std::nullopt, std::nullopt});
    dispatcher.stop();
  }
  EXPECT_EQ(observer->finishedCalls(), 1);
  EXPECT_EQ(observer->updates().size(), 1u);
}

} // namespace
} // namespace conversion_service
