#pragma once

#include "domain/conversion_job.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace conversion_service {

// Delivers job notifications on a small set of delivery threads, so a slow observer
// never stalls a transfer or an encode, and holds back only its own job while other
// threads serve the rest. A job is handled by one thread at a time, which keeps its
// events in order. Each job has a bounded pending queue: a newer non-final update for
// the same stage replaces the pending one, and on overflow the oldest non-final update
// is dropped. Stage-final updates and outcomes are always delivered.
class ProgressDispatcher {
public:
  static constexpr std::size_t kDefaultQueueCapacity = 32;
  static constexpr std::size_t kDefaultDeliveryThreads = 4;

  explicit ProgressDispatcher(std::size_t queue_capacity = kDefaultQueueCapacity,
                              std::size_t delivery_threads = kDefaultDeliveryThreads);
  ~ProgressDispatcher();

  ProgressDispatcher(const ProgressDispatcher&) = delete;
  ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

  // A null observer opens nothing; later events for the job are discarded.
  void open(const JobId& id, std::shared_ptr<JobObserver> observer);
  void publish(const JobId& id, const ProgressUpdate& update);
  // Queues the outcome and closes the channel once it is delivered.
  void finish(const JobId& id, const JobOutcome& outcome);

  // Blocks until everything queued so far has been delivered.
  void flush();
  // Delivers what is pending, then joins the delivery threads. Later events are discarded.
  void stop();

  std::size_t pendingCount(const JobId& id) const;

private:
  using Event = std::variant<ProgressUpdate, JobOutcome>;

  struct Channel {
    std::shared_ptr<JobObserver> observer;
    std::deque<Event> pending;
    bool scheduled{false};   // in ready_ or held by a delivery thread
    bool closed{false};
  };

  void run(std::size_t index);
  void deliver(const JobId& id, JobObserver& observer, const Event& event);

  const std::size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::unordered_map<JobId, Channel> channels_;
  std::deque<JobId> ready_;
  std::size_t in_flight_{0};
  bool stopping_{false};
  std::vector<std::jthread> threads_;
};

} // namespace conversion_service
