#include "progress_dispatcher.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <exception>

namespace conversion_service {

ProgressDispatcher::ProgressDispatcher(std::size_t queue_capacity, std::size_t delivery_threads)
  : capacity_(std::max<std::size_t>(queue_capacity, 2)) {
  const auto count = std::max<std::size_t>(delivery_threads, 1);
  threads_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    threads_.emplace_back([this, i]() { run(i); });
  }
}

ProgressDispatcher::~ProgressDispatcher() {
  stop();
}

void ProgressDispatcher::open(const JobId& id, std::shared_ptr<JobObserver> observer) {
  if (!observer) {
    return;
  }
  std::lock_guard<std::mutex> lock{mtx_};
  if (stopping_) {
    return;
  }
  channels_[id].observer = std::move(observer);
}

void ProgressDispatcher::publish(const JobId& id, const ProgressUpdate& update) {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    auto it = channels_.find(id);
    if (it == channels_.end() || it->second.closed || stopping_) {
      return;
    }
    auto& channel = it->second;
    auto& pending = channel.pending;

    if (!update.final && !pending.empty()) {
      if (auto* last = std::get_if<ProgressUpdate>(&pending.back());
          last && !last->final && last->stage == update.stage) {
        *last = update;
        return;
      }
    }

    if (pending.size() >= capacity_) {
      auto droppable = std::find_if(pending.begin(), pending.end(), [](const Event& event) {
        auto* progress = std::get_if<ProgressUpdate>(&event);
        return progress && !progress->final;
      });
      if (droppable != pending.end()) {
        pending.erase(droppable);
      }
    }
    pending.emplace_back(update);

    if (!channel.scheduled) {
      channel.scheduled = true;
      ready_.push_back(id);
    }
  }
  work_cv_.notify_one();
}

void ProgressDispatcher::finish(const JobId& id, const JobOutcome& outcome) {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    auto it = channels_.find(id);
    if (it == channels_.end() || it->second.closed || stopping_) {
      return;
    }
    auto& channel = it->second;
    channel.pending.emplace_back(outcome);
    channel.closed = true;
    if (!channel.scheduled) {
      channel.scheduled = true;
      ready_.push_back(id);
    }
  }
  work_cv_.notify_one();
}

void ProgressDispatcher::flush() {
  std::unique_lock<std::mutex> lock{mtx_};
  idle_cv_.wait(lock, [this]() { return ready_.empty() && in_flight_ == 0; });
}

void ProgressDispatcher::stop() {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  work_cv_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

std::size_t ProgressDispatcher::pendingCount(const JobId& id) const {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = channels_.find(id);
  return it == channels_.end() ? 0 : it->second.pending.size();
}

void ProgressDispatcher::run(std::size_t index) {
  common::setThreadName("progress-" + std::to_string(index));
  std::unique_lock<std::mutex> lock{mtx_};
  while (true) {
    work_cv_.wait(lock, [this]() { return stopping_ || !ready_.empty(); });
    if (ready_.empty()) {
      break;
    }

    JobId id = std::move(ready_.front());
    ready_.pop_front();
    auto& channel = channels_.at(id);
    auto observer = channel.observer;
    std::deque<Event> batch;
    batch.swap(channel.pending);
    ++in_flight_;

    lock.unlock();
    for (const auto& event : batch) {
      deliver(id, *observer, event);
    }
    lock.lock();

    --in_flight_;
    auto it = channels_.find(id);
    if (!it->second.pending.empty()) {
      // back of the line, so one busy job cannot starve the others
      ready_.push_back(id);
      work_cv_.notify_one();
    } else if (it->second.closed) {
      channels_.erase(it);
    } else {
      it->second.scheduled = false;
    }
    if (ready_.empty() && in_flight_ == 0) {
      idle_cv_.notify_all();
    }
  }
  idle_cv_.notify_all();
}

void ProgressDispatcher::deliver(const JobId& id, JobObserver& observer, const Event& event) {
  try {
    if (auto* update = std::get_if<ProgressUpdate>(&event)) {
      observer.onProgress(id, *update);
    } else {
      observer.onFinished(id, std::get<JobOutcome>(event));
    }
  } catch (const std::exception& e) {
    LOG_WARN("[" + id + "] observer failed: " + std::string(e.what()));
  }
}

} // namespace conversion_service
