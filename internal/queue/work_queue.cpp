#include "work_queue.hpp"

#include <algorithm>

namespace imc::queue {

WorkQueue::WorkQueue() : WorkQueue(RateLimit{}) {
}

WorkQueue::WorkQueue(RateLimit limits) : limits_(limits) {
}

void WorkQueue::Add(const std::string& key) {
  {
    std::lock_guard lock(mutex_);
    AddLocked(key);
  }
  cv_.notify_one();
}

void WorkQueue::AddLocked(const std::string& key) {
  if (shutdown_ || dirty_.contains(key)) return;

  dirty_.insert(key);
  if (processing_.contains(key)) return;

  queue_.push_back(key);
}

void WorkQueue::AddAfter(const std::string& key, std::chrono::milliseconds delay) {
  if (delay <= std::chrono::milliseconds::zero()) {
    Add(key);
    return;
  }

  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;

    const auto ready_at = Clock::now() + delay;
    auto       it       = waiting_.find(key);
    if (it == waiting_.end() || ready_at < it->second) {
      waiting_[key] = ready_at;
    }
  }
  // wake a waiter so it can recompute its deadline
  cv_.notify_all();
}

void WorkQueue::AddRateLimited(const std::string& key) {
  std::chrono::milliseconds delay;
  {
    std::lock_guard lock(mutex_);
    delay = NextBackoffLocked(key);
  }
  AddAfter(key, delay);
}

std::chrono::milliseconds WorkQueue::NextBackoffLocked(const std::string& key) {
  const int failures = failures_[key]++;
  if (failures >= 31) return limits_.max_delay;

  const auto delay = limits_.base_delay * (int64_t{1} << failures);
  return std::min(delay, limits_.max_delay);
}

void WorkQueue::Forget(const std::string& key) {
  std::lock_guard lock(mutex_);
  failures_.erase(key);
}

int WorkQueue::NumRequeues(const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto            it = failures_.find(key);
  return it == failures_.end() ? 0 : it->second;
}

void WorkQueue::PromoteDueLocked(Clock::time_point now) {
  for (auto it = waiting_.begin(); it != waiting_.end();) {
    if (it->second <= now) {
      AddLocked(it->first);
      it = waiting_.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<std::string> WorkQueue::Get() {
  std::unique_lock lock(mutex_);

  while (true) {
    if (shutdown_) return std::nullopt;

    PromoteDueLocked(Clock::now());
    if (!queue_.empty()) break;

    if (waiting_.empty()) {
      cv_.wait(lock);
    } else {
      auto next = std::min_element(waiting_.begin(), waiting_.end(), [](const auto& a, const auto& b) { return a.second < b.second; });
      cv_.wait_until(lock, next->second);
    }
  }

  std::string key = std::move(queue_.front());
  queue_.pop_front();
  processing_.insert(key);
  dirty_.erase(key);
  return key;
}

void WorkQueue::Done(const std::string& key) {
  bool requeued = false;
  {
    std::lock_guard lock(mutex_);
    processing_.erase(key);
    if (dirty_.contains(key) && !shutdown_) {
      queue_.push_back(key);
      requeued = true;
    }
  }
  if (requeued) cv_.notify_one();
}

std::size_t WorkQueue::Len() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void WorkQueue::ShutDown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool WorkQueue::ShuttingDown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace imc::queue
