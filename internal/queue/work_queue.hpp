#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace imc::queue {

/*
  Deduplicating, rate-limited queue of resource keys.

  - A key is queued at most once no matter how often it is added.
  - A key handed out by Get() is not handed out again until Done(); adds that
    arrive meanwhile are replayed on Done().
  - AddRateLimited() delays the key by base * 2^failures (capped at max);
    Forget() resets the failure count.
*/
class WorkQueue {
 public:
  using Clock = std::chrono::steady_clock;

  struct RateLimit {
    std::chrono::milliseconds base_delay{5};
    std::chrono::milliseconds max_delay{1000 * 1000};
  };

  WorkQueue();
  explicit WorkQueue(RateLimit limits);

  void Add(const std::string& key);
  void AddAfter(const std::string& key, std::chrono::milliseconds delay);
  void AddRateLimited(const std::string& key);

  void Forget(const std::string& key);
  int  NumRequeues(const std::string& key) const;

  // Blocks until a key is ready. Returns nullopt once the queue is shut down.
  std::optional<std::string> Get();
  void                       Done(const std::string& key);

  std::size_t Len() const;

  void ShutDown();
  bool ShuttingDown() const;

 private:
  void AddLocked(const std::string& key);
  void PromoteDueLocked(Clock::time_point now);
  std::chrono::milliseconds NextBackoffLocked(const std::string& key);

  RateLimit limits_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  std::deque<std::string>                            queue_;
  std::unordered_set<std::string>                    dirty_;
  std::unordered_set<std::string>                    processing_;
  std::unordered_map<std::string, Clock::time_point> waiting_;
  std::unordered_map<std::string, int>               failures_;

  bool shutdown_ = false;
};

} // namespace imc::queue
