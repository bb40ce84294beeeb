#include "internal/queue/work_queue.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <thread>

namespace {

using imc::queue::WorkQueue;
using namespace std::chrono_literals;

void TestDuplicateAddsAreCollapsed() {
  WorkQueue queue;
  queue.Add("ns/a");
  queue.Add("ns/a");
  queue.Add("ns/b");

  assert(queue.Len() == 2);
  assert(*queue.Get() == "ns/a");
  assert(*queue.Get() == "ns/b");
  assert(queue.Len() == 0);
}

void TestKeyAddedWhileProcessingIsReplayedOnDone() {
  WorkQueue queue;
  queue.Add("ns/a");

  auto key = queue.Get();
  assert(key && *key == "ns/a");

  // Not handed to a second worker while in flight.
  queue.Add("ns/a");
  assert(queue.Len() == 0);

  queue.Done("ns/a");
  assert(queue.Len() == 1);
  assert(*queue.Get() == "ns/a");
  queue.Done("ns/a");
  assert(queue.Len() == 0);
}

void TestRateLimitedBackoffGrowsAndForgetResets() {
  WorkQueue queue(WorkQueue::RateLimit{10ms, 1000ms});

  queue.AddRateLimited("ns/a");
  queue.AddRateLimited("ns/a");
  queue.AddRateLimited("ns/a");
  assert(queue.NumRequeues("ns/a") == 3);

  queue.Forget("ns/a");
  assert(queue.NumRequeues("ns/a") == 0);
  assert(queue.NumRequeues("ns/unknown") == 0);
}

void TestRateLimitedKeyBecomesReadyAfterDelay() {
  WorkQueue queue(WorkQueue::RateLimit{20ms, 1000ms});

  const auto start = std::chrono::steady_clock::now();
  queue.AddRateLimited("ns/a");
  assert(queue.Len() == 0);

  auto key = queue.Get();
  const auto waited = std::chrono::steady_clock::now() - start;

  assert(key && *key == "ns/a");
  assert(waited >= 20ms);
}

void TestBackoffIsCappedAtMaxDelay() {
  WorkQueue queue(WorkQueue::RateLimit{1ms, 30ms});

  // Uncapped, twelve consecutive failures would wait 1ms * (2^12 - 1), about 4s.
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 12; ++i) {
    queue.AddRateLimited("ns/a");
    auto key = queue.Get();
    assert(key && *key == "ns/a");
    queue.Done("ns/a");
  }
  assert(queue.NumRequeues("ns/a") == 12);
  assert(std::chrono::steady_clock::now() - start < 2s);
}

void TestAddAfterKeepsEarliestDeadline() {
  WorkQueue queue;
  queue.AddAfter("ns/a", 10s);
  queue.AddAfter("ns/a", 5ms);

  const auto start = std::chrono::steady_clock::now();
  auto       key   = queue.Get();
  assert(key && *key == "ns/a");
  assert(std::chrono::steady_clock::now() - start < 5s);
}

void TestShutDownUnblocksGet() {
  WorkQueue queue;

  auto pending = std::async(std::launch::async, [&queue] { return queue.Get(); });
  std::this_thread::sleep_for(20ms);

  queue.ShutDown();
  assert(!pending.get().has_value());
  assert(queue.ShuttingDown());

  queue.Add("ns/late");
  assert(queue.Len() == 0);
}

} // namespace

int main() {
  TestDuplicateAddsAreCollapsed();
  TestKeyAddedWhileProcessingIsReplayedOnDone();
  TestRateLimitedBackoffGrowsAndForgetResets();
  TestRateLimitedKeyBecomesReadyAfterDelay();
  TestBackoffIsCappedAtMaxDelay();
  TestAddAfterKeepsEarliestDeadline();
  TestShutDownUnblocksGet();

  std::cout << "imc_unit_work_queue: pass\n";
  return 0;
}
