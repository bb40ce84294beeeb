#include "internal/controller/process_watch.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/controller/watch_registry.hpp"
#include "internal/datastore/memory/memory_datastore.hpp"

namespace {

using imc::controller::ProcessWatch;
using imc::controller::WatchRegistry;
using imc::datastore::memory::MemoryDataStore;
using imc::remote::RemoteProcess;
using namespace std::chrono_literals;

// State shared by the fake daemon's streams.
struct Daemon {
  std::mutex              mutex;
  std::condition_variable cv;

  std::deque<RemoteProcess> events;
  int                       failing_opens = 0;
  int                       opens         = 0;
  int                       recv_calls    = 0;
  int                       closes        = 0;
  bool                      break_stream  = false;
  bool                      hang_opens    = false;

  void Push(RemoteProcess event) {
    {
      std::lock_guard lock(mutex);
      events.push_back(std::move(event));
    }
    cv.notify_all();
  }

  void Break() {
    {
      std::lock_guard lock(mutex);
      break_stream = true;
    }
    cv.notify_all();
  }

  int Get(int Daemon::*field) {
    std::lock_guard lock(mutex);
    return this->*field;
  }
};

class FakeStream final : public imc::remote::ProcessStream {
 public:
  explicit FakeStream(std::shared_ptr<Daemon> daemon) : daemon_(std::move(daemon)) {
  }

  bool Open() override {
    std::unique_lock lock(daemon_->mutex);
    ++daemon_->opens;
    daemon_->cv.notify_all();
    if (daemon_->hang_opens) {
      // Unreachable daemon: the connect attempt runs until cancelled.
      daemon_->cv.wait_for(lock, 3s, [this] { return closed_; });
      return false;
    }
    if (daemon_->failing_opens > 0) {
      --daemon_->failing_opens;
      return false;
    }
    return true;
  }

  bool Recv(RemoteProcess* out) override {
    std::unique_lock lock(daemon_->mutex);
    ++daemon_->recv_calls;
    daemon_->cv.notify_all();
    daemon_->cv.wait(lock, [this] { return closed_ || daemon_->break_stream || !daemon_->events.empty(); });
    if (closed_) return false;
    if (daemon_->break_stream) {
      daemon_->break_stream = false;
      return false;
    }
    *out = daemon_->events.front();
    daemon_->events.pop_front();
    return true;
  }

  void Close() override {
    {
      std::lock_guard lock(daemon_->mutex);
      if (!closed_) ++daemon_->closes;
      closed_ = true;
    }
    daemon_->cv.notify_all();
  }

  std::string Finish() override {
    return "connection refused";
  }

 private:
  std::shared_ptr<Daemon> daemon_;
  bool                    closed_ = false;
};

class FakeClient final : public imc::remote::RemoteProcessClient {
 public:
  explicit FakeClient(std::shared_ptr<Daemon> daemon) : daemon_(std::move(daemon)) {
  }

  const char* Role() const override {
    return "replica";
  }

  imc::remote::RemoteProcessMap List() override {
    return {};
  }

  std::unique_ptr<imc::remote::ProcessStream> Watch() override {
    return std::make_unique<FakeStream>(daemon_);
  }

 private:
  std::shared_ptr<Daemon> daemon_;
};

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

ProcessWatch::Options FastOptions() {
  ProcessWatch::Options options;
  options.reconnect_interval    = 10ms;
  options.update_retry_interval = 10ms;
  return options;
}

void SeedRunningInstanceManager(MemoryDataStore& store, imc::v1::InstanceManagerState state = imc::v1::INSTANCE_MANAGER_STATE_RUNNING) {
  imc::v1::InstanceManager im;
  im.mutable_metadata()->set_name("im-r-1");
  im.mutable_spec()->set_type(imc::v1::INSTANCE_MANAGER_TYPE_REPLICA);
  im.mutable_status()->set_current_state(state);
  im.mutable_status()->set_ip("10.0.0.5");

  imc::v1::InstanceProcess process;
  process.mutable_spec()->set_name("r1");
  process.mutable_spec()->set_uuid("u1");
  process.mutable_spec()->set_created_at("t0");
  process.mutable_status()->set_state(imc::v1::INSTANCE_STATE_STARTING);
  process.mutable_status()->set_resource_version(1);
  (*im.mutable_status()->mutable_instances())["r1"] = process;

  assert(store.CreateInstanceManager(im));
}

RemoteProcess Event(int64_t version, imc::v1::InstanceState state) {
  RemoteProcess event;
  event.process.mutable_spec()->set_name("r1");
  event.process.mutable_spec()->set_uuid("u1");
  event.process.mutable_status()->set_state(state);
  event.process.mutable_status()->set_resource_version(version);
  return event;
}

int64_t StoredVersion(MemoryDataStore& store) {
  return store.GetInstanceManager("im-r-1")->status().instances().at("r1").status().resource_version();
}

void TestEventsAreMergedIntoRunningInstanceManager() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store);

  auto         daemon = std::make_shared<Daemon>();
  ProcessWatch watch("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  watch.Start();

  daemon->Push(Event(2, imc::v1::INSTANCE_STATE_RUNNING));
  assert(WaitUntil([&] { return StoredVersion(store) == 2; }));

  auto stored = store.GetInstanceManager("im-r-1")->status().instances().at("r1");
  assert(stored.status().state() == imc::v1::INSTANCE_STATE_RUNNING);
  assert(stored.spec().created_at() == "t0");

  watch.Stop();
}

void TestEventsAreIgnoredUnlessRunning() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store, imc::v1::INSTANCE_MANAGER_STATE_ERROR);

  auto         daemon = std::make_shared<Daemon>();
  ProcessWatch watch("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  watch.Start();

  daemon->Push(Event(2, imc::v1::INSTANCE_STATE_RUNNING));
  // The next receive starts only after the previous event was handled.
  assert(WaitUntil([&] { return daemon->Get(&Daemon::recv_calls) >= 2; }));
  assert(StoredVersion(store) == 1);

  watch.Stop();
}

void TestFailedOpenIsRetried() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store);

  auto daemon           = std::make_shared<Daemon>();
  daemon->failing_opens = 2;

  ProcessWatch watch("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  watch.Start();

  daemon->Push(Event(3, imc::v1::INSTANCE_STATE_RUNNING));
  assert(WaitUntil([&] { return StoredVersion(store) == 3; }));
  assert(daemon->Get(&Daemon::opens) == 3);

  watch.Stop();
}

void TestBrokenStreamIsReopened() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store);

  auto         daemon = std::make_shared<Daemon>();
  ProcessWatch watch("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  watch.Start();

  assert(WaitUntil([&] { return daemon->Get(&Daemon::recv_calls) >= 1; }));
  daemon->Break();
  assert(WaitUntil([&] { return daemon->Get(&Daemon::opens) >= 2; }));

  daemon->Push(Event(4, imc::v1::INSTANCE_STATE_RUNNING));
  assert(WaitUntil([&] { return StoredVersion(store) == 4; }));

  watch.Stop();
}

void TestStopUnblocksReceiveAndIsOneShot() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store);

  auto         daemon = std::make_shared<Daemon>();
  ProcessWatch watch("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  watch.Start();

  assert(WaitUntil([&] { return daemon->Get(&Daemon::recv_calls) >= 1; }));

  const auto start = std::chrono::steady_clock::now();
  watch.Stop();
  assert(std::chrono::steady_clock::now() - start < 2s);
  assert(watch.Stopped());
  assert(daemon->Get(&Daemon::closes) == 1);

  // Joined: nothing is received or written any more.
  daemon->Push(Event(9, imc::v1::INSTANCE_STATE_ERROR));
  std::this_thread::sleep_for(50ms);
  assert(StoredVersion(store) == 1);

  watch.Stop();
  assert(daemon->Get(&Daemon::closes) == 1);
}

void TestStopCancelsPendingOpen() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store);

  auto daemon        = std::make_shared<Daemon>();
  daemon->hang_opens = true;

  ProcessWatch watch("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  watch.Start();
  assert(WaitUntil([&] { return daemon->Get(&Daemon::opens) >= 1; }));
  std::this_thread::sleep_for(50ms);

  const auto start = std::chrono::steady_clock::now();
  watch.Stop();
  assert(std::chrono::steady_clock::now() - start < 1s);
  assert(daemon->Get(&Daemon::closes) == 1);
  assert(daemon->Get(&Daemon::opens) == 1);
}

void TestRegistryRemoveDoesNotWaitForConnect() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store);

  auto daemon        = std::make_shared<Daemon>();
  daemon->hang_opens = true;

  WatchRegistry registry;
  assert(registry.EnsureWatch("im-r-1", [&] {
    return std::make_unique<ProcessWatch>("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  }));
  assert(WaitUntil([&] { return daemon->Get(&Daemon::opens) >= 1; }));

  const auto start = std::chrono::steady_clock::now();
  assert(registry.Remove("im-r-1"));
  assert(std::chrono::steady_clock::now() - start < 1s);
}

void TestRegistryKeepsOneWatchPerName() {
  MemoryDataStore store("imc-system");
  SeedRunningInstanceManager(store);

  auto daemon  = std::make_shared<Daemon>();
  int  created = 0;
  auto factory = [&] {
    ++created;
    return std::make_unique<ProcessWatch>("im-r-1", std::make_unique<FakeClient>(daemon), store, FastOptions());
  };

  WatchRegistry registry;
  assert(registry.EnsureWatch("im-r-1", factory));
  assert(!registry.EnsureWatch("im-r-1", factory));
  assert(created == 1);
  assert(registry.Contains("im-r-1"));
  assert(registry.Size() == 1);

  assert(registry.Remove("im-r-1"));
  assert(!registry.Remove("im-r-1"));
  assert(registry.Size() == 0);

  assert(registry.EnsureWatch("im-r-1", factory));
  registry.StopAll();
  assert(registry.Size() == 0);
  assert(created == 2);
}

} // namespace

int main() {
  TestEventsAreMergedIntoRunningInstanceManager();
  TestEventsAreIgnoredUnlessRunning();
  TestFailedOpenIsRetried();
  TestBrokenStreamIsReopened();
  TestStopUnblocksReceiveAndIsOneShot();
  TestStopCancelsPendingOpen();
  TestRegistryRemoveDoesNotWaitForConnect();
  TestRegistryKeepsOneWatchPerName();

  std::cout << "imc_unit_process_watch: pass\n";
  return 0;
}
