#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "imc/v1.hpp"
#include "internal/controller/ownership.hpp"
#include "internal/controller/pod_spec.hpp"
#include "internal/controller/process_watch.hpp"
#include "internal/controller/watch_registry.hpp"
#include "internal/datastore/api/datastore.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/work_queue.hpp"
#include "internal/remote/remote_process_client.hpp"

namespace imc::controller {

struct ControllerOptions {
  std::string controller_id;
  std::string controller_namespace;

  int                       max_retries = 3;
  std::chrono::milliseconds resync_period{30000};
  std::uint32_t             manager_port = 8500;

  ProcessWatch::Options        watch;
  imc::queue::WorkQueue::RateLimit queue_limits;
};

struct ControllerStats {
  std::string   controller_id;
  std::string   controller_namespace;
  std::uint64_t queue_length   = 0;
  std::uint64_t active_watches = 0;
};

/*
  Drives instance managers owned by this controller through their pod
  lifecycle and keeps their process maps in sync with the remote daemons.

  Keys are "<namespace>/<name>". At most one reconciliation per key runs at a
  time. Failed keys are retried with per-key exponential backoff up to
  max_retries, then dropped and reported through the error handler.
*/
class InstanceManagerController {
 public:
  // Receives keys dropped after exhausting their retries.
  using ErrorHandler = std::function<void(const std::string& key, const std::string& error)>;

  InstanceManagerController(imc::datastore::DataStore& store, std::shared_ptr<imc::remote::RemoteClientFactory> clients,
                            ControllerOptions options, ErrorHandler on_drop = {});
  ~InstanceManagerController();

  InstanceManagerController(const InstanceManagerController&)            = delete;
  InstanceManagerController& operator=(const InstanceManagerController&) = delete;

  void Start(int workers);
  void Stop();

  // Single reconciliation pass. Throws on failure; requeues on conflict.
  void Reconcile(const std::string& key);

  // Runs one queued key through Reconcile/HandleErr. Returns false once the
  // queue is shut down.
  bool ProcessNextWorkItem();

  void HandleErr(const std::string& key, const std::optional<std::string>& error);

  std::string KeyFor(const std::string& name) const;

  ControllerStats Stats() const;

  imc::queue::WorkQueue& Queue() {
    return *queue_;
  }

  const WatchRegistry& Watches() const {
    return watches_;
  }

 private:
  void RegisterHandlers();
  void EnqueueAll();
  void ResyncLoop();

  void Sync(const std::string& key, imc::observability::SpanScope& span);
  void SyncLifecycle(imc::v1::InstanceManager& im);
  void SyncRunningPod(imc::v1::InstanceManager& im, const imc::v1::Pod& pod);

  void Cleanup(imc::v1::InstanceManager& im);
  void CreatePod(const imc::v1::InstanceManager& im, const imc::v1::EngineImage& image);
  void EnsureWatch(const imc::v1::InstanceManager& im);
  void PollProcesses(imc::v1::InstanceManager& im);

  imc::datastore::DataStore&                        store_;
  std::shared_ptr<imc::remote::RemoteClientFactory> clients_;
  const ControllerOptions                           options_;
  ErrorHandler                                      on_drop_;

  // Shared with the store's event handlers, which may outlive the controller.
  std::shared_ptr<imc::queue::WorkQueue> queue_;

  OwnershipResolver ownership_;
  WatchRegistry     watches_;

  std::mutex               lifecycle_mutex_;
  std::condition_variable  resync_cv_;
  bool                     started_  = false;
  bool                     stopping_ = false;
  std::vector<std::thread> workers_;
  std::thread              resync_;
};

} // namespace imc::controller
