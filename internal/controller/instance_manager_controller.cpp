#include "internal/controller/instance_manager_controller.hpp"

#include <google/protobuf/util/message_differencer.h>

#include "internal/controller/process_merge.hpp"
#include "internal/datastore/compare_and_swap.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace imc::controller {

namespace span_attr = imc::observability::span_attr;
using imc::observability::IntField;
using imc::observability::StringField;

namespace {

constexpr const char* kInstanceErroredMessage = "Instance Manager errored";

struct SplitKey {
  std::string key_namespace;
  std::string name;
};

// "<namespace>/<name>" or a bare "<name>" with an empty namespace.
SplitKey SplitMetaNamespaceKey(const std::string& key) {
  const auto slash = key.find('/');
  if (slash == std::string::npos) {
    if (key.empty()) throw util::InvalidArgument("unexpected key format: \"\"");
    return {"", key};
  }
  if (key.find('/', slash + 1) != std::string::npos || slash + 1 == key.size()) {
    throw util::InvalidArgument("unexpected key format: \"" + key + "\"");
  }
  return {key.substr(0, slash), key.substr(slash + 1)};
}

bool AllContainersReady(const imc::v1::Pod& pod) {
  for (const auto& status : pod.status().container_statuses()) {
    if (!status.ready()) return false;
  }
  return true;
}

bool ValidManagerType(imc::v1::InstanceManagerType type) {
  return type == imc::v1::INSTANCE_MANAGER_TYPE_ENGINE || type == imc::v1::INSTANCE_MANAGER_TYPE_REPLICA;
}

} // namespace

InstanceManagerController::InstanceManagerController(imc::datastore::DataStore& store, std::shared_ptr<imc::remote::RemoteClientFactory> clients,
                                                     ControllerOptions options, ErrorHandler on_drop)
    : store_(store),
      clients_(std::move(clients)),
      options_(std::move(options)),
      on_drop_(std::move(on_drop)),
      queue_(std::make_shared<imc::queue::WorkQueue>(options_.queue_limits)),
      ownership_(store_, options_.controller_id) {
  if (!on_drop_) {
    on_drop_ = [](const std::string& key, const std::string& error) {
      IMC_LOG_ERROR("Dropping instance manager out of the queue", {StringField("key", key), StringField("error", error)});
    };
  }
  RegisterHandlers();
}

InstanceManagerController::~InstanceManagerController() {
  Stop();
}

std::string InstanceManagerController::KeyFor(const std::string& name) const {
  return options_.controller_namespace + "/" + name;
}

// ------------------------------------------------------------
// Event handlers
// ------------------------------------------------------------

void InstanceManagerController::RegisterHandlers() {
  auto queue          = queue_;
  auto key_namespace  = options_.controller_namespace;
  auto key_for        = [key_namespace](const std::string& name) { return key_namespace + "/" + name; };
  auto& store         = store_;

  store_.AddInstanceManagerHandler([queue, key_for](imc::datastore::EventType, const imc::v1::InstanceManager& im) {
    queue->Add(key_for(im.metadata().name()));
  });

  store_.AddPodHandler([queue, key_for, &store](imc::datastore::EventType, const imc::v1::Pod& pod) {
    if (!IsInstanceManagerPod(pod)) return;
    if (queue->ShuttingDown()) return;

    // The pod shares its instance manager's name.
    auto im = store.GetInstanceManager(pod.metadata().name());
    if (!im) {
      IMC_LOG_WARN("Cannot find instance manager for pod, may be deleted", {StringField("pod", pod.metadata().name())});
      return;
    }
    queue->Add(key_for(im->metadata().name()));
  });
}

void InstanceManagerController::EnqueueAll() {
  for (const auto& im : store_.ListInstanceManagers()) {
    queue_->Add(KeyFor(im.metadata().name()));
  }
}

// ------------------------------------------------------------
// Runtime
// ------------------------------------------------------------

void InstanceManagerController::Start(int workers) {
  std::lock_guard lock(lifecycle_mutex_);
  if (started_ || stopping_) return;
  started_ = true;

  IMC_LOG_INFO("Starting instance manager controller",
               {StringField("controller", options_.controller_id), StringField("namespace", options_.controller_namespace),
                IntField("workers", workers)});

  EnqueueAll();

  for (int i = 0; i < workers; ++i) {
    workers_.emplace_back([this] {
      while (ProcessNextWorkItem()) {
      }
    });
  }

  if (options_.resync_period.count() > 0) {
    resync_ = std::thread(&InstanceManagerController::ResyncLoop, this);
  }
}

void InstanceManagerController::ResyncLoop() {
  std::unique_lock lock(lifecycle_mutex_);
  while (!resync_cv_.wait_for(lock, options_.resync_period, [this] { return stopping_; })) {
    lock.unlock();
    EnqueueAll();
    lock.lock();
  }
}

void InstanceManagerController::Stop() {
  bool started = false;
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (stopping_) return;
    stopping_ = true;
    started   = started_;
  }
  resync_cv_.notify_all();
  queue_->ShutDown();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
  if (resync_.joinable()) resync_.join();

  watches_.StopAll();

  if (started) {
    IMC_LOG_INFO("Stopped instance manager controller", {StringField("controller", options_.controller_id)});
  }
}

bool InstanceManagerController::ProcessNextWorkItem() {
  auto key = queue_->Get();
  if (!key) return false;

  const auto start = std::chrono::steady_clock::now();

  std::optional<std::string> error;
  try {
    Reconcile(*key);
  } catch (const std::exception& e) {
    error = e.what();
  } catch (...) {
    error = "fail to sync instance manager for " + *key + ": unknown error";
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  imc::observability::Metrics::Instance().ObserveReconcileLatencyMs(elapsed.count());

  HandleErr(*key, error);
  queue_->Done(*key);
  return true;
}

void InstanceManagerController::HandleErr(const std::string& key, const std::optional<std::string>& error) {
  auto& metrics = imc::observability::Metrics::Instance();

  if (!error) {
    queue_->Forget(key);
    metrics.RecordReconcile("success");
    return;
  }

  if (queue_->NumRequeues(key) < options_.max_retries) {
    IMC_LOG_WARN("Error syncing instance manager", {StringField("key", key), StringField("error", *error)});
    queue_->AddRateLimited(key);
    metrics.RecordReconcile("requeue");
    return;
  }

  metrics.RecordReconcile("error");
  metrics.RecordDroppedKey();
  on_drop_(key, *error);
  queue_->Forget(key);
}

ControllerStats InstanceManagerController::Stats() const {
  ControllerStats stats;
  stats.controller_id        = options_.controller_id;
  stats.controller_namespace = options_.controller_namespace;
  stats.queue_length         = queue_->Len();
  stats.active_watches       = watches_.Size();
  return stats;
}

// ------------------------------------------------------------
// Reconciliation
// ------------------------------------------------------------

void InstanceManagerController::Reconcile(const std::string& key) {
  imc::observability::SpanScope span("imc.reconcile");
  span.SetAttribute(span_attr::kKey, key);
  try {
    Sync(key, span);
  } catch (const std::exception& e) {
    const std::string error = "fail to sync instance manager for " + key + ": " + e.what();
    span.RecordException(error);
    throw std::runtime_error(error);
  }
}

void InstanceManagerController::Sync(const std::string& key, imc::observability::SpanScope& span) {
  const auto [key_namespace, name] = SplitMetaNamespaceKey(key);
  if (key_namespace != options_.controller_namespace) return;

  auto im = store_.GetInstanceManager(name);
  if (!im) {
    IMC_LOG_INFO("Instance manager has been deleted", {StringField("key", key)});
    return;
  }

  const auto ownership = ownership_.Resolve(*im);
  span.SetAttribute(span_attr::kOwnership, ToString(ownership));
  if (ownership == Ownership::kRequeue) {
    queue_->AddRateLimited(key);
    return;
  }
  if (!ShouldReconcile(ownership)) {
    IMC_LOG_DEBUG("Skipping instance manager", {StringField("key", key), StringField("ownership", ToString(ownership))});
    return;
  }

  if (!im->metadata().deletion_timestamp().empty()) {
    Cleanup(*im);
    auto result = store_.RemoveFinalizerForInstanceManager(*im);
    if (result.IsConflict()) {
      IMC_LOG_DEBUG("Requeue due to conflict", {StringField("key", key)});
      queue_->AddRateLimited(key);
      return;
    }
    if (!result && !result.IsNotFound()) {
      throw util::Unavailable("cannot remove finalizer: " + result.message);
    }
    return;
  }

  const imc::v1::InstanceManager existing = *im;
  SyncLifecycle(*im);

  const auto from = existing.status().current_state();
  const auto to   = im->status().current_state();
  if (from != to) {
    span.RecordTransition(imc::v1::InstanceManagerState_Name(from), imc::v1::InstanceManagerState_Name(to));
    IMC_LOG_INFO("Instance manager state changed", {StringField("key", key), StringField("from", imc::v1::InstanceManagerState_Name(from)),
                                                    StringField("to", imc::v1::InstanceManagerState_Name(to))});
  }

  auto swap = imc::datastore::CompareAndSwap(store_, existing, *im);
  switch (swap.outcome) {
    case imc::datastore::SwapOutcome::kApplied:
    case imc::datastore::SwapOutcome::kUnchanged:
      return;
    case imc::datastore::SwapOutcome::kConflict:
      IMC_LOG_DEBUG("Requeue due to conflict", {StringField("key", key)});
      queue_->AddRateLimited(key);
      return;
    case imc::datastore::SwapOutcome::kNotFound:
      IMC_LOG_INFO("Instance manager was deleted before its status update", {StringField("key", key)});
      return;
    default:
      throw util::Unavailable("cannot update instance manager " + name + ": " + swap.message);
  }
}

void InstanceManagerController::SyncLifecycle(imc::v1::InstanceManager& im) {
  const auto& name   = im.metadata().name();
  auto*       status = im.mutable_status();

  auto image = store_.GetEngineImage(im.spec().engine_image());
  if (!image) {
    IMC_LOG_INFO("Engine image for instance manager has been deleted",
                 {StringField("engine_image", im.spec().engine_image()), StringField("instance_manager", name)});
    return;
  }

  auto pod = store_.GetInstanceManagerPod(name);

  // Handled from a node other than its own: that node is down or it is newly scheduled.
  if (im.spec().node_id() != options_.controller_id) {
    status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_UNKNOWN);
    return;
  }

  if (status->current_state() == imc::v1::INSTANCE_MANAGER_STATE_ERROR) {
    Cleanup(im);
    CreatePod(im, *image);
    status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_STARTING);
    return;
  }

  if (!pod) {
    if (status->current_state() != imc::v1::INSTANCE_MANAGER_STATE_STOPPED) {
      status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_ERROR);
      return;
    }
    CreatePod(im, *image);
    status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_STARTING);
    return;
  }

  switch (pod->status().phase()) {
    case imc::v1::POD_PHASE_PENDING:
      if (status->current_state() == imc::v1::INSTANCE_MANAGER_STATE_UNKNOWN) {
        status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_STARTING);
      } else if (status->current_state() != imc::v1::INSTANCE_MANAGER_STATE_STARTING) {
        IMC_LOG_ERROR("BUG: instance manager pod is pending but doesn't match instance manager state",
                      {StringField("instance_manager", name),
                       StringField("state", imc::v1::InstanceManagerState_Name(status->current_state()))});
        status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_ERROR);
      }
      return;
    case imc::v1::POD_PHASE_RUNNING:
      SyncRunningPod(im, *pod);
      return;
    default:
      status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_ERROR);
      return;
  }
}

void InstanceManagerController::SyncRunningPod(imc::v1::InstanceManager& im, const imc::v1::Pod& pod) {
  // Wait until every container reports ready.
  if (!AllContainersReady(pod)) return;

  auto* status = im.mutable_status();
  switch (status->current_state()) {
    case imc::v1::INSTANCE_MANAGER_STATE_RUNNING:
      if (!ValidManagerType(im.spec().type())) {
        IMC_LOG_ERROR("BUG: instance manager has invalid type", {StringField("instance_manager", im.metadata().name()),
                                                                 StringField("type", imc::v1::InstanceManagerType_Name(im.spec().type()))});
        status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_ERROR);
        return;
      }
      EnsureWatch(im);
      PollProcesses(im);
      return;
    case imc::v1::INSTANCE_MANAGER_STATE_STARTING:
    case imc::v1::INSTANCE_MANAGER_STATE_UNKNOWN: {
      auto node = store_.GetNode(pod.spec().node_name());
      if (!node) {
        throw util::NotFound("node " + pod.spec().node_name() + " of instance manager pod " + pod.metadata().name());
      }
      status->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_RUNNING);
      status->set_ip(pod.status().pod_ip());
      status->set_node_boot_id(node->boot_id());
      return;
    }
    default:
      return;
  }
}

void InstanceManagerController::Cleanup(imc::v1::InstanceManager& im) {
  const auto& name   = im.metadata().name();
  auto*       status = im.mutable_status();

  status->clear_ip();
  status->clear_node_boot_id();

  // Joins the watch threads; no merge write can land after this.
  watches_.Remove(name);

  for (auto& [_, instance] : *status->mutable_instances()) {
    instance.mutable_status()->set_state(imc::v1::INSTANCE_STATE_ERROR);
    instance.mutable_status()->set_error_msg(kInstanceErroredMessage);
  }

  if (!store_.GetInstanceManagerPod(name)) return;

  auto result = store_.DeletePod(name);
  if (!result && !result.IsNotFound()) {
    throw util::Unavailable("cannot delete pod for instance manager " + name + ": " + result.message);
  }
}

void InstanceManagerController::CreatePod(const imc::v1::InstanceManager& im, const imc::v1::EngineImage& image) {
  auto pod = BuildInstanceManagerPod(im, image, {options_.controller_namespace, options_.controller_id, options_.manager_port});

  auto result = store_.CreatePod(pod);
  if (!result) {
    throw util::Unavailable("failed to create pod for instance manager " + im.metadata().name() + ": " +
                            imc::datastore::ToString(result.code) + " " + result.message);
  }

  IMC_LOG_INFO("Created instance manager pod", {StringField("pod", pod.metadata().name()), StringField("instance_manager", im.metadata().name())});
}

void InstanceManagerController::EnsureWatch(const imc::v1::InstanceManager& im) {
  const auto& name = im.metadata().name();

  bool created = watches_.EnsureWatch(name, [this, &im, &name] {
    return std::make_unique<ProcessWatch>(name, clients_->Create(im.spec().type(), im.status().ip()), store_, options_.watch);
  });

  if (created) {
    IMC_LOG_INFO("Started process watch for instance manager", {StringField("instance_manager", name), StringField("ip", im.status().ip())});
  }
}

void InstanceManagerController::PollProcesses(imc::v1::InstanceManager& im) {
  const auto& name = im.metadata().name();
  if (im.status().ip().empty()) {
    throw util::InvalidState("instance manager " + name + " IP was not set before polling");
  }

  try {
    auto client = clients_->Create(im.spec().type(), im.status().ip());
    ReconcileProcessListing(&im, client->List());
  } catch (const util::Unavailable& e) {
    throw util::Unavailable("error running resync of processes for instance manager " + name + ": " + e.what());
  }
}

} // namespace imc::controller
