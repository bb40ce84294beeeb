#include "internal/controller/process_watch.hpp"

#include "internal/controller/process_merge.hpp"
#include "internal/datastore/compare_and_swap.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace imc::controller {

using imc::observability::StringField;

ProcessWatch::ProcessWatch(std::string instance_manager, std::unique_ptr<imc::remote::RemoteProcessClient> client,
                           imc::datastore::DataStore& store, Options options)
    : instance_manager_(std::move(instance_manager)), client_(std::move(client)), store_(store), options_(options) {
}

ProcessWatch::~ProcessWatch() {
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
  Join();
}

void ProcessWatch::Start() {
  std::lock_guard lock(mutex_);
  if (started_ || stopped_) return;
  started_  = true;
  receiver_ = std::thread(&ProcessWatch::Run, this);
  closer_   = std::thread(&ProcessWatch::AwaitShutdown, this);

  IMC_LOG_DEBUG("Started process watch", {StringField("instance_manager", instance_manager_), StringField("role", client_->Role())});
}

void ProcessWatch::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (stopped_) {
      IMC_LOG_DEBUG("Process watch already stopped", {StringField("instance_manager", instance_manager_)});
      return;
    }
    stopped_ = true;
  }
  cv_.notify_all();
  Join();

  IMC_LOG_DEBUG("Stopped process watch", {StringField("instance_manager", instance_manager_)});
}

void ProcessWatch::Join() {
  if (closer_.joinable()) closer_.join();
  if (receiver_.joinable() && receiver_.get_id() != std::this_thread::get_id()) {
    receiver_.join();
  }
}

void ProcessWatch::AwaitShutdown() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return stopped_; });
  if (stream_) stream_->Close();
}

bool ProcessWatch::Stopped() const {
  std::lock_guard lock(mutex_);
  return stopped_;
}

bool ProcessWatch::WaitFor(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, interval, [this] { return stopped_; });
}

bool ProcessWatch::CreateStreamLocked() {
  try {
    stream_ = client_->Watch();
    return stream_ != nullptr;
  } catch (const std::exception& e) {
    IMC_LOG_WARN("Failed to create process watch stream",
                 {StringField("instance_manager", instance_manager_), StringField("role", client_->Role()), StringField("error", e.what())});
    return false;
  }
}

bool ProcessWatch::OpenStream(imc::remote::ProcessStream* stream) {
  try {
    return stream->Open();
  } catch (const std::exception& e) {
    IMC_LOG_WARN("Failed to open process watch stream",
                 {StringField("instance_manager", instance_manager_), StringField("role", client_->Role()), StringField("error", e.what())});
    return false;
  }
}

void ProcessWatch::DropStream(const std::string& reason) {
  std::unique_ptr<imc::remote::ProcessStream> dropped;
  {
    std::lock_guard lock(mutex_);
    dropped = std::move(stream_);
    if (stopped_) return;
  }

  IMC_LOG_WARN("Process watch stream broken, reconnecting",
               {StringField("instance_manager", instance_manager_), StringField("role", client_->Role()), StringField("reason", reason)});
  imc::observability::Metrics::Instance().RecordWatchReconnect(client_->Role());
}

void ProcessWatch::Run() {
  while (true) {
    imc::remote::ProcessStream* stream = nullptr;
    bool                        fresh  = false;
    {
      std::lock_guard lock(mutex_);
      if (stopped_) break;
      if (!stream_) fresh = CreateStreamLocked();
      stream = stream_.get();
    }

    if (!stream) {
      imc::observability::Metrics::Instance().RecordWatchReconnect(client_->Role());
      if (!WaitFor(options_.reconnect_interval)) break;
      continue;
    }

    // Opened outside mutex_ so the closer can cancel a slow connect.
    if (fresh && !OpenStream(stream)) {
      DropStream(stream->Finish());
      if (!WaitFor(options_.reconnect_interval)) break;
      continue;
    }

    imc::remote::RemoteProcess event;
    if (!stream->Recv(&event)) {
      DropStream(stream->Finish());
      if (!WaitFor(options_.reconnect_interval)) break;
      continue;
    }

    ApplyEvent(event);
  }

  std::unique_ptr<imc::remote::ProcessStream> remaining;
  {
    std::lock_guard lock(mutex_);
    remaining = std::move(stream_);
  }
  if (remaining) remaining->Finish();
}

void ProcessWatch::ApplyEvent(const imc::remote::RemoteProcess& event) {
  namespace span_attr = imc::observability::span_attr;

  const auto& process_name = event.process.spec().name();

  imc::observability::SpanScope span("imc.watch.apply");
  span.SetAttribute(span_attr::kInstanceManager, instance_manager_);
  span.SetAttribute(span_attr::kInstance, process_name);
  span.SetAttribute(span_attr::kRole, client_->Role());

  auto mutate = [this, &event, &span](imc::v1::InstanceManager& im) {
    if (Stopped()) return false;
    if (im.status().current_state() != imc::v1::INSTANCE_MANAGER_STATE_RUNNING) {
      IMC_LOG_DEBUG("Skipping process update for instance manager that is not running",
                    {StringField("instance_manager", instance_manager_),
                     StringField("state", imc::v1::InstanceManagerState_Name(im.status().current_state()))});
      return false;
    }
    const auto outcome = MergeInstanceProcess(&im, event);
    span.SetAttribute(span_attr::kMergeOutcome, ToString(outcome));
    IMC_LOG_DEBUG("Merged process event", {StringField("instance_manager", instance_manager_), StringField("instance", event.process.spec().name()),
                                           StringField("outcome", ToString(outcome))});
    return true;
  };

  auto result = imc::datastore::UpdateInstanceManagerWithRetry(store_, instance_manager_, mutate,
                                                               [this] { return WaitFor(options_.update_retry_interval); });
  span.SetAttribute(span_attr::kWriteOutcome, imc::datastore::ToString(result.outcome));

  switch (result.outcome) {
    case imc::datastore::SwapOutcome::kApplied:
    case imc::datastore::SwapOutcome::kUnchanged:
    case imc::datastore::SwapOutcome::kAbandoned:
      break;
    case imc::datastore::SwapOutcome::kNotFound:
      IMC_LOG_WARN("Instance manager disappeared while applying process event",
                   {StringField("instance_manager", instance_manager_), StringField("instance", process_name)});
      break;
    default:
      span.RecordException(result.message);
      IMC_LOG_ERROR("Failed to apply process event",
                    {StringField("instance_manager", instance_manager_), StringField("instance", process_name),
                     StringField("outcome", imc::datastore::ToString(result.outcome)), StringField("error", result.message)});
      break;
  }
}

} // namespace imc::controller
