#include "memory_datastore.hpp"

#include <algorithm>

#include <google/protobuf/util/message_differencer.h>

#include "internal/util/time.hpp"

namespace imc::datastore::memory {

using google::protobuf::util::MessageDifferencer;

namespace {

bool HasFinalizer(const imc::v1::ObjectMeta& meta, const std::string& finalizer) {
  return std::find(meta.finalizers().begin(), meta.finalizers().end(), finalizer) != meta.finalizers().end();
}

void RemoveFinalizer(imc::v1::ObjectMeta* meta, const std::string& finalizer) {
  auto* finalizers = meta->mutable_finalizers();
  finalizers->erase(std::remove(finalizers->begin(), finalizers->end(), finalizer), finalizers->end());
}

// Equal apart from resource_version, which the caller always carries forward.
bool SameContent(const imc::v1::InstanceManager& stored, const imc::v1::InstanceManager& incoming) {
  imc::v1::InstanceManager candidate = incoming;
  candidate.mutable_metadata()->set_resource_version(stored.metadata().resource_version());
  return MessageDifferencer::Equals(stored, candidate);
}

} // namespace

MemoryDataStore::MemoryDataStore(std::string store_namespace) : namespace_(std::move(store_namespace)) {
}

std::string MemoryDataStore::NextUid() {
  return namespace_ + "-" + std::to_string(next_uid_++);
}

// ------------------------------------------------------------
// Instance managers
// ------------------------------------------------------------

std::optional<imc::v1::InstanceManager> MemoryDataStore::GetInstanceManager(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto            it = instance_managers_.find(name);
  if (it == instance_managers_.end()) return std::nullopt;
  return it->second;
}

std::vector<imc::v1::InstanceManager> MemoryDataStore::ListInstanceManagers() {
  std::lock_guard                       lock(mutex_);
  std::vector<imc::v1::InstanceManager> out;
  out.reserve(instance_managers_.size());
  for (const auto& [_, im] : instance_managers_) {
    out.push_back(im);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.metadata().name() < b.metadata().name(); });
  return out;
}

Result MemoryDataStore::CreateInstanceManager(imc::v1::InstanceManager& im) {
  {
    std::lock_guard lock(mutex_);
    const auto&     name = im.metadata().name();
    if (name.empty()) return Result::Err(ErrorCode::InternalError, "instance manager name is empty");
    if (instance_managers_.contains(name)) return Result::Err(ErrorCode::AlreadyExists, "instance manager " + name);

    auto* meta = im.mutable_metadata();
    if (meta->namespace_().empty()) meta->set_namespace_(namespace_);
    if (meta->uid().empty()) meta->set_uid(NextUid());
    if (!HasFinalizer(*meta, kInstanceManagerFinalizer)) meta->add_finalizers(kInstanceManagerFinalizer);
    meta->set_resource_version(next_version_++);

    instance_managers_[name] = im;
  }
  NotifyInstanceManager(EventType::kAdded, im);
  return Result::Ok();
}

Result MemoryDataStore::UpdateInstanceManager(imc::v1::InstanceManager& im) {
  {
    std::lock_guard lock(mutex_);
    const auto&     name = im.metadata().name();
    auto            it   = instance_managers_.find(name);
    if (it == instance_managers_.end()) return Result::Err(ErrorCode::NotFound, "instance manager " + name);

    auto& stored = it->second;
    if (stored.metadata().resource_version() != im.metadata().resource_version()) {
      return Result::Err(ErrorCode::Conflict, "instance manager " + name + " has been modified; re-read and retry");
    }

    // Deletion marking is one-way and only goes through MarkInstanceManagerForDeletion.
    im.mutable_metadata()->set_deletion_timestamp(stored.metadata().deletion_timestamp());

    if (SameContent(stored, im)) {
      im = stored;
      return Result::Ok();
    }

    im.mutable_metadata()->set_resource_version(next_version_++);
    stored = im;
  }
  NotifyInstanceManager(EventType::kUpdated, im);
  return Result::Ok();
}

Result MemoryDataStore::MarkInstanceManagerForDeletion(const std::string& name) {
  imc::v1::InstanceManager snapshot;
  EventType                event = EventType::kUpdated;
  {
    std::lock_guard lock(mutex_);
    auto            it = instance_managers_.find(name);
    if (it == instance_managers_.end()) return Result::Err(ErrorCode::NotFound, "instance manager " + name);

    auto* meta = it->second.mutable_metadata();
    if (!meta->deletion_timestamp().empty()) return Result::Ok();

    meta->set_deletion_timestamp(util::NowRFC3339());
    meta->set_resource_version(next_version_++);
    snapshot = it->second;

    if (meta->finalizers().empty()) {
      instance_managers_.erase(it);
      event = EventType::kDeleted;
    }
  }
  NotifyInstanceManager(event, snapshot);
  return Result::Ok();
}

Result MemoryDataStore::RemoveFinalizerForInstanceManager(imc::v1::InstanceManager& im) {
  EventType event = EventType::kUpdated;
  {
    std::lock_guard lock(mutex_);
    const auto&     name = im.metadata().name();
    auto            it   = instance_managers_.find(name);
    if (it == instance_managers_.end()) return Result::Err(ErrorCode::NotFound, "instance manager " + name);

    auto& stored = it->second;
    if (stored.metadata().resource_version() != im.metadata().resource_version()) {
      return Result::Err(ErrorCode::Conflict, "instance manager " + name + " has been modified; re-read and retry");
    }

    auto* meta = im.mutable_metadata();
    RemoveFinalizer(meta, kInstanceManagerFinalizer);
    meta->set_deletion_timestamp(stored.metadata().deletion_timestamp());
    meta->set_resource_version(next_version_++);

    if (!meta->deletion_timestamp().empty() && meta->finalizers().empty()) {
      instance_managers_.erase(it);
      event = EventType::kDeleted;
    } else {
      stored = im;
    }
  }
  NotifyInstanceManager(event, im);
  return Result::Ok();
}

// ------------------------------------------------------------
// Pods
// ------------------------------------------------------------

std::optional<imc::v1::Pod> MemoryDataStore::GetInstanceManagerPod(const std::string& instance_manager_name) {
  std::lock_guard lock(mutex_);
  auto            it = pods_.find(instance_manager_name);
  if (it == pods_.end()) return std::nullopt;
  return it->second;
}

Result MemoryDataStore::CreatePod(imc::v1::Pod& pod) {
  {
    std::lock_guard lock(mutex_);
    const auto&     name = pod.metadata().name();
    if (name.empty()) return Result::Err(ErrorCode::InternalError, "pod name is empty");
    if (pods_.contains(name)) return Result::Err(ErrorCode::AlreadyExists, "pod " + name);

    auto* meta = pod.mutable_metadata();
    if (meta->namespace_().empty()) meta->set_namespace_(namespace_);
    meta->set_uid(NextUid());
    meta->set_resource_version(next_version_++);
    if (pod.status().phase() == imc::v1::POD_PHASE_UNKNOWN) {
      pod.mutable_status()->set_phase(imc::v1::POD_PHASE_PENDING);
    }

    pods_[name] = pod;
  }
  NotifyPod(EventType::kAdded, pod);
  return Result::Ok();
}

Result MemoryDataStore::UpdatePodStatus(const std::string& name, const imc::v1::PodStatus& status) {
  imc::v1::Pod snapshot;
  {
    std::lock_guard lock(mutex_);
    auto            it = pods_.find(name);
    if (it == pods_.end()) return Result::Err(ErrorCode::NotFound, "pod " + name);

    *it->second.mutable_status() = status;
    it->second.mutable_metadata()->set_resource_version(next_version_++);
    snapshot = it->second;
  }
  NotifyPod(EventType::kUpdated, snapshot);
  return Result::Ok();
}

Result MemoryDataStore::DeletePod(const std::string& name) {
  imc::v1::Pod snapshot;
  {
    std::lock_guard lock(mutex_);
    auto            it = pods_.find(name);
    if (it == pods_.end()) return Result::Err(ErrorCode::NotFound, "pod " + name);

    snapshot = std::move(it->second);
    pods_.erase(it);
  }
  NotifyPod(EventType::kDeleted, snapshot);
  return Result::Ok();
}

// ------------------------------------------------------------
// Nodes and engine images
// ------------------------------------------------------------

std::optional<imc::v1::Node> MemoryDataStore::GetNode(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto            it = nodes_.find(name);
  if (it == nodes_.end()) return std::nullopt;
  return it->second;
}

Result MemoryDataStore::PutNode(const imc::v1::Node& node) {
  std::lock_guard lock(mutex_);
  nodes_[node.name()] = node;
  return Result::Ok();
}

bool MemoryDataStore::IsNodeDownOrDeleted(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto            it = nodes_.find(name);
  return it == nodes_.end() || !it->second.ready();
}

std::optional<imc::v1::EngineImage> MemoryDataStore::GetEngineImage(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto            it = engine_images_.find(name);
  if (it == engine_images_.end()) return std::nullopt;
  return it->second;
}

Result MemoryDataStore::PutEngineImage(const imc::v1::EngineImage& image) {
  std::lock_guard lock(mutex_);
  engine_images_[image.name()] = image;
  return Result::Ok();
}

// ------------------------------------------------------------
// Change notification
// ------------------------------------------------------------

void MemoryDataStore::AddInstanceManagerHandler(EventHandler<imc::v1::InstanceManager> handler) {
  std::lock_guard lock(handlers_mutex_);
  instance_manager_handlers_.push_back(std::move(handler));
}

void MemoryDataStore::AddPodHandler(EventHandler<imc::v1::Pod> handler) {
  std::lock_guard lock(handlers_mutex_);
  pod_handlers_.push_back(std::move(handler));
}

void MemoryDataStore::NotifyInstanceManager(EventType type, const imc::v1::InstanceManager& im) {
  std::vector<EventHandler<imc::v1::InstanceManager>> handlers;
  {
    std::lock_guard lock(handlers_mutex_);
    handlers = instance_manager_handlers_;
  }
  for (const auto& handler : handlers) {
    handler(type, im);
  }
}

void MemoryDataStore::NotifyPod(EventType type, const imc::v1::Pod& pod) {
  std::vector<EventHandler<imc::v1::Pod>> handlers;
  {
    std::lock_guard lock(handlers_mutex_);
    handlers = pod_handlers_;
  }
  for (const auto& handler : handlers) {
    handler(type, pod);
  }
}

} // namespace imc::datastore::memory
