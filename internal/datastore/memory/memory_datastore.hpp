#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/datastore/api/datastore.hpp"

namespace imc::datastore::memory {

/*
  In-process object store for a single namespace.

  Mirrors the optimistic concurrency contract of the cluster API server: one
  global version counter, per-object resource_version checks on every write,
  finalizer-gated deletion.
*/
class MemoryDataStore final : public DataStore {
 public:
  explicit MemoryDataStore(std::string store_namespace);

  std::optional<imc::v1::InstanceManager> GetInstanceManager(const std::string& name) override;
  std::vector<imc::v1::InstanceManager>   ListInstanceManagers() override;
  Result CreateInstanceManager(imc::v1::InstanceManager&) override;
  Result UpdateInstanceManager(imc::v1::InstanceManager&) override;
  Result MarkInstanceManagerForDeletion(const std::string& name) override;
  Result RemoveFinalizerForInstanceManager(imc::v1::InstanceManager&) override;

  std::optional<imc::v1::Pod> GetInstanceManagerPod(const std::string& instance_manager_name) override;
  Result CreatePod(imc::v1::Pod&) override;
  Result UpdatePodStatus(const std::string& name, const imc::v1::PodStatus& status) override;
  Result DeletePod(const std::string& name) override;

  std::optional<imc::v1::Node> GetNode(const std::string& name) override;
  Result PutNode(const imc::v1::Node&) override;
  bool   IsNodeDownOrDeleted(const std::string& name) override;

  std::optional<imc::v1::EngineImage> GetEngineImage(const std::string& name) override;
  Result PutEngineImage(const imc::v1::EngineImage&) override;

  void AddInstanceManagerHandler(EventHandler<imc::v1::InstanceManager> handler) override;
  void AddPodHandler(EventHandler<imc::v1::Pod> handler) override;

  const std::string& Namespace() const {
    return namespace_;
  }

 private:
  void NotifyInstanceManager(EventType type, const imc::v1::InstanceManager& im);
  void NotifyPod(EventType type, const imc::v1::Pod& pod);

  std::string NextUid();

  const std::string namespace_;

  std::mutex mutex_;
  uint64_t   next_version_ = 1;
  uint64_t   next_uid_     = 1;

  std::unordered_map<std::string, imc::v1::InstanceManager> instance_managers_;
  std::unordered_map<std::string, imc::v1::Pod>             pods_;
  std::unordered_map<std::string, imc::v1::Node>            nodes_;
  std::unordered_map<std::string, imc::v1::EngineImage>     engine_images_;

  std::mutex                                             handlers_mutex_;
  std::vector<EventHandler<imc::v1::InstanceManager>>    instance_manager_handlers_;
  std::vector<EventHandler<imc::v1::Pod>>                pod_handlers_;
};

} // namespace imc::datastore::memory
