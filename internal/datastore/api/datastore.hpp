#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "imc/v1.hpp"
#include "internal/datastore/api/result.hpp"

namespace imc::datastore {

// Finalizer this controller places on every instance manager and removes once
// cleanup has finished.
inline constexpr const char* kInstanceManagerFinalizer = "imc.io/instance-manager";

enum class EventType {
  kAdded,
  kUpdated,
  kDeleted,
};

template <typename T>
using EventHandler = std::function<void(EventType, const T&)>;

/*
  Object store abstraction.

  GUARANTEES:

  - Every successful write bumps metadata.resource_version and copies the
    stored object back into the caller's argument.
  - A write whose resource_version differs from the stored one fails with
    ErrorCode::Conflict and changes nothing.
  - Handlers run after the write is visible and never under a store lock, so
    they may call back into the store.
  - Reads return nullopt for absent objects; backend failures throw
    util::Unavailable.
*/

class DataStore {
 public:
  virtual ~DataStore() = default;

  // ---------------------------------------------------------------------
  // Instance managers
  // ---------------------------------------------------------------------

  virtual std::optional<imc::v1::InstanceManager> GetInstanceManager(const std::string& name) = 0;

  virtual std::vector<imc::v1::InstanceManager> ListInstanceManagers() = 0;

  // Adds kInstanceManagerFinalizer.
  virtual Result CreateInstanceManager(imc::v1::InstanceManager&) = 0;

  virtual Result UpdateInstanceManager(imc::v1::InstanceManager&) = 0;

  // Sets the deletion timestamp. The object is erased once no finalizer remains.
  virtual Result MarkInstanceManagerForDeletion(const std::string& name) = 0;

  virtual Result RemoveFinalizerForInstanceManager(imc::v1::InstanceManager&) = 0;

  // ---------------------------------------------------------------------
  // Pods (an instance manager's pod shares its name)
  // ---------------------------------------------------------------------

  virtual std::optional<imc::v1::Pod> GetInstanceManagerPod(const std::string& instance_manager_name) = 0;

  virtual Result CreatePod(imc::v1::Pod&) = 0;

  virtual Result UpdatePodStatus(const std::string& name, const imc::v1::PodStatus& status) = 0;

  virtual Result DeletePod(const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Nodes and engine images
  // ---------------------------------------------------------------------

  virtual std::optional<imc::v1::Node> GetNode(const std::string& name) = 0;

  virtual Result PutNode(const imc::v1::Node&) = 0;

  virtual bool IsNodeDownOrDeleted(const std::string& name) = 0;

  virtual std::optional<imc::v1::EngineImage> GetEngineImage(const std::string& name) = 0;

  virtual Result PutEngineImage(const imc::v1::EngineImage&) = 0;

  // ---------------------------------------------------------------------
  // Change notification
  // ---------------------------------------------------------------------

  virtual void AddInstanceManagerHandler(EventHandler<imc::v1::InstanceManager> handler) = 0;

  virtual void AddPodHandler(EventHandler<imc::v1::Pod> handler) = 0;
};

} // namespace imc::datastore
