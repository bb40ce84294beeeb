#pragma once

#include <string>

#include "imc/v1.hpp"
#include "internal/datastore/api/datastore.hpp"

namespace imc::controller {

enum class Ownership {
  kOwned,           // already ours
  kReclaimed,       // our node came back, owner rewritten to us
  kClaimed,         // unowned or the owner's node is down, owner written to us
  kNotResponsible,  // a healthy peer owns it
  kLostRace,        // claim conflicted, another controller came first
  kRequeue,         // reclaim conflicted, try again later
  kDeleted,         // removed from the store before the owner write landed
};

const char* ToString(Ownership ownership);

inline bool ShouldReconcile(Ownership ownership) {
  return ownership == Ownership::kOwned || ownership == Ownership::kReclaimed || ownership == Ownership::kClaimed;
}

/*
  Decides whether this controller processes an instance manager and persists
  ownership changes with optimistic concurrency.

  The controller on the instance manager's own node always takes it back. Any
  controller may take an unowned instance manager, or one whose owner's node is
  down or deleted, until that node recovers.
*/
class OwnershipResolver {
 public:
  OwnershipResolver(imc::datastore::DataStore& store, std::string controller_id);

  // On a successful write `im` holds the stored copy. Store failures other
  // than a conflict or a missing object throw util::Unavailable.
  Ownership Resolve(imc::v1::InstanceManager& im);

 private:
  imc::datastore::Result WriteOwner(imc::v1::InstanceManager& im);

  imc::datastore::DataStore& store_;
  const std::string          controller_id_;
};

} // namespace imc::controller
