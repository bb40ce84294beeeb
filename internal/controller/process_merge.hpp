#pragma once

#include "imc/v1.hpp"
#include "internal/remote/remote_process_client.hpp"

namespace imc::controller {

enum class MergeOutcome {
  kMissingLocal,     // no local entry; remote observations never create one
  kUuidMismatch,     // a different process now uses the name
  kStale,            // resource version not newer than the local one
  kRemoved,          // confirmed deletion, local entry dropped
  kDeletionIgnored,  // deleted remotely but the local entry has no deleted_at
  kUpdated,
};

const char* ToString(MergeOutcome outcome);

/*
  Folds one remote observation into im.status.instances.

  The checks run in a fixed order (existence, UUID, version, deletion) so that
  stream and poll results can arrive in any order without resurrecting a
  deleted process, overwriting a fresher observation, or corrupting an entry
  whose name was reused. created_at and deleted_at are owned by the storage
  manager and always keep their local values.
*/
MergeOutcome MergeInstanceProcess(imc::v1::InstanceManager* im, const imc::remote::RemoteProcess& observed);

/*
  Applies a full remote listing: local entries missing remotely are dropped
  only when already marked deleted, entries present on both sides are merged,
  remote-only entries are ignored. Returns true if the resource changed.
*/
bool ReconcileProcessListing(imc::v1::InstanceManager* im, const imc::remote::RemoteProcessMap& listed);

} // namespace imc::controller
