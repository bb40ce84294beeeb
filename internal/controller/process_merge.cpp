#include "internal/controller/process_merge.hpp"

#include <google/protobuf/util/message_differencer.h>

#include "internal/observability/logging.hpp"

namespace imc::controller {

using imc::observability::IntField;
using imc::observability::StringField;

const char* ToString(MergeOutcome outcome) {
  switch (outcome) {
    case MergeOutcome::kMissingLocal:
      return "missing-local";
    case MergeOutcome::kUuidMismatch:
      return "uuid-mismatch";
    case MergeOutcome::kStale:
      return "stale";
    case MergeOutcome::kRemoved:
      return "removed";
    case MergeOutcome::kDeletionIgnored:
      return "deletion-ignored";
    case MergeOutcome::kUpdated:
      return "updated";
  }
  return "unknown";
}

MergeOutcome MergeInstanceProcess(imc::v1::InstanceManager* im, const imc::remote::RemoteProcess& observed) {
  const auto& name      = observed.process.spec().name();
  auto*       instances = im->mutable_status()->mutable_instances();

  auto it = instances->find(name);
  if (it == instances->end()) {
    IMC_LOG_WARN("Cannot find instance in instance manager", {StringField("instance", name), StringField("instance_manager", im->metadata().name())});
    return MergeOutcome::kMissingLocal;
  }

  const auto& current = it->second;

  // A new process reusing the name; the old entry has not been cleaned up yet.
  if (observed.process.spec().uuid() != current.spec().uuid()) {
    IMC_LOG_DEBUG("Ignoring instance process with a different UUID",
                  {StringField("instance_manager", im->metadata().name()), StringField("instance", name),
                   StringField("observed_uuid", observed.process.spec().uuid()), StringField("local_uuid", current.spec().uuid())});
    return MergeOutcome::kUuidMismatch;
  }

  if (current.status().resource_version() >= observed.process.status().resource_version()) {
    IMC_LOG_DEBUG("Ignoring expired instance process",
                  {StringField("instance_manager", im->metadata().name()), StringField("instance", name),
                   IntField("local_version", current.status().resource_version()),
                   IntField("observed_version", observed.process.status().resource_version())});
    return MergeOutcome::kStale;
  }

  if (observed.deleted) {
    // The process must not reach deleted without the storage manager setting deleted_at.
    if (!current.spec().deleted_at().empty()) {
      instances->erase(it);
      return MergeOutcome::kRemoved;
    }
    return MergeOutcome::kDeletionIgnored;
  }

  imc::v1::InstanceProcess merged = observed.process;
  merged.mutable_spec()->set_created_at(current.spec().created_at());
  merged.mutable_spec()->set_deleted_at(current.spec().deleted_at());
  it->second = std::move(merged);
  return MergeOutcome::kUpdated;
}

bool ReconcileProcessListing(imc::v1::InstanceManager* im, const imc::remote::RemoteProcessMap& listed) {
  const imc::v1::InstanceManager before = *im;

  std::vector<std::string> names;
  names.reserve(im->status().instances_size());
  for (const auto& [name, _] : im->status().instances()) {
    names.push_back(name);
  }

  auto* instances = im->mutable_status()->mutable_instances();
  for (const auto& name : names) {
    auto remote = listed.find(name);
    if (remote == listed.end()) {
      // Without deleted_at the process may not have started yet, or the listing lagged.
      auto local = instances->find(name);
      if (local != instances->end() && !local->second.spec().deleted_at().empty()) {
        instances->erase(local);
      }
      continue;
    }
    MergeInstanceProcess(im, remote->second);
  }

  return !google::protobuf::util::MessageDifferencer::Equals(before, *im);
}

} // namespace imc::controller
