#include "internal/controller/ownership.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace imc::controller {

using imc::observability::StringField;

const char* ToString(Ownership ownership) {
  switch (ownership) {
    case Ownership::kOwned:
      return "owned";
    case Ownership::kReclaimed:
      return "reclaimed";
    case Ownership::kClaimed:
      return "claimed";
    case Ownership::kNotResponsible:
      return "not-responsible";
    case Ownership::kLostRace:
      return "lost-race";
    case Ownership::kRequeue:
      return "requeue";
    case Ownership::kDeleted:
      return "deleted";
  }
  return "unknown";
}

OwnershipResolver::OwnershipResolver(imc::datastore::DataStore& store, std::string controller_id)
    : store_(store), controller_id_(std::move(controller_id)) {
}

Ownership OwnershipResolver::Resolve(imc::v1::InstanceManager& im) {
  const std::string owner = im.spec().owner_id();

  bool owner_down = false;
  if (!owner.empty() && owner != controller_id_) {
    owner_down = store_.IsNodeDownOrDeleted(owner);
  }

  if (im.spec().node_id() == controller_id_ && owner != controller_id_) {
    auto result = WriteOwner(im);
    if (result.IsNotFound()) return Ownership::kDeleted;
    if (!result) return Ownership::kRequeue;
    IMC_LOG_DEBUG("Reclaimed instance manager", {StringField("controller", controller_id_), StringField("instance_manager", im.metadata().name())});
    return Ownership::kReclaimed;
  }

  if (owner.empty() || owner_down) {
    auto result = WriteOwner(im);
    if (result.IsNotFound()) return Ownership::kDeleted;
    if (!result) return Ownership::kLostRace;
    IMC_LOG_DEBUG("Picked up instance manager", {StringField("controller", controller_id_), StringField("instance_manager", im.metadata().name()),
                                                 StringField("previous_owner", owner)});
    return Ownership::kClaimed;
  }

  if (owner != controller_id_) return Ownership::kNotResponsible;
  return Ownership::kOwned;
}

imc::datastore::Result OwnershipResolver::WriteOwner(imc::v1::InstanceManager& im) {
  auto claimed = im;
  claimed.mutable_spec()->set_owner_id(controller_id_);

  auto result = store_.UpdateInstanceManager(claimed);
  if (result.IsConflict()) return result;
  if (result.IsNotFound()) {
    IMC_LOG_INFO("Instance manager was deleted while claiming ownership",
                 {StringField("controller", controller_id_), StringField("instance_manager", im.metadata().name())});
    return result;
  }
  if (!result) {
    throw util::Unavailable("cannot update owner of instance manager " + im.metadata().name() + ": " + result.message);
  }

  im = std::move(claimed);
  return result;
}

} // namespace imc::controller
