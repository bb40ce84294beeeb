#include "internal/controller/process_merge.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using imc::controller::MergeInstanceProcess;
using imc::controller::MergeOutcome;
using imc::controller::ReconcileProcessListing;
using imc::remote::RemoteProcess;
using imc::remote::RemoteProcessMap;

imc::v1::InstanceProcess MakeProcess(const std::string& name, const std::string& uuid, int64_t version, imc::v1::InstanceState state) {
  imc::v1::InstanceProcess process;
  process.mutable_spec()->set_name(name);
  process.mutable_spec()->set_uuid(uuid);
  process.mutable_status()->set_type(imc::v1::INSTANCE_TYPE_REPLICA);
  process.mutable_status()->set_state(state);
  process.mutable_status()->set_resource_version(version);
  return process;
}

RemoteProcess Observed(const std::string& name, const std::string& uuid, int64_t version, imc::v1::InstanceState state, bool deleted = false) {
  return RemoteProcess{MakeProcess(name, uuid, version, state), deleted};
}

imc::v1::InstanceManager MakeInstanceManager() {
  imc::v1::InstanceManager im;
  im.mutable_metadata()->set_name("im-r-1");
  im.mutable_status()->set_current_state(imc::v1::INSTANCE_MANAGER_STATE_RUNNING);
  return im;
}

void Track(imc::v1::InstanceManager* im, imc::v1::InstanceProcess process, const std::string& created_at, const std::string& deleted_at = {}) {
  process.mutable_spec()->set_created_at(created_at);
  process.mutable_spec()->set_deleted_at(deleted_at);
  (*im->mutable_status()->mutable_instances())[process.spec().name()] = process;
}

const imc::v1::InstanceProcess& Entry(const imc::v1::InstanceManager& im, const std::string& name) {
  return im.status().instances().at(name);
}

void TestNewerObservationReplacesAndKeepsLocalTimestamps() {
  auto im = MakeInstanceManager();
  Track(&im, MakeProcess("r1", "u1", 3, imc::v1::INSTANCE_STATE_STARTING), "2024-01-01T00:00:00Z");

  auto observed = Observed("r1", "u1", 4, imc::v1::INSTANCE_STATE_RUNNING);
  observed.process.mutable_spec()->set_created_at("1999-01-01T00:00:00Z");
  observed.process.mutable_status()->set_port_start(10000);

  assert(MergeInstanceProcess(&im, observed) == MergeOutcome::kUpdated);

  const auto& entry = Entry(im, "r1");
  assert(entry.status().state() == imc::v1::INSTANCE_STATE_RUNNING);
  assert(entry.status().resource_version() == 4);
  assert(entry.status().port_start() == 10000);
  assert(entry.spec().created_at() == "2024-01-01T00:00:00Z");
  assert(entry.spec().deleted_at().empty());
}

void TestStaleObservationIsDiscarded() {
  auto im = MakeInstanceManager();
  Track(&im, MakeProcess("r1", "u1", 5, imc::v1::INSTANCE_STATE_RUNNING), "t0");

  assert(MergeInstanceProcess(&im, Observed("r1", "u1", 4, imc::v1::INSTANCE_STATE_STARTING)) == MergeOutcome::kStale);
  assert(MergeInstanceProcess(&im, Observed("r1", "u1", 5, imc::v1::INSTANCE_STATE_ERROR)) == MergeOutcome::kStale);

  assert(Entry(im, "r1").status().state() == imc::v1::INSTANCE_STATE_RUNNING);
  assert(Entry(im, "r1").status().resource_version() == 5);
}

void TestUuidMismatchIsDiscarded() {
  auto im = MakeInstanceManager();
  Track(&im, MakeProcess("r1", "u1", 1, imc::v1::INSTANCE_STATE_RUNNING), "t0");

  assert(MergeInstanceProcess(&im, Observed("r1", "u2", 100, imc::v1::INSTANCE_STATE_ERROR)) == MergeOutcome::kUuidMismatch);
  assert(Entry(im, "r1").spec().uuid() == "u1");
  assert(Entry(im, "r1").status().state() == imc::v1::INSTANCE_STATE_RUNNING);
}

void TestObservationNeverCreatesEntry() {
  auto im = MakeInstanceManager();

  assert(MergeInstanceProcess(&im, Observed("ghost", "u1", 1, imc::v1::INSTANCE_STATE_RUNNING)) == MergeOutcome::kMissingLocal);
  assert(im.status().instances().empty());
}

void TestDeletionRequiresLocalDeletedAt() {
  auto im = MakeInstanceManager();
  Track(&im, MakeProcess("r1", "u1", 1, imc::v1::INSTANCE_STATE_RUNNING), "t0");
  Track(&im, MakeProcess("r2", "u2", 1, imc::v1::INSTANCE_STATE_STOPPING), "t0", "t1");

  assert(MergeInstanceProcess(&im, Observed("r1", "u1", 2, imc::v1::INSTANCE_STATE_STOPPED, true)) == MergeOutcome::kDeletionIgnored);
  assert(im.status().instances().count("r1") == 1);
  assert(Entry(im, "r1").status().resource_version() == 1);

  assert(MergeInstanceProcess(&im, Observed("r2", "u2", 2, imc::v1::INSTANCE_STATE_STOPPED, true)) == MergeOutcome::kRemoved);
  assert(im.status().instances().count("r2") == 0);
}

void TestStaleDeletionDoesNotRemove() {
  auto im = MakeInstanceManager();
  Track(&im, MakeProcess("r1", "u1", 7, imc::v1::INSTANCE_STATE_STOPPING), "t0", "t1");

  assert(MergeInstanceProcess(&im, Observed("r1", "u1", 6, imc::v1::INSTANCE_STATE_STOPPED, true)) == MergeOutcome::kStale);
  assert(im.status().instances().count("r1") == 1);
}

void TestListingDropsOnlyDeletedAbsentEntries() {
  auto im = MakeInstanceManager();
  Track(&im, MakeProcess("kept", "u1", 1, imc::v1::INSTANCE_STATE_STARTING), "t0");
  Track(&im, MakeProcess("pending", "u2", 0, imc::v1::INSTANCE_STATE_PENDING), "t0");
  Track(&im, MakeProcess("gone", "u3", 4, imc::v1::INSTANCE_STATE_STOPPING), "t0", "t1");

  RemoteProcessMap listed;
  listed["kept"]   = Observed("kept", "u1", 2, imc::v1::INSTANCE_STATE_RUNNING);
  listed["stray"]  = Observed("stray", "u9", 1, imc::v1::INSTANCE_STATE_RUNNING);

  assert(ReconcileProcessListing(&im, listed));

  assert(Entry(im, "kept").status().state() == imc::v1::INSTANCE_STATE_RUNNING);
  assert(im.status().instances().count("pending") == 1);
  assert(im.status().instances().count("gone") == 0);
  assert(im.status().instances().count("stray") == 0);
}

void TestListingWithNothingNewReportsUnchanged() {
  auto im = MakeInstanceManager();
  Track(&im, MakeProcess("r1", "u1", 3, imc::v1::INSTANCE_STATE_RUNNING), "t0");

  RemoteProcessMap listed;
  listed["r1"] = Observed("r1", "u1", 3, imc::v1::INSTANCE_STATE_RUNNING);

  assert(!ReconcileProcessListing(&im, listed));
  assert(Entry(im, "r1").spec().created_at() == "t0");
}

} // namespace

int main() {
  TestNewerObservationReplacesAndKeepsLocalTimestamps();
  TestStaleObservationIsDiscarded();
  TestUuidMismatchIsDiscarded();
  TestObservationNeverCreatesEntry();
  TestDeletionRequiresLocalDeletedAt();
  TestStaleDeletionDoesNotRemove();
  TestListingDropsOnlyDeletedAbsentEntries();
  TestListingWithNothingNewReportsUnchanged();

  std::cout << "imc_unit_process_merge: pass\n";
  return 0;
}
