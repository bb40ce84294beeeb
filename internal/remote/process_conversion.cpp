#include "internal/remote/process_conversion.hpp"

namespace imc::remote {

namespace {

void CopyStatus(const imc::rpc::v1::ProcessStatus& from, imc::v1::InstanceProcessStatus* to) {
  to->set_state(ParseInstanceState(from.state()));
  to->set_error_msg(from.error_msg());
  to->set_port_start(from.port_start());
  to->set_port_end(from.port_end());
  to->set_resource_version(from.resource_version());
}

} // namespace

imc::v1::InstanceState ParseInstanceState(std::string_view state) {
  if (state == "starting") return imc::v1::INSTANCE_STATE_STARTING;
  if (state == "running") return imc::v1::INSTANCE_STATE_RUNNING;
  if (state == "stopping") return imc::v1::INSTANCE_STATE_STOPPING;
  if (state == "stopped") return imc::v1::INSTANCE_STATE_STOPPED;
  if (state == "error") return imc::v1::INSTANCE_STATE_ERROR;
  if (state == "pending") return imc::v1::INSTANCE_STATE_PENDING;
  return imc::v1::INSTANCE_STATE_UNKNOWN;
}

RemoteProcess EngineProcessToInstanceProcess(const imc::rpc::v1::EngineResponse& engine) {
  RemoteProcess out;
  auto*         spec = out.process.mutable_spec();
  spec->set_name(engine.spec().name());
  spec->set_uuid(engine.spec().uuid());

  auto* status = out.process.mutable_status();
  CopyStatus(engine.status(), status);
  status->set_type(imc::v1::INSTANCE_TYPE_ENGINE);
  status->set_listen(engine.spec().listen());

  out.deleted = engine.deleted();
  return out;
}

RemoteProcess ReplicaProcessToInstanceProcess(const imc::rpc::v1::ProcessResponse& process) {
  RemoteProcess out;
  auto*         spec = out.process.mutable_spec();
  spec->set_name(process.spec().name());
  spec->set_uuid(process.spec().uuid());

  auto* status = out.process.mutable_status();
  CopyStatus(process.status(), status);
  status->set_type(imc::v1::INSTANCE_TYPE_REPLICA);

  out.deleted = process.deleted();
  return out;
}

} // namespace imc::remote
