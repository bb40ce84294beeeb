#pragma once

#include <string_view>

#include "imc/rpc/v1/instance_manager_rpc.pb.h"
#include "internal/remote/remote_process_client.hpp"

namespace imc::remote {

imc::v1::InstanceState ParseInstanceState(std::string_view state);

RemoteProcess EngineProcessToInstanceProcess(const imc::rpc::v1::EngineResponse& engine);
RemoteProcess ReplicaProcessToInstanceProcess(const imc::rpc::v1::ProcessResponse& process);

} // namespace imc::remote
