#pragma once

#include "imc/core/v1/instance_manager.pb.h"

#include "imc/rpc/v1/instance_manager_rpc.pb.h"
#include "imc/rpc/v1/instance_manager_rpc.grpc.pb.h"

#include "imc/admin/v1/admin_service.pb.h"
#include "imc/admin/v1/admin_service.grpc.pb.h"

namespace imc::v1 {
using namespace ::imc::core::v1;
using namespace ::imc::admin::v1;
}
