#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "imc/admin/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace imc::grpc {

class AdminServer final : public imc::admin::v1::InstanceManagerAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<imc::service::AdminService> svc);

  ::grpc::Status ListInstanceManagers(::grpc::ServerContext*, const imc::admin::v1::ListInstanceManagersRequest*,
                                      imc::admin::v1::ListInstanceManagersResponse*) override;

  ::grpc::Status GetInstanceManager(::grpc::ServerContext*, const imc::admin::v1::GetInstanceManagerRequest*,
                                    imc::admin::v1::GetInstanceManagerResponse*) override;

  ::grpc::Status GetControllerStats(::grpc::ServerContext*, const imc::admin::v1::GetControllerStatsRequest*,
                                    imc::admin::v1::GetControllerStatsResponse*) override;

 private:
  std::shared_ptr<imc::service::AdminService> service_;
};

} // namespace imc::grpc
