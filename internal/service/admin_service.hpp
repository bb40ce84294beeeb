#pragma once

#include "imc/v1.hpp"
#include "service_context.hpp"

namespace imc::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  imc::v1::ListInstanceManagersResponse ListInstanceManagers(const imc::v1::ListInstanceManagersRequest& req);

  // Throws util::NotFound for an unknown name.
  imc::v1::GetInstanceManagerResponse GetInstanceManager(const imc::v1::GetInstanceManagerRequest& req);

  imc::v1::GetControllerStatsResponse GetControllerStats(const imc::v1::GetControllerStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace imc::service
