#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace imc::grpc {

using namespace imc::admin::v1;

AdminServer::AdminServer(std::shared_ptr<imc::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::ListInstanceManagers(::grpc::ServerContext*, const ListInstanceManagersRequest* req, ListInstanceManagersResponse* resp) {
  try {
    *resp = service_->ListInstanceManagers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetInstanceManager(::grpc::ServerContext*, const GetInstanceManagerRequest* req, GetInstanceManagerResponse* resp) {
  try {
    *resp = service_->GetInstanceManager(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetControllerStats(::grpc::ServerContext*, const GetControllerStatsRequest* req, GetControllerStatsResponse* resp) {
  try {
    *resp = service_->GetControllerStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace imc::grpc
