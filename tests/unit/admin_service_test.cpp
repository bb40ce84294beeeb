#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/controller/instance_manager_controller.hpp"
#include "internal/datastore/memory/memory_datastore.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

class UnreachableFactory final : public imc::remote::RemoteClientFactory {
 public:
  std::unique_ptr<imc::remote::RemoteProcessClient> Create(imc::v1::InstanceManagerType, const std::string& ip) override {
    throw imc::util::Unavailable("no daemon at " + ip);
  }
};

imc::service::ServiceContext BuildServiceContext() {
  imc::service::ServiceContext ctx;
  ctx.store = std::make_shared<imc::datastore::memory::MemoryDataStore>("imc-system");

  imc::controller::ControllerOptions options;
  options.controller_id        = "node-1";
  options.controller_namespace = "imc-system";
  options.resync_period        = std::chrono::milliseconds(0);
  ctx.controller = std::make_shared<imc::controller::InstanceManagerController>(*ctx.store, std::make_shared<UnreachableFactory>(), options);
  return ctx;
}

void Create(imc::service::ServiceContext& ctx, const std::string& name, const std::string& owner_id) {
  imc::v1::InstanceManager im;
  im.mutable_metadata()->set_name(name);
  im.mutable_spec()->set_node_id("node-1");
  im.mutable_spec()->set_owner_id(owner_id);
  im.mutable_spec()->set_type(imc::v1::INSTANCE_MANAGER_TYPE_REPLICA);
  assert(ctx.store->CreateInstanceManager(im));
}

void TestListAndGet() {
  auto ctx = BuildServiceContext();
  Create(ctx, "im-a", "node-1");
  Create(ctx, "im-b", "");

  imc::service::AdminService service(ctx);

  const auto list = service.ListInstanceManagers({});
  assert(list.instance_managers_size() == 2);

  imc::v1::GetInstanceManagerRequest req;
  req.set_name("im-b");
  const auto resp = service.GetInstanceManager(req);
  assert(resp.instance_manager().metadata().name() == "im-b");
  assert(resp.instance_manager().spec().type() == imc::v1::INSTANCE_MANAGER_TYPE_REPLICA);
  assert(!resp.instance_manager().metadata().finalizers().empty());
}

void TestGetValidatesName() {
  auto ctx = BuildServiceContext();
  imc::service::AdminService service(ctx);

  bool invalid = false;
  try {
    service.GetInstanceManager({});
  } catch (const imc::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);

  imc::v1::GetInstanceManagerRequest req;
  req.set_name("missing");
  bool missing = false;
  try {
    service.GetInstanceManager(req);
  } catch (const imc::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestControllerStatsCountsOwnership() {
  auto ctx = BuildServiceContext();
  Create(ctx, "im-a", "node-1");
  Create(ctx, "im-b", "node-2");
  Create(ctx, "im-c", "node-1");

  imc::service::AdminService service(ctx);
  const auto                 stats = service.GetControllerStats({});

  assert(stats.controller_id() == "node-1");
  assert(stats.namespace_() == "imc-system");
  assert(stats.instance_managers() == 3);
  assert(stats.owned_instance_managers() == 2);
  assert(stats.active_watches() == 0);
  // Each create was queued by the store event handler; no worker is running.
  assert(stats.queue_length() == 3);
}

void TestServerMapsErrorsToStatus() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<imc::service::AdminService>(ctx);
  imc::grpc::AdminServer server(service);

  ::grpc::ServerContext              grpc_ctx;
  imc::v1::GetInstanceManagerRequest  req;
  imc::v1::GetInstanceManagerResponse resp;

  auto status = server.GetInstanceManager(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_name("missing");
  status = server.GetInstanceManager(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  Create(ctx, "im-a", "");
  req.set_name("im-a");
  status = server.GetInstanceManager(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.instance_manager().metadata().name() == "im-a");
}

void TestErrorMapping() {
  using imc::grpc::ToStatus;

  assert(ToStatus(imc::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(imc::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(imc::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(imc::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);

  const auto internal = ToStatus(std::runtime_error("boom"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "boom");
}

} // namespace

int main() {
  TestListAndGet();
  TestGetValidatesName();
  TestControllerStatsCountsOwnership();
  TestServerMapsErrorsToStatus();
  TestErrorMapping();

  std::cout << "imc_unit_admin_service: pass\n";
  return 0;
}
