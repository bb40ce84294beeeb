#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/datastore/memory/memory_datastore.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/grpc_process_clients.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"

namespace imc::factory {

namespace {

void Require(const datastore::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error("bootstrap " + what + " failed: " + datastore::ToString(result.code) + " " + result.message);
  }
}

void SeedStore(datastore::DataStore& store, const imc::runtime::config::BootstrapConfig& bootstrap) {
  for (const auto& node : bootstrap.nodes()) {
    Require(store.PutNode(node), "node " + node.name());
  }
  for (const auto& image : bootstrap.engine_images()) {
    Require(store.PutEngineImage(image), "engine image " + image.name());
  }
  for (auto im : bootstrap.instance_managers()) {
    Require(store.CreateInstanceManager(im), "instance manager " + im.metadata().name());
  }

  IMC_LOG_INFO("Seeded object store", {observability::IntField("nodes", bootstrap.nodes_size()),
                                       observability::IntField("engine_images", bootstrap.engine_images_size()),
                                       observability::IntField("instance_managers", bootstrap.instance_managers_size())});
}

} // namespace

controller::ControllerOptions ControllerOptionsFromConfig(const imc::runtime::config::RuntimeConfig& config) {
  const auto& c = config.controller();

  controller::ControllerOptions options;
  options.controller_id                = c.controller_id();
  options.controller_namespace         = c.namespace_();
  options.max_retries                  = static_cast<int>(c.max_retries());
  options.resync_period                = std::chrono::milliseconds(c.resync_period_ms());
  options.manager_port                 = c.manager_port();
  options.watch.reconnect_interval     = std::chrono::milliseconds(c.watch_reconnect_interval_ms());
  options.watch.update_retry_interval  = std::chrono::milliseconds(c.update_retry_interval_ms());
  options.queue_limits.base_delay      = std::chrono::milliseconds(config.queue().base_delay_ms());
  options.queue_limits.max_delay       = std::chrono::milliseconds(config.queue().max_delay_ms());
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const imc::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Object store
  // ------------------------------------------------------------------
  auto store = std::make_shared<datastore::memory::MemoryDataStore>(config.controller().namespace_());
  SeedStore(*store, config.bootstrap());
  app.store = store;

  // ------------------------------------------------------------------
  // Controller
  // ------------------------------------------------------------------
  app.clients    = std::make_shared<remote::GrpcRemoteClientFactory>(config.controller().manager_port());
  app.controller = std::make_shared<controller::InstanceManagerController>(*app.store, app.clients, ControllerOptionsFromConfig(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store      = app.store;
  ctx.controller = app.controller;

  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace imc::factory
