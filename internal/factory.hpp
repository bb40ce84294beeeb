#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/controller/instance_manager_controller.hpp"
#include "internal/datastore/api/datastore.hpp"
#include "internal/remote/remote_process_client.hpp"

namespace imc::factory {

/*
  Application

  Owns all long-lived objects used by the binary. The controller is not
  started; the caller starts it once logging and telemetry are up.
*/
struct Application {
  std::shared_ptr<imc::datastore::DataStore>                  store;
  std::shared_ptr<imc::remote::RemoteClientFactory>           clients;
  std::shared_ptr<imc::controller::InstanceManagerController> controller;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

controller::ControllerOptions ControllerOptionsFromConfig(const imc::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows the concrete store and remote
  client types. Seeds the store from config.bootstrap().
*/
Application Build(const imc::runtime::config::RuntimeConfig& config);

} // namespace imc::factory
