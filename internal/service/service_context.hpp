#pragma once

#include <memory>

namespace imc::controller {
class InstanceManagerController;
}
namespace imc::datastore {
class DataStore;
}

namespace imc::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<imc::datastore::DataStore>                  store;
  std::shared_ptr<imc::controller::InstanceManagerController> controller;
};

} // namespace imc::service
