#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/channel.h>

#include "imc/rpc/v1/instance_manager_rpc.grpc.pb.h"
#include "internal/remote/remote_process_client.hpp"

namespace imc::remote {

class EngineManagerClient final : public RemoteProcessClient {
 public:
  EngineManagerClient(std::shared_ptr<::grpc::Channel> channel, std::string address, std::chrono::milliseconds list_timeout);

  const char* Role() const override {
    return "engine";
  }

  RemoteProcessMap               List() override;
  std::unique_ptr<ProcessStream> Watch() override;

 private:
  std::string                                                address_;
  std::chrono::milliseconds                                  list_timeout_;
  std::unique_ptr<imc::rpc::v1::EngineManagerService::Stub> stub_;
};

class ReplicaManagerClient final : public RemoteProcessClient {
 public:
  ReplicaManagerClient(std::shared_ptr<::grpc::Channel> channel, std::string address, std::chrono::milliseconds list_timeout);

  const char* Role() const override {
    return "replica";
  }

  RemoteProcessMap               List() override;
  std::unique_ptr<ProcessStream> Watch() override;

 private:
  std::string                                                 address_;
  std::chrono::milliseconds                                   list_timeout_;
  std::unique_ptr<imc::rpc::v1::ProcessManagerService::Stub> stub_;
};

/*
  Dials <ip>:<port> with insecure credentials, one channel per client.
*/
class GrpcRemoteClientFactory final : public RemoteClientFactory {
 public:
  explicit GrpcRemoteClientFactory(uint32_t manager_port, std::chrono::milliseconds list_timeout = std::chrono::seconds(30));

  std::unique_ptr<RemoteProcessClient> Create(imc::v1::InstanceManagerType type, const std::string& ip) override;

 private:
  uint32_t                  manager_port_;
  std::chrono::milliseconds list_timeout_;
};

} // namespace imc::remote
