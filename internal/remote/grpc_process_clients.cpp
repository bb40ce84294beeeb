#include "internal/remote/grpc_process_clients.hpp"

#include <functional>
#include <mutex>
#include <string_view>

#include <google/protobuf/empty.pb.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/sync_stream.h>

#include "internal/remote/process_conversion.hpp"
#include "internal/util/errors.hpp"

namespace imc::remote {

namespace {

void ThrowIfFailed(const grpc::Status& status, std::string_view action, const std::string& address) {
  if (status.ok()) {
    return;
  }
  throw util::Unavailable(std::string(action) + " on " + address + " failed: " + status.error_message());
}

/*
  Server-streaming call adapter. The context exists before the call starts and
  outlives the reader; it is the handle used to cancel a blocked Open() or
  Read() from another thread.
*/
template <typename Response>
class GrpcProcessStream final : public ProcessStream {
 public:
  using Convert = std::function<RemoteProcess(const Response&)>;
  using Starter = std::function<std::unique_ptr<grpc::ClientReader<Response>>(grpc::ClientContext*)>;

  GrpcProcessStream(Starter start, Convert convert)
      : context_(std::make_unique<grpc::ClientContext>()), start_(std::move(start)), convert_(std::move(convert)) {
  }

  ~GrpcProcessStream() override {
    if (reader_ && !finished_) {
      context_->TryCancel();
      reader_->Finish();
    }
  }

  bool Open() override {
    // A TryCancel() issued before this point cancels the call as it starts.
    reader_ = start_(context_.get());
    return reader_ != nullptr;
  }

  bool Recv(RemoteProcess* out) override {
    Response response;
    if (!reader_->Read(&response)) {
      return false;
    }
    *out = convert_(response);
    return true;
  }

  void Close() override {
    context_->TryCancel();
  }

  std::string Finish() override {
    std::lock_guard lock(finish_mutex_);
    if (finished_) {
      return "stream already finished";
    }
    if (!reader_) {
      return "stream was never opened";
    }
    finished_   = true;
    auto status = reader_->Finish();
    if (status.ok()) {
      return "stream closed by server";
    }
    return status.error_message();
  }

 private:
  std::unique_ptr<grpc::ClientContext>          context_;
  Starter                                       start_;
  Convert                                       convert_;
  std::unique_ptr<grpc::ClientReader<Response>> reader_;

  std::mutex finish_mutex_;
  bool       finished_ = false;
};

std::shared_ptr<grpc::Channel> Dial(const std::string& address) {
  return grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
}

} // namespace

// ------------------------------------------------------------
// Engine role
// ------------------------------------------------------------

EngineManagerClient::EngineManagerClient(std::shared_ptr<grpc::Channel> channel, std::string address, std::chrono::milliseconds list_timeout)
    : address_(std::move(address)), list_timeout_(list_timeout), stub_(imc::rpc::v1::EngineManagerService::NewStub(std::move(channel))) {
}

RemoteProcessMap EngineManagerClient::List() {
  imc::rpc::v1::EngineListRequest  req;
  imc::rpc::v1::EngineListResponse resp;
  grpc::ClientContext              ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + list_timeout_);

  ThrowIfFailed(stub_->EngineList(&ctx, req, &resp), "EngineList", address_);

  RemoteProcessMap out;
  for (const auto& [name, engine] : resp.engines()) {
    out.emplace(name, EngineProcessToInstanceProcess(engine));
  }
  return out;
}

std::unique_ptr<ProcessStream> EngineManagerClient::Watch() {
  auto* stub = stub_.get();
  return std::make_unique<GrpcProcessStream<imc::rpc::v1::EngineResponse>>(
      [stub](grpc::ClientContext* ctx) { return stub->EngineWatch(ctx, google::protobuf::Empty{}); },
      [](const imc::rpc::v1::EngineResponse& engine) { return EngineProcessToInstanceProcess(engine); });
}

// ------------------------------------------------------------
// Replica role
// ------------------------------------------------------------

ReplicaManagerClient::ReplicaManagerClient(std::shared_ptr<grpc::Channel> channel, std::string address, std::chrono::milliseconds list_timeout)
    : address_(std::move(address)), list_timeout_(list_timeout), stub_(imc::rpc::v1::ProcessManagerService::NewStub(std::move(channel))) {
}

RemoteProcessMap ReplicaManagerClient::List() {
  imc::rpc::v1::ProcessListRequest  req;
  imc::rpc::v1::ProcessListResponse resp;
  grpc::ClientContext               ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + list_timeout_);

  ThrowIfFailed(stub_->ProcessList(&ctx, req, &resp), "ProcessList", address_);

  RemoteProcessMap out;
  for (const auto& [name, process] : resp.processes()) {
    out.emplace(name, ReplicaProcessToInstanceProcess(process));
  }
  return out;
}

std::unique_ptr<ProcessStream> ReplicaManagerClient::Watch() {
  auto* stub = stub_.get();
  return std::make_unique<GrpcProcessStream<imc::rpc::v1::ProcessResponse>>(
      [stub](grpc::ClientContext* ctx) { return stub->ProcessWatch(ctx, google::protobuf::Empty{}); },
      [](const imc::rpc::v1::ProcessResponse& process) { return ReplicaProcessToInstanceProcess(process); });
}

// ------------------------------------------------------------
// Factory
// ------------------------------------------------------------

GrpcRemoteClientFactory::GrpcRemoteClientFactory(uint32_t manager_port, std::chrono::milliseconds list_timeout)
    : manager_port_(manager_port), list_timeout_(list_timeout) {
}

std::unique_ptr<RemoteProcessClient> GrpcRemoteClientFactory::Create(imc::v1::InstanceManagerType type, const std::string& ip) {
  if (ip.empty()) {
    throw util::InvalidState("instance manager IP was not set before creating a remote client");
  }

  const auto address = ip + ":" + std::to_string(manager_port_);
  switch (type) {
    case imc::v1::INSTANCE_MANAGER_TYPE_ENGINE:
      return std::make_unique<EngineManagerClient>(Dial(address), address, list_timeout_);
    case imc::v1::INSTANCE_MANAGER_TYPE_REPLICA:
      return std::make_unique<ReplicaManagerClient>(Dial(address), address, list_timeout_);
    default:
      throw util::InvalidState("BUG: invalid instance manager type " + imc::v1::InstanceManagerType_Name(type));
  }
}

} // namespace imc::remote
