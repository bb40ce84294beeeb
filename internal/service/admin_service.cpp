#include "admin_service.hpp"

#include <chrono>
#include <string_view>

#include "internal/controller/instance_manager_controller.hpp"
#include "internal/datastore/api/datastore.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace imc::service {

using namespace imc::v1;

namespace {

// Runs `body` inside a span and records the route's outcome and latency.
template <typename Body>
auto Instrumented(std::string_view route, Body&& body) {
  imc::observability::SpanScope span(route);
  const auto                    started_at = std::chrono::steady_clock::now();
  auto&                         metrics    = imc::observability::Metrics::Instance();

  auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    auto resp = body();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    IMC_LOG_ERROR("RPC failed", {imc::observability::StringField("route", route), imc::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListInstanceManagersResponse AdminService::ListInstanceManagers(const ListInstanceManagersRequest&) {
  return Instrumented("AdminService.ListInstanceManagers", [&] {
    ListInstanceManagersResponse resp;
    for (auto& im : ctx_.store->ListInstanceManagers()) {
      *resp.add_instance_managers() = std::move(im);
    }
    return resp;
  });
}

GetInstanceManagerResponse AdminService::GetInstanceManager(const GetInstanceManagerRequest& req) {
  return Instrumented("AdminService.GetInstanceManager", [&] {
    if (req.name().empty()) {
      throw util::InvalidArgument("instance manager name is required");
    }

    auto im = ctx_.store->GetInstanceManager(req.name());
    if (!im) {
      throw util::NotFound("instance manager " + req.name() + " not found");
    }

    GetInstanceManagerResponse resp;
    *resp.mutable_instance_manager() = std::move(*im);
    return resp;
  });
}

GetControllerStatsResponse AdminService::GetControllerStats(const GetControllerStatsRequest&) {
  return Instrumented("AdminService.GetControllerStats", [&] {
    const auto stats = ctx_.controller->Stats();

    GetControllerStatsResponse resp;
    resp.set_controller_id(stats.controller_id);
    resp.set_namespace_(stats.controller_namespace);
    resp.set_queue_length(stats.queue_length);
    resp.set_active_watches(stats.active_watches);

    uint64_t total = 0;
    uint64_t owned = 0;
    for (const auto& im : ctx_.store->ListInstanceManagers()) {
      ++total;
      if (im.spec().owner_id() == stats.controller_id) ++owned;
    }
    resp.set_instance_managers(total);
    resp.set_owned_instance_managers(owned);
    return resp;
  });
}

} // namespace imc::service
