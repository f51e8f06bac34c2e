#include "maintenance_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "internal/maintenance/component_maintenance.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace artifact::service {

using namespace artifact::maintenance::v1;
using artifact::model::EntityId;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// fn receives the RPC span so it can attach its own counters
template <typename Fn>
auto ObserveRpc(std::string_view route, const RepositoryRef& repository, Fn&& fn) {
  artifact::observability::SpanScope span(route);
  span.SetAttribute("repository", repository.name());

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, artifact::observability::SpanScope&>>) {
      fn(span);
      artifact::observability::Metrics::Instance().RecordRequest(route, true, ElapsedMs(started_at));
      return;
    } else {
      auto result = fn(span);
      artifact::observability::Metrics::Instance().RecordRequest(route, true, ElapsedMs(started_at));
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ARTIFACT_LOG_ERROR("RPC failed", {artifact::observability::StringField("route", route), artifact::observability::ErrorField(ex),
                                      artifact::observability::RepositoryField(repository.name())});
    artifact::observability::Metrics::Instance().RecordRequest(route, false, ElapsedMs(started_at));
    throw;
  }
}

const std::string& RequireRepository(const RepositoryRef& repository) {
  if (repository.name().empty()) {
    throw std::invalid_argument("repository name is required");
  }
  return repository.name();
}

} // namespace

MaintenanceService::MaintenanceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.sessions) {
    throw std::invalid_argument("maintenance service requires a session provider");
  }
}

int MaintenanceService::ResolveBatchSize(int requested) const {
  if (requested < 0) {
    throw std::invalid_argument("batch_size must not be negative");
  }
  if (requested == 0) {
    return ctx_.settings.default_batch_size;
  }
  if (ctx_.settings.max_batch_size > 0 && requested > ctx_.settings.max_batch_size) {
    return ctx_.settings.max_batch_size;
  }
  return requested;
}

std::optional<std::chrono::milliseconds> MaintenanceService::ResolveTimeout(std::uint64_t timeout_ms) {
  if (timeout_ms == 0) {
    return std::nullopt;
  }
  if (timeout_ms >= static_cast<std::uint64_t>(kMaxTimeout.count())) {
    return kMaxTimeout;
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(timeout_ms));
}

void MaintenanceService::DeleteComponent(const DeleteComponentRequest& req) {
  ObserveRpc("ComponentMaintenanceService.DeleteComponent", req.repository(), [&](artifact::observability::SpanScope& span) {
    span.SetAttribute("component_id", req.component_id().value());
    artifact::maintenance::DefaultComponentMaintenance maintenance(ctx_.sessions, {RequireRepository(req.repository())},
                                                                   {ctx_.settings.commit_retries});
    maintenance.DeleteComponent(EntityId(req.component_id().value()), req.has_delete_blobs() ? req.delete_blobs() : true);
  });
}

void MaintenanceService::DeleteAsset(const DeleteAssetRequest& req) {
  ObserveRpc("ComponentMaintenanceService.DeleteAsset", req.repository(), [&](artifact::observability::SpanScope& span) {
    span.SetAttribute("asset_id", req.asset_id().value());
    artifact::maintenance::DefaultComponentMaintenance maintenance(ctx_.sessions, {RequireRepository(req.repository())},
                                                                   {ctx_.settings.commit_retries});
    maintenance.DeleteAsset(EntityId(req.asset_id().value()), req.has_delete_blob() ? req.delete_blob() : true);
  });
}

DeleteComponentsResponse MaintenanceService::DeleteComponents(const DeleteComponentsRequest& req, const std::function<bool()>& client_cancelled) {
  return ObserveRpc("ComponentMaintenanceService.DeleteComponents", req.repository(), [&](artifact::observability::SpanScope& span) {
    const auto& repository = RequireRepository(req.repository());
    const int   batch_size = ResolveBatchSize(req.batch_size());

    std::vector<EntityId> ids;
    ids.reserve(static_cast<std::size_t>(req.component_ids_size()));
    for (const auto& id : req.component_ids()) {
      ids.emplace_back(id.value());
    }

    const auto started_at = std::chrono::steady_clock::now();
    const auto timeout    = ResolveTimeout(req.timeout_ms());
    auto       cancelled  = [&] {
      if (client_cancelled && client_cancelled()) {
        return true;
      }
      return timeout && std::chrono::steady_clock::now() - started_at >= *timeout;
    };

    artifact::maintenance::DefaultComponentMaintenance maintenance(ctx_.sessions, {repository}, {ctx_.settings.commit_retries});
    auto report = maintenance.DeleteComponentsWithReport(ids, cancelled, batch_size);

    span.SetAttribute("requested", static_cast<std::int64_t>(ids.size()));
    span.SetAttribute("deleted", static_cast<std::int64_t>(report.deleted));

    DeleteComponentsResponse resp;
    resp.set_deleted_count(report.deleted);
    resp.set_requested_count(ids.size());
    resp.set_cancelled(report.cancelled);
    return resp;
  });
}

} // namespace artifact::service
