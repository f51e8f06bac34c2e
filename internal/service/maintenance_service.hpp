#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "artifact/maintenance/v1.hpp"
#include "service_context.hpp"

namespace artifact::service {

/*
  Request-level facade over the maintenance engine.

  Each request is bound to the repository it names. DeleteComponents stops
  producing chunks once the client cancelled or timeout_ms elapsed.
*/
class MaintenanceService {
public:
  explicit MaintenanceService(ServiceContext ctx);

  void DeleteComponent(const artifact::maintenance::v1::DeleteComponentRequest& req);

  void DeleteAsset(const artifact::maintenance::v1::DeleteAssetRequest& req);

  artifact::maintenance::v1::DeleteComponentsResponse
  DeleteComponents(const artifact::maintenance::v1::DeleteComponentsRequest& req,
                   const std::function<bool()>& client_cancelled = {});

  // 0 -> default, above max -> max, negative -> std::invalid_argument
  int ResolveBatchSize(int requested) const;

  // 0 -> no timeout, anything longer than kMaxTimeout is clamped to it
  static std::optional<std::chrono::milliseconds> ResolveTimeout(std::uint64_t timeout_ms);

  static constexpr std::chrono::milliseconds kMaxTimeout = std::chrono::hours(24 * 365);

private:
  ServiceContext ctx_;
};

}
