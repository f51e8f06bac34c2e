#include "batch_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace artifact::maintenance {

using artifact::model::EntityId;

namespace {

void AbortChunk(BatchReport& report, const RepositoryContext& context, std::size_t chunk_index, std::size_t chunk_size, const char* reason,
                const std::exception& e) {
  report.chunks_aborted++;
  observability::Metrics::Instance().RecordBatchChunk(false);
  ARTIFACT_LOG_ERROR("Batch chunk aborted", {observability::RepositoryField(context.repository_name), observability::ChunkField(chunk_index),
                                             observability::CountField("items", chunk_size), observability::StringField("reason", reason),
                                             observability::ErrorField(e)});
}

} // namespace

BatchOrchestrator::BatchOrchestrator(TransactionScope& scope, RepositoryContext context) : scope_(scope), context_(std::move(context)) {
}

BatchReport BatchOrchestrator::Run(std::span<const EntityId> ids, const CancelledCheck& cancelled, int batch_size, const ChunkRoutine& routine) {
  if (batch_size < 1) {
    throw std::invalid_argument("batch size must be at least 1, got " + std::to_string(batch_size));
  }
  if (!cancelled) {
    throw std::invalid_argument("a cancellation check is required");
  }
  if (!routine) {
    throw std::invalid_argument("a chunk routine is required");
  }

  BatchReport report;
  const auto  step = static_cast<std::size_t>(batch_size);

  std::size_t chunk_index = 0;
  for (std::size_t offset = 0; offset < ids.size(); offset += step, ++chunk_index) {
    if (cancelled()) {
      report.cancelled = true;
      break;
    }

    auto                    chunk = ids.subspan(offset, std::min(step, ids.size() - offset));
    std::vector<ItemResult> results;
    const auto              hint = "delete components chunk " + std::to_string(chunk_index) + " of " + context_.repository_name;

    try {
      scope_.RunChunk(hint, [&](StorageSession& session) {
        results.clear();
        auto bucket = locator_.FindBucket(session, context_);
        results     = routine(session, bucket, chunk, cancelled);
      });
    } catch (const util::StoreUnavailable& e) {
      AbortChunk(report, context_, chunk_index, chunk.size(), "store unavailable", e);
      continue;
    } catch (const util::ConcurrentModification& e) {
      AbortChunk(report, context_, chunk_index, chunk.size(), "concurrent modification", e);
      continue;
    }

    report.chunks_committed++;
    observability::Metrics::Instance().RecordBatchChunk(true);
    ARTIFACT_LOG_DEBUG("Batch chunk committed", {observability::RepositoryField(context_.repository_name), observability::ChunkField(chunk_index),
                                                 observability::CountField("items", results.size())});
    for (const auto& result : results) {
      switch (result.status) {
        case ItemStatus::kDeleted:
          report.deleted++;
          break;
        case ItemStatus::kAbsent:
          report.absent++;
          break;
        case ItemStatus::kFailed:
          report.failed++;
          break;
      }
    }

    if (results.size() < chunk.size()) {
      report.cancelled = true;
      break;
    }
  }

  ARTIFACT_LOG_INFO("Batch delete finished",
                    {observability::RepositoryField(context_.repository_name), observability::CountField("requested", ids.size()),
                     observability::CountField("deleted", report.deleted), observability::CountField("absent", report.absent),
                     observability::CountField("failed", report.failed), observability::CountField("chunks_aborted", report.chunks_aborted),
                     observability::BoolField("cancelled", report.cancelled)});
  return report;
}

ItemResult BatchOrchestrator::RunItem(StorageSession& session, const EntityId& id, std::size_t ordinal, const ItemOperation& operation) {
  ItemResult result{id, ItemStatus::kAbsent, {}};
  if (id.empty()) {
    result.status = ItemStatus::kFailed;
    result.reason = "empty entity id";
    ARTIFACT_LOG_WARN("Unable to delete component with empty ID", {observability::CountField("position", ordinal)});
    return result;
  }

  ItemSavepoint savepoint(session, "item_" + std::to_string(ordinal));
  try {
    result.status = operation(session) ? ItemStatus::kDeleted : ItemStatus::kAbsent;
    savepoint.Release();
  } catch (const util::StoreUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    savepoint.Rollback();
    result.status = ItemStatus::kFailed;
    result.reason = e.what();
    ARTIFACT_LOG_WARN("Unable to delete component", {observability::IdField("component_id", id), observability::ErrorField(e)});
  }
  return result;
}

} // namespace artifact::maintenance
