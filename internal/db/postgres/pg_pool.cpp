#include "pg_pool.hpp"

namespace artifact::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("find_bucket", "SELECT id, repository_name FROM bucket WHERE repository_name=$1");

  conn.prepare("find_component",
               "SELECT id, bucket_id, format, group_name, name, version "
               "FROM component WHERE id=$1 AND bucket_id=$2");

  conn.prepare("delete_component", "DELETE FROM component WHERE id=$1");

  conn.prepare("find_asset",
               "SELECT id, bucket_id, component_id, name, blob_store, blob_id, size_bytes "
               "FROM asset WHERE id=$1 AND bucket_id=$2");

  conn.prepare("browse_component_assets",
               "SELECT id, bucket_id, component_id, name, blob_store, blob_id, size_bytes "
               "FROM asset WHERE component_id=$1 ORDER BY id COLLATE \"C\"");

  conn.prepare("delete_asset", "DELETE FROM asset WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace artifact::db::postgres
