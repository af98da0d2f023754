#include "pg_pool.hpp"

#include <cctype>
#include <utility>

#include "internal/db/sql/sql_queries.hpp"

namespace tams::db::postgres {

namespace {

struct NamedStatement {
  const char* name;
  const char* sql;
};

constexpr NamedStatement kStatements[] = {
    {"insert_source", sql::INSERT_SOURCE},
    {"select_source", sql::SELECT_SOURCE},
    {"list_sources", sql::LIST_SOURCES},
    {"update_source", sql::UPDATE_SOURCE},
    {"detach_source_flows", sql::DETACH_SOURCE_FLOWS},
    {"delete_source", sql::DELETE_SOURCE},
    {"insert_flow", sql::INSERT_FLOW},
    {"select_flow", sql::SELECT_FLOW},
    {"list_flows", sql::LIST_FLOWS},
    {"update_flow", sql::UPDATE_FLOW},
    {"delete_flow_segments", sql::DELETE_FLOW_SEGMENTS},
    {"delete_flow", sql::DELETE_FLOW},
    {"insert_segment", sql::INSERT_SEGMENT},
    {"find_segments", sql::FIND_SEGMENTS},
    {"delete_segment", sql::DELETE_SEGMENT},
    {"upsert_media_object", sql::UPSERT_MEDIA_OBJECT},
    {"select_media_object", sql::SELECT_MEDIA_OBJECT},
    {"delete_media_object", sql::DELETE_MEDIA_OBJECT},
    {"list_orphaned_media_objects", sql::LIST_ORPHANED_MEDIA_OBJECTS},
    {"upsert_webhook", sql::UPSERT_WEBHOOK},
    {"select_webhook", sql::SELECT_WEBHOOK},
    {"list_webhooks", sql::LIST_WEBHOOKS},
    {"delete_webhook", sql::DELETE_WEBHOOK},
    {"insert_deletion_request", sql::INSERT_DELETION_REQUEST},
    {"select_deletion_request", sql::SELECT_DELETION_REQUEST},
    {"list_deletion_requests", sql::LIST_DELETION_REQUESTS},
    {"update_deletion_request", sql::UPDATE_DELETION_REQUEST},
    {"insert_event", sql::INSERT_EVENT},
    {"select_event", sql::SELECT_EVENT},
    {"list_undispatched_events", sql::LIST_UNDISPATCHED_EVENTS},
    {"mark_event_dispatched", sql::MARK_EVENT_DISPATCHED},
    {"insert_delivery", sql::INSERT_DELIVERY},
    {"update_delivery", sql::UPDATE_DELIVERY},
    {"list_pending_deliveries", sql::LIST_PENDING_DELIVERIES},
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

std::string PgPool::ToPostgres(const char* sql) {
  std::string out(sql);
  for (std::size_t i = 0; i + 1 < out.size(); ++i) {
    if (out[i] == '?' && std::isdigit(static_cast<unsigned char>(out[i + 1]))) {
      out[i] = '$';
    }
  }
  return out;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  for (const auto& statement : kStatements) {
    conn.prepare(statement.name, ToPostgres(statement.sql));
  }
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

} // namespace tams::db::postgres
