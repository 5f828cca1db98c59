#include "pg_pool.hpp"

namespace opentimeline::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
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
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_entity",
               "INSERT INTO entities(id,name,start_year,start_month,start_day,end_year,end_month,end_day) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8)");

  conn.prepare("get_entity",
               "SELECT id,name,start_year,start_month,start_day,end_year,end_month,end_day "
               "FROM entities WHERE id=$1");

  conn.prepare("insert_entity_tag", "INSERT INTO entity_tags(entity_id,name,value) VALUES($1,$2,$3)");

  conn.prepare("get_entity_tags", "SELECT entity_id,name,value FROM entity_tags WHERE entity_id=$1 ORDER BY ctid");

  conn.prepare("insert_timeline", "INSERT INTO timelines(id,name,bool_expression) VALUES($1,$2,$3)");

  conn.prepare("get_timeline", "SELECT id,name,bool_expression FROM timelines WHERE id=$1");

  conn.prepare("get_timeline_by_name", "SELECT id,name,bool_expression FROM timelines WHERE name=$1");

  conn.prepare("insert_timeline_tag", "INSERT INTO timeline_tags(timeline_id,name,value) VALUES($1,$2,$3)");

  conn.prepare("get_timeline_tags", "SELECT timeline_id,name,value FROM timeline_tags WHERE timeline_id=$1 ORDER BY ctid");

  conn.prepare("insert_subtimeline", "INSERT INTO subtimelines(timeline_parent_id,timeline_child_id) VALUES($1,$2)");

  conn.prepare("list_subtimeline_children",
               "SELECT timeline_child_id FROM subtimelines WHERE timeline_parent_id=$1 ORDER BY ctid");

  conn.prepare("insert_timeline_entity", "INSERT INTO timeline_entities(timeline_id,entity_id) VALUES($1,$2)");

  conn.prepare("list_linked_entities", "SELECT entity_id FROM timeline_entities WHERE timeline_id=$1 ORDER BY ctid");
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

} // namespace opentimeline::db::postgres
