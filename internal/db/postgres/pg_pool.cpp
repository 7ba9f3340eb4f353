#include "pg_pool.hpp"

namespace phrase::db::postgres {

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
        if (conn->is_open()) return Wrap(conn.release());

        // Server dropped it while idle; replace below.
        --live_connections_;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        std::unique_ptr<pqxx::connection> conn;
        try {
          conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
        return Wrap(conn.release());
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_player", "SELECT id,name,skill_level,max_difficulty,updated_at_ms FROM players WHERE id=$1");

  conn.prepare("get_phrase",
               "SELECT id,content,hint,language,difficulty_score,is_global,is_approved,created_by_player_id,"
               "contributor_name,phrase_type,usage_count,created_at_ms FROM phrases WHERE id=$1");

  conn.prepare("next_targeted",
               "SELECT pp.phrase_id,pp.target_player_id,pp.priority,pp.assigned_at_ms,pp.is_delivered,pp.delivered_at_ms "
               "FROM player_phrases pp WHERE pp.target_player_id=$1 AND NOT pp.is_delivered "
               "AND NOT EXISTS (SELECT 1 FROM skipped_phrases s WHERE s.player_id=$1 AND s.phrase_id=pp.phrase_id) "
               "AND NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=$1 AND c.phrase_id=pp.phrase_id) "
               "ORDER BY pp.priority ASC, pp.assigned_at_ms ASC, pp.seq ASC LIMIT 1 "
               // concurrent requests for the same player take different rows
               "FOR UPDATE OF pp SKIP LOCKED");

  conn.prepare("mark_delivered",
               "UPDATE player_phrases SET is_delivered=true, delivered_at_ms=$3 "
               "WHERE phrase_id=$1 AND target_player_id=$2 AND NOT is_delivered");

  conn.prepare("eligible_global",
               "SELECT p.id,p.content,p.hint,p.language,p.difficulty_score,p.is_global,p.is_approved,p.created_by_player_id,"
               "p.contributor_name,p.phrase_type,p.usage_count,p.created_at_ms FROM phrases p "
               "WHERE p.is_global AND p.is_approved "
               "AND (p.created_by_player_id IS NULL OR p.created_by_player_id<>$1) "
               "AND p.difficulty_score<=$2 "
               "AND NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=$1 AND c.phrase_id=p.id) "
               "AND NOT EXISTS (SELECT 1 FROM skipped_phrases s WHERE s.player_id=$1 AND s.phrase_id=p.id) "
               "ORDER BY random() LIMIT $3");

  conn.prepare("insert_completion",
               "INSERT INTO completed_phrases(player_id,phrase_id,score,hints_used,completion_time_ms,completed_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT(player_id,phrase_id) DO NOTHING");

  // Serializes skip and completion writes for one (player, phrase) pair
  // until the transaction ends.
  conn.prepare("lock_history_pair", "SELECT pg_advisory_xact_lock(hashtext($1 || ':' || $2))");

  conn.prepare("insert_skip",
               "INSERT INTO skipped_phrases(player_id,phrase_id,skipped_at_ms) SELECT $1,$2,$3 "
               "WHERE NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=$1 AND c.phrase_id=$2) "
               "ON CONFLICT(player_id,phrase_id) DO NOTHING");

  conn.prepare("insert_hint_usage",
               "INSERT INTO hint_usage(player_id,phrase_id,hint_level,used_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(player_id,phrase_id,hint_level) DO NOTHING");

  conn.prepare("list_hint_usage", "SELECT hint_level,used_at_ms FROM hint_usage WHERE player_id=$1 AND phrase_id=$2 ORDER BY hint_level");
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

} // namespace phrase::db::postgres
