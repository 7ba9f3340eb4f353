#pragma once

#include <string>
#include <vector>

namespace phrase::db::sql {

/*
  Bootstrap DDL for the SQL backends.

  Ids are UUID text. Timestamps are unix milliseconds. The composite
  primary keys on player_phrases, skipped_phrases, completed_phrases and
  hint_usage are what make the conflict-ignoring inserts idempotent.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS players (id TEXT PRIMARY KEY, name TEXT NOT NULL, skill_level INTEGER NOT NULL DEFAULT 1, "
      "max_difficulty INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS phrases (id TEXT PRIMARY KEY, content TEXT NOT NULL, hint TEXT NOT NULL DEFAULT '', language INTEGER NOT NULL, "
      "difficulty_score INTEGER NOT NULL CHECK (difficulty_score BETWEEN 1 AND 100), is_global INTEGER NOT NULL DEFAULT 0, "
      "is_approved INTEGER NOT NULL DEFAULT 0, created_by_player_id TEXT REFERENCES players(id), contributor_name TEXT NOT NULL DEFAULT '', "
      "phrase_type INTEGER NOT NULL, usage_count INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS player_phrases (phrase_id TEXT NOT NULL REFERENCES phrases(id) ON DELETE CASCADE, "
      "target_player_id TEXT NOT NULL REFERENCES players(id), priority INTEGER NOT NULL DEFAULT 1, assigned_at_ms INTEGER NOT NULL, "
      "is_delivered INTEGER NOT NULL DEFAULT 0, delivered_at_ms INTEGER, PRIMARY KEY (phrase_id, target_player_id));",
      "CREATE TABLE IF NOT EXISTS skipped_phrases (player_id TEXT NOT NULL REFERENCES players(id), phrase_id TEXT NOT NULL REFERENCES "
      "phrases(id) ON DELETE CASCADE, skipped_at_ms INTEGER NOT NULL, PRIMARY KEY (player_id, phrase_id));",
      "CREATE TABLE IF NOT EXISTS completed_phrases (player_id TEXT NOT NULL REFERENCES players(id), phrase_id TEXT NOT NULL REFERENCES "
      "phrases(id) ON DELETE CASCADE, score INTEGER NOT NULL, hints_used INTEGER NOT NULL DEFAULT 0, completion_time_ms INTEGER NOT NULL "
      "DEFAULT 0, completed_at_ms INTEGER NOT NULL, PRIMARY KEY (player_id, phrase_id));",
      "CREATE TABLE IF NOT EXISTS hint_usage (player_id TEXT NOT NULL REFERENCES players(id), phrase_id TEXT NOT NULL REFERENCES "
      "phrases(id) ON DELETE CASCADE, hint_level INTEGER NOT NULL CHECK (hint_level BETWEEN 1 AND 3), used_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (player_id, phrase_id, hint_level));",
      "CREATE INDEX IF NOT EXISTS idx_player_phrases_inbox ON player_phrases(target_player_id, is_delivered, priority, assigned_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_phrases_global_pool ON phrases(is_global, is_approved, difficulty_score);",
  };
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS players (id TEXT PRIMARY KEY, name TEXT NOT NULL, skill_level INTEGER NOT NULL DEFAULT 1, "
      "max_difficulty INTEGER NOT NULL DEFAULT 0, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS phrases (id TEXT PRIMARY KEY, content TEXT NOT NULL, hint TEXT NOT NULL DEFAULT '', language SMALLINT NOT NULL, "
      "difficulty_score INTEGER NOT NULL CHECK (difficulty_score BETWEEN 1 AND 100), is_global BOOLEAN NOT NULL DEFAULT false, "
      "is_approved BOOLEAN NOT NULL DEFAULT false, created_by_player_id TEXT REFERENCES players(id), contributor_name TEXT NOT NULL DEFAULT '', "
      "phrase_type SMALLINT NOT NULL, usage_count BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS player_phrases (seq BIGSERIAL, phrase_id TEXT NOT NULL REFERENCES phrases(id) ON DELETE CASCADE, "
      "target_player_id TEXT NOT NULL REFERENCES players(id), priority INTEGER NOT NULL DEFAULT 1, assigned_at_ms BIGINT NOT NULL, "
      "is_delivered BOOLEAN NOT NULL DEFAULT false, delivered_at_ms BIGINT, PRIMARY KEY (phrase_id, target_player_id));",
      "CREATE TABLE IF NOT EXISTS skipped_phrases (player_id TEXT NOT NULL REFERENCES players(id), phrase_id TEXT NOT NULL REFERENCES "
      "phrases(id) ON DELETE CASCADE, skipped_at_ms BIGINT NOT NULL, PRIMARY KEY (player_id, phrase_id));",
      "CREATE TABLE IF NOT EXISTS completed_phrases (player_id TEXT NOT NULL REFERENCES players(id), phrase_id TEXT NOT NULL REFERENCES "
      "phrases(id) ON DELETE CASCADE, score INTEGER NOT NULL, hints_used INTEGER NOT NULL DEFAULT 0, completion_time_ms BIGINT NOT NULL "
      "DEFAULT 0, completed_at_ms BIGINT NOT NULL, PRIMARY KEY (player_id, phrase_id));",
      "CREATE TABLE IF NOT EXISTS hint_usage (player_id TEXT NOT NULL REFERENCES players(id), phrase_id TEXT NOT NULL REFERENCES "
      "phrases(id) ON DELETE CASCADE, hint_level SMALLINT NOT NULL CHECK (hint_level BETWEEN 1 AND 3), used_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY (player_id, phrase_id, hint_level));",
      "CREATE INDEX IF NOT EXISTS idx_player_phrases_inbox ON player_phrases(target_player_id, is_delivered, priority, assigned_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_phrases_global_pool ON phrases(is_global, is_approved, difficulty_score);",
  };
  return kSchema;
}

} // namespace phrase::db::sql
