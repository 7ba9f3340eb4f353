#include "pg_repository.hpp"

#include "phrase/manager/v1.hpp"

namespace phrase::db::postgres {

namespace {

constexpr const char* kPhraseColumns =
    "p.id,p.content,p.hint,p.language,p.difficulty_score,p.is_global,p.is_approved,p.created_by_player_id,"
    "p.contributor_name,p.phrase_type,p.usage_count,p.created_at_ms";

model::PhraseRecord ReadPhrase(const pqxx::row& row) {
  model::PhraseRecord r;
  r.id                   = row[0].c_str();
  r.content              = row[1].c_str();
  r.hint                 = row[2].c_str();
  r.language             = static_cast<manager::v1::Language>(row[3].as<int>());
  r.difficulty_score     = row[4].as<int32_t>();
  r.is_global            = row[5].as<bool>();
  r.is_approved          = row[6].as<bool>();
  if (!row[7].is_null()) r.created_by_player_id = row[7].c_str();
  r.contributor_name     = row[8].c_str();
  r.phrase_type          = static_cast<manager::v1::PhraseType>(row[9].as<int>());
  r.usage_count          = row[10].as<uint64_t>();
  r.created_at_ms        = row[11].as<uint64_t>();
  return r;
}

model::AssignmentRecord ReadAssignment(const pqxx::row& row) {
  model::AssignmentRecord r;
  r.phrase_id        = row[0].c_str();
  r.target_player_id = row[1].c_str();
  r.priority         = row[2].as<int32_t>();
  r.assigned_at_ms   = row[3].as<uint64_t>();
  r.is_delivered     = row[4].as<bool>();
  r.delivered_at_ms  = row[5].is_null() ? 0 : row[5].as<uint64_t>();
  return r;
}

std::vector<model::PhraseRecord> ReadPhrases(const pqxx::result& res) {
  std::vector<model::PhraseRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadPhrase(row));
  return out;
}

// Empty optional matches any approval state.
std::optional<bool> ApprovalParam(const model::GlobalPhraseFilter& filter) {
  return filter.approved;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

Result PgRepository::UpsertPlayer(Transaction& t, const model::PlayerRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO players(id,name,skill_level,max_difficulty,updated_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(id) DO UPDATE SET name=EXCLUDED.name,skill_level=EXCLUDED.skill_level,"
        "max_difficulty=EXCLUDED.max_difficulty,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id, r.name, r.skill_level, r.max_difficulty, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PlayerRecord> PgRepository::GetPlayer(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_player", id);
  if (res.empty()) return std::nullopt;

  model::PlayerRecord r;
  r.id             = res[0][0].c_str();
  r.name           = res[0][1].c_str();
  r.skill_level    = res[0][2].as<int32_t>();
  r.max_difficulty = res[0][3].as<int32_t>();
  r.updated_at_ms  = res[0][4].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Phrases
// ------------------------------------------------------------------

Result PgRepository::InsertPhrase(Transaction& t, const model::PhraseRecord& r) {
  try {
    // DO NOTHING keeps the surrounding pqxx::work usable after a duplicate.
    auto res = TX(t).Work().exec_params(
        "INSERT INTO phrases(id,content,hint,language,difficulty_score,is_global,is_approved,created_by_player_id,"
        "contributor_name,phrase_type,usage_count,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) "
        "ON CONFLICT(id) DO NOTHING;",
        r.id, r.content, r.hint, static_cast<int>(r.language), r.difficulty_score, r.is_global, r.is_approved, r.created_by_player_id,
        r.contributor_name, static_cast<int>(r.phrase_type), r.usage_count, r.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PhraseRecord> PgRepository::GetPhrase(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_phrase", id);
  if (res.empty()) return std::nullopt;
  return ReadPhrase(res[0]);
}

Result PgRepository::SetPhraseApproved(Transaction& t, const std::string& id, bool approved) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE phrases SET is_approved=$2 WHERE id=$1;", id, approved);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::IncrementUsageCount(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE phrases SET usage_count=usage_count+1 WHERE id=$1;", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PhraseRecord> PgRepository::ListGlobalPhrases(Transaction& t, const model::GlobalPhraseFilter& filter, uint32_t limit,
                                                                 uint32_t offset) {
  const std::string sql = std::string("SELECT ") + kPhraseColumns +
                          " FROM phrases p WHERE p.is_global AND p.difficulty_score BETWEEN $1 AND $2"
                          " AND ($3::boolean IS NULL OR p.is_approved=$3::boolean)"
                          " ORDER BY p.created_at_ms DESC, p.id ASC LIMIT $4 OFFSET $5;";
  auto res = TX(t).Work().exec_params(sql, filter.min_difficulty, filter.max_difficulty, ApprovalParam(filter), limit, offset);
  return ReadPhrases(res);
}

uint64_t PgRepository::CountGlobalPhrases(Transaction& t, const model::GlobalPhraseFilter& filter) {
  auto res = TX(t).Work().exec_params(
      "SELECT COUNT(*) FROM phrases p WHERE p.is_global AND p.difficulty_score BETWEEN $1 AND $2"
      " AND ($3::boolean IS NULL OR p.is_approved=$3::boolean);",
      filter.min_difficulty, filter.max_difficulty, ApprovalParam(filter));
  return res[0][0].as<uint64_t>();
}

model::PhraseStats PgRepository::GetPhraseStats(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT COUNT(*), COUNT(*) FILTER (WHERE is_global), COUNT(*) FILTER (WHERE NOT is_global), "
      "COALESCE(AVG(usage_count),0)::float8, COALESCE(MAX(usage_count),0) FROM phrases;");

  model::PhraseStats stats;
  stats.total_phrases    = res[0][0].as<uint64_t>();
  stats.global_phrases   = res[0][1].as<uint64_t>();
  stats.targeted_phrases = res[0][2].as<uint64_t>();
  stats.avg_usage        = res[0][3].as<double>();
  stats.max_usage        = res[0][4].as<uint64_t>();
  return stats;
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result PgRepository::InsertAssignment(Transaction& t, const model::AssignmentRecord& r) {
  try {
    std::optional<uint64_t> delivered_at;
    if (r.is_delivered) delivered_at = r.delivered_at_ms;

    auto res = TX(t).Work().exec_params(
        "INSERT INTO player_phrases(phrase_id,target_player_id,priority,assigned_at_ms,is_delivered,delivered_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT(phrase_id,target_player_id) DO NOTHING;",
        r.phrase_id, r.target_player_id, r.priority, r.assigned_at_ms, r.is_delivered, delivered_at);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AssignmentRecord> PgRepository::GetAssignment(Transaction& t, const std::string& phrase_id,
                                                                   const std::string& player_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT phrase_id,target_player_id,priority,assigned_at_ms,is_delivered,delivered_at_ms "
      "FROM player_phrases WHERE phrase_id=$1 AND target_player_id=$2;",
      phrase_id, player_id);
  if (res.empty()) return std::nullopt;
  return ReadAssignment(res[0]);
}

std::optional<model::AssignmentRecord> PgRepository::NextTargetedAssignment(Transaction& t, const std::string& player_id) {
  auto res = TX(t).Work().exec_prepared("next_targeted", player_id);
  if (res.empty()) return std::nullopt;
  return ReadAssignment(res[0]);
}

Result PgRepository::MarkAssignmentDelivered(Transaction& t, const std::string& phrase_id, const std::string& player_id,
                                             uint64_t delivered_at_ms) {
  try {
    TX(t).Work().exec_prepared("mark_delivered", phrase_id, player_id, delivered_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Global pool
// ------------------------------------------------------------------

std::vector<model::PhraseRecord> PgRepository::EligibleGlobalPhrases(Transaction& t, const std::string& player_id, int32_t max_difficulty,
                                                                     uint32_t limit) {
  auto res = TX(t).Work().exec_prepared("eligible_global", player_id, max_difficulty, limit);
  return ReadPhrases(res);
}

std::vector<model::PhraseRecord> PgRepository::SkipFallbackPhrases(Transaction& t, const std::string& player_id, uint32_t limit) {
  const std::string sql =
      std::string("SELECT ") + kPhraseColumns +
      " FROM skipped_phrases s JOIN phrases p ON p.id=s.phrase_id WHERE s.player_id=$1"
      " AND NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=$1 AND c.phrase_id=p.id)"
      " AND ((p.is_global AND p.is_approved)"
      "   OR EXISTS (SELECT 1 FROM player_phrases pp WHERE pp.phrase_id=p.id AND pp.target_player_id=$1))"
      " ORDER BY random() LIMIT $2;";
  auto res = TX(t).Work().exec_params(sql, player_id, limit);
  return ReadPhrases(res);
}

// ------------------------------------------------------------------
// Player history
// ------------------------------------------------------------------

Result PgRepository::InsertCompletion(Transaction& t, const model::CompletionRecord& r) {
  try {
    TX(t).Work().exec_prepared("lock_history_pair", r.player_id, r.phrase_id);
    auto res = TX(t).Work().exec_prepared("insert_completion", r.player_id, r.phrase_id, r.score, r.hints_used, r.completion_time_ms,
                                          r.completed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertSkip(Transaction& t, const model::SkipRecord& r) {
  try {
    TX(t).Work().exec_prepared("lock_history_pair", r.player_id, r.phrase_id);
    auto res = TX(t).Work().exec_prepared("insert_skip", r.player_id, r.phrase_id, r.skipped_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::HasCompletion(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM completed_phrases WHERE player_id=$1 AND phrase_id=$2;", player_id, phrase_id);
  return !res.empty();
}

bool PgRepository::HasSkip(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM skipped_phrases WHERE player_id=$1 AND phrase_id=$2;", player_id, phrase_id);
  return !res.empty();
}

Result PgRepository::InsertHintUsage(Transaction& t, const model::HintUsageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_hint_usage", r.player_id, r.phrase_id, static_cast<int32_t>(r.hint_level), r.used_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HintUsageRecord> PgRepository::ListHintUsage(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  auto res = TX(t).Work().exec_prepared("list_hint_usage", player_id, phrase_id);

  std::vector<model::HintUsageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::HintUsageRecord r;
    r.player_id  = player_id;
    r.phrase_id  = phrase_id;
    r.hint_level = static_cast<uint32_t>(row[0].as<int32_t>());
    r.used_at_ms = row[1].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace phrase::db::postgres
