#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace phrase::db::sqlite {

using phrase::db::ErrorCode;
using phrase::db::Result;

namespace {

constexpr const char* kPhraseColumns =
    "p.id,p.content,p.hint,p.language,p.difficulty_score,p.is_global,p.is_approved,"
    "p.created_by_player_id,p.contributor_name,p.phrase_type,p.usage_count,p.created_at_ms";

constexpr const char* kAssignmentColumns =
    "pp.phrase_id,pp.target_player_id,pp.priority,pp.assigned_at_ms,pp.is_delivered,pp.delivered_at_ms";

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db), false);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  // SQLITE_ROW or SQLITE_DONE; anything else throws. Used by read paths.
  int StepOrThrow() {
    int rc = sqlite3_step(st_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      const int primary = rc & 0xFF;
      throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db_), primary == SQLITE_BUSY || primary == SQLITE_LOCKED);
    }
    return rc;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::PhraseRecord ReadPhrase(sqlite3_stmt* st) {
  model::PhraseRecord r;
  r.id                   = ColText(st, 0);
  r.content              = ColText(st, 1);
  r.hint                 = ColText(st, 2);
  r.language             = static_cast<manager::v1::Language>(ColI32(st, 3));
  r.difficulty_score     = ColI32(st, 4);
  r.is_global            = ColI32(st, 5) != 0;
  r.is_approved          = ColI32(st, 6) != 0;
  r.created_by_player_id = ColOptText(st, 7);
  r.contributor_name     = ColText(st, 8);
  r.phrase_type          = static_cast<manager::v1::PhraseType>(ColI32(st, 9));
  r.usage_count          = ColU64(st, 10);
  r.created_at_ms        = ColU64(st, 11);
  return r;
}

model::AssignmentRecord ReadAssignment(sqlite3_stmt* st) {
  model::AssignmentRecord r;
  r.phrase_id        = ColText(st, 0);
  r.target_player_id = ColText(st, 1);
  r.priority         = ColI32(st, 2);
  r.assigned_at_ms   = ColU64(st, 3);
  r.is_delivered     = ColI32(st, 4) != 0;
  r.delivered_at_ms  = ColU64(st, 5);
  return r;
}

std::vector<model::PhraseRecord> ReadPhrases(Statement& st) {
  std::vector<model::PhraseRecord> out;
  while (st.StepOrThrow() == SQLITE_ROW)
    out.push_back(ReadPhrase(st.get()));
  return out;
}

// -1 matches any approval state.
int ApprovalParam(const model::GlobalPhraseFilter& filter) {
  if (!filter.approved) return -1;
  return *filter.approved ? 1 : 0;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
    return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  }

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPlayer(Transaction& t, const model::PlayerRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO players(id,name,skill_level,max_difficulty,updated_at_ms) VALUES(?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET name=excluded.name, skill_level=excluded.skill_level, "
               "max_difficulty=excluded.max_difficulty, updated_at_ms=excluded.updated_at_ms;");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindI32(st.get(), 3, r.skill_level);
  BindI32(st.get(), 4, r.max_difficulty);
  BindU64(st.get(), 5, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PlayerRecord> SqliteRepository::GetPlayer(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), "SELECT id,name,skill_level,max_difficulty,updated_at_ms FROM players WHERE id=?;");
  BindText(st.get(), 1, id);

  if (st.StepOrThrow() != SQLITE_ROW) return std::nullopt;

  model::PlayerRecord r;
  r.id             = ColText(st.get(), 0);
  r.name           = ColText(st.get(), 1);
  r.skill_level    = ColI32(st.get(), 2);
  r.max_difficulty = ColI32(st.get(), 3);
  r.updated_at_ms  = ColU64(st.get(), 4);
  return r;
}

// ------------------------------------------------------------------
// Phrases
// ------------------------------------------------------------------

Result SqliteRepository::InsertPhrase(Transaction& t, const model::PhraseRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO phrases(id,content,hint,language,difficulty_score,is_global,is_approved,created_by_player_id,"
               "contributor_name,phrase_type,usage_count,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.content);
  BindText(st.get(), 3, r.hint);
  BindI32(st.get(), 4, static_cast<int>(r.language));
  BindI32(st.get(), 5, r.difficulty_score);
  BindI32(st.get(), 6, r.is_global ? 1 : 0);
  BindI32(st.get(), 7, r.is_approved ? 1 : 0);
  BindOptText(st.get(), 8, r.created_by_player_id);
  BindText(st.get(), 9, r.contributor_name);
  BindI32(st.get(), 10, static_cast<int>(r.phrase_type));
  BindU64(st.get(), 11, r.usage_count);
  BindU64(st.get(), 12, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PhraseRecord> SqliteRepository::GetPhrase(Transaction& t, const std::string& id) {
  const std::string sql = std::string("SELECT ") + kPhraseColumns + " FROM phrases p WHERE p.id=?;";
  Statement         st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, id);

  if (st.StepOrThrow() != SQLITE_ROW) return std::nullopt;
  return ReadPhrase(st.get());
}

Result SqliteRepository::SetPhraseApproved(Transaction& t, const std::string& id, bool approved) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE phrases SET is_approved=? WHERE id=?;");
  BindI32(st.get(), 1, approved ? 1 : 0);
  BindText(st.get(), 2, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  return res;
}

Result SqliteRepository::IncrementUsageCount(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE phrases SET usage_count=usage_count+1 WHERE id=?;");
  BindText(st.get(), 1, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  return res;
}

std::vector<model::PhraseRecord> SqliteRepository::ListGlobalPhrases(Transaction& t, const model::GlobalPhraseFilter& filter, uint32_t limit,
                                                                     uint32_t offset) {
  const std::string sql = std::string("SELECT ") + kPhraseColumns +
                          " FROM phrases p WHERE p.is_global=1 AND p.difficulty_score BETWEEN ?1 AND ?2"
                          " AND (?3=-1 OR p.is_approved=?3) ORDER BY p.created_at_ms DESC, p.id ASC LIMIT ?4 OFFSET ?5;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindI32(st.get(), 1, filter.min_difficulty);
  BindI32(st.get(), 2, filter.max_difficulty);
  BindI32(st.get(), 3, ApprovalParam(filter));
  BindU64(st.get(), 4, limit);
  BindU64(st.get(), 5, offset);

  return ReadPhrases(st);
}

uint64_t SqliteRepository::CountGlobalPhrases(Transaction& t, const model::GlobalPhraseFilter& filter) {
  Statement st(TX(t).Handle(),
               "SELECT COUNT(*) FROM phrases p WHERE p.is_global=1 AND p.difficulty_score BETWEEN ?1 AND ?2"
               " AND (?3=-1 OR p.is_approved=?3);");
  BindI32(st.get(), 1, filter.min_difficulty);
  BindI32(st.get(), 2, filter.max_difficulty);
  BindI32(st.get(), 3, ApprovalParam(filter));

  if (st.StepOrThrow() != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

model::PhraseStats SqliteRepository::GetPhraseStats(Transaction& t) {
  Statement st(TX(t).Handle(),
               "SELECT COUNT(*), COALESCE(SUM(is_global),0), COALESCE(SUM(1-is_global),0), "
               "COALESCE(AVG(usage_count),0.0), COALESCE(MAX(usage_count),0) FROM phrases;");

  model::PhraseStats stats;
  if (st.StepOrThrow() != SQLITE_ROW) return stats;
  stats.total_phrases    = ColU64(st.get(), 0);
  stats.global_phrases   = ColU64(st.get(), 1);
  stats.targeted_phrases = ColU64(st.get(), 2);
  stats.avg_usage        = sqlite3_column_double(st.get(), 3);
  stats.max_usage        = ColU64(st.get(), 4);
  return stats;
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result SqliteRepository::InsertAssignment(Transaction& t, const model::AssignmentRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO player_phrases(phrase_id,target_player_id,priority,assigned_at_ms,is_delivered,delivered_at_ms) "
               "VALUES(?,?,?,?,?,?) ON CONFLICT(phrase_id,target_player_id) DO NOTHING;");
  BindText(st.get(), 1, r.phrase_id);
  BindText(st.get(), 2, r.target_player_id);
  BindI32(st.get(), 3, r.priority);
  BindU64(st.get(), 4, r.assigned_at_ms);
  BindI32(st.get(), 5, r.is_delivered ? 1 : 0);
  if (r.is_delivered) {
    BindU64(st.get(), 6, r.delivered_at_ms);
  } else {
    sqlite3_bind_null(st.get(), 6);
  }

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return res;
}

std::optional<model::AssignmentRecord> SqliteRepository::GetAssignment(Transaction& t, const std::string& phrase_id,
                                                                       const std::string& player_id) {
  const std::string sql =
      std::string("SELECT ") + kAssignmentColumns + " FROM player_phrases pp WHERE pp.phrase_id=? AND pp.target_player_id=?;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, phrase_id);
  BindText(st.get(), 2, player_id);

  if (st.StepOrThrow() != SQLITE_ROW) return std::nullopt;
  return ReadAssignment(st.get());
}

std::optional<model::AssignmentRecord> SqliteRepository::NextTargetedAssignment(Transaction& t, const std::string& player_id) {
  // rowid breaks ties in insertion order.
  const std::string sql =
      std::string("SELECT ") + kAssignmentColumns +
      " FROM player_phrases pp WHERE pp.target_player_id=?1 AND pp.is_delivered=0"
      " AND NOT EXISTS (SELECT 1 FROM skipped_phrases s WHERE s.player_id=?1 AND s.phrase_id=pp.phrase_id)"
      " AND NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=?1 AND c.phrase_id=pp.phrase_id)"
      " ORDER BY pp.priority ASC, pp.assigned_at_ms ASC, pp.rowid ASC LIMIT 1;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, player_id);

  if (st.StepOrThrow() != SQLITE_ROW) return std::nullopt;
  return ReadAssignment(st.get());
}

Result SqliteRepository::MarkAssignmentDelivered(Transaction& t, const std::string& phrase_id, const std::string& player_id,
                                                 uint64_t delivered_at_ms) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE player_phrases SET is_delivered=1, delivered_at_ms=? "
               "WHERE phrase_id=? AND target_player_id=? AND is_delivered=0;");
  BindU64(st.get(), 1, delivered_at_ms);
  BindText(st.get(), 2, phrase_id);
  BindText(st.get(), 3, player_id);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Global pool
// ------------------------------------------------------------------

std::vector<model::PhraseRecord> SqliteRepository::EligibleGlobalPhrases(Transaction& t, const std::string& player_id, int32_t max_difficulty,
                                                                         uint32_t limit) {
  const std::string sql =
      std::string("SELECT ") + kPhraseColumns +
      " FROM phrases p WHERE p.is_global=1 AND p.is_approved=1"
      " AND (p.created_by_player_id IS NULL OR p.created_by_player_id<>?1)"
      " AND p.difficulty_score<=?2"
      " AND NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=?1 AND c.phrase_id=p.id)"
      " AND NOT EXISTS (SELECT 1 FROM skipped_phrases s WHERE s.player_id=?1 AND s.phrase_id=p.id)"
      " ORDER BY RANDOM() LIMIT ?3;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, player_id);
  BindI32(st.get(), 2, max_difficulty);
  BindU64(st.get(), 3, limit);

  return ReadPhrases(st);
}

std::vector<model::PhraseRecord> SqliteRepository::SkipFallbackPhrases(Transaction& t, const std::string& player_id, uint32_t limit) {
  const std::string sql =
      std::string("SELECT ") + kPhraseColumns +
      " FROM skipped_phrases s JOIN phrases p ON p.id=s.phrase_id WHERE s.player_id=?1"
      " AND NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=?1 AND c.phrase_id=p.id)"
      " AND ((p.is_global=1 AND p.is_approved=1)"
      "   OR EXISTS (SELECT 1 FROM player_phrases pp WHERE pp.phrase_id=p.id AND pp.target_player_id=?1))"
      " ORDER BY RANDOM() LIMIT ?2;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindText(st.get(), 1, player_id);
  BindU64(st.get(), 2, limit);

  return ReadPhrases(st);
}

// ------------------------------------------------------------------
// Player history
// ------------------------------------------------------------------

Result SqliteRepository::InsertCompletion(Transaction& t, const model::CompletionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO completed_phrases(player_id,phrase_id,score,hints_used,completion_time_ms,completed_at_ms) "
               "VALUES(?,?,?,?,?,?) ON CONFLICT(player_id,phrase_id) DO NOTHING;");
  BindText(st.get(), 1, r.player_id);
  BindText(st.get(), 2, r.phrase_id);
  BindI32(st.get(), 3, r.score);
  BindU64(st.get(), 4, r.hints_used);
  BindU64(st.get(), 5, r.completion_time_ms);
  BindU64(st.get(), 6, r.completed_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return res;
}

Result SqliteRepository::InsertSkip(Transaction& t, const model::SkipRecord& r) {
  auto* db = TX(t).Handle();

  // COMPLETED is terminal; the guard shares the insert's write lock.
  Statement st(db,
               "INSERT INTO skipped_phrases(player_id,phrase_id,skipped_at_ms) SELECT ?1,?2,?3 "
               "WHERE NOT EXISTS (SELECT 1 FROM completed_phrases c WHERE c.player_id=?1 AND c.phrase_id=?2) "
               "ON CONFLICT(player_id,phrase_id) DO NOTHING;");
  BindText(st.get(), 1, r.player_id);
  BindText(st.get(), 2, r.phrase_id);
  BindU64(st.get(), 3, r.skipped_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return res;
}

bool SqliteRepository::HasCompletion(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  Statement st(TX(t).Handle(), "SELECT 1 FROM completed_phrases WHERE player_id=? AND phrase_id=?;");
  BindText(st.get(), 1, player_id);
  BindText(st.get(), 2, phrase_id);
  return st.StepOrThrow() == SQLITE_ROW;
}

bool SqliteRepository::HasSkip(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  Statement st(TX(t).Handle(), "SELECT 1 FROM skipped_phrases WHERE player_id=? AND phrase_id=?;");
  BindText(st.get(), 1, player_id);
  BindText(st.get(), 2, phrase_id);
  return st.StepOrThrow() == SQLITE_ROW;
}

// ------------------------------------------------------------------
// Hint usage
// ------------------------------------------------------------------

Result SqliteRepository::InsertHintUsage(Transaction& t, const model::HintUsageRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO hint_usage(player_id,phrase_id,hint_level,used_at_ms) VALUES(?,?,?,?) "
               "ON CONFLICT(player_id,phrase_id,hint_level) DO NOTHING;");
  BindText(st.get(), 1, r.player_id);
  BindText(st.get(), 2, r.phrase_id);
  BindU64(st.get(), 3, r.hint_level);
  BindU64(st.get(), 4, r.used_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return res;
}

std::vector<model::HintUsageRecord> SqliteRepository::ListHintUsage(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  Statement st(TX(t).Handle(),
               "SELECT hint_level,used_at_ms FROM hint_usage WHERE player_id=? AND phrase_id=? ORDER BY hint_level;");
  BindText(st.get(), 1, player_id);
  BindText(st.get(), 2, phrase_id);

  std::vector<model::HintUsageRecord> out;
  while (st.StepOrThrow() == SQLITE_ROW) {
    model::HintUsageRecord r;
    r.player_id  = player_id;
    r.phrase_id  = phrase_id;
    r.hint_level = static_cast<uint32_t>(ColI32(st.get(), 0));
    r.used_at_ms = ColU64(st.get(), 1);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace phrase::db::sqlite
