#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace phrase::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertPlayer(Transaction&, const model::PlayerRecord&) override;
  std::optional<model::PlayerRecord> GetPlayer(Transaction&, const std::string&) override;

  Result InsertPhrase(Transaction&, const model::PhraseRecord&) override;
  std::optional<model::PhraseRecord> GetPhrase(Transaction&, const std::string&) override;
  Result SetPhraseApproved(Transaction&, const std::string&, bool) override;
  Result IncrementUsageCount(Transaction&, const std::string&) override;
  std::vector<model::PhraseRecord> ListGlobalPhrases(Transaction&, const model::GlobalPhraseFilter&, uint32_t limit,
                                                     uint32_t offset) override;
  uint64_t CountGlobalPhrases(Transaction&, const model::GlobalPhraseFilter&) override;
  model::PhraseStats GetPhraseStats(Transaction&) override;

  Result InsertAssignment(Transaction&, const model::AssignmentRecord&) override;
  std::optional<model::AssignmentRecord> GetAssignment(Transaction&, const std::string& phrase_id,
                                                       const std::string& player_id) override;
  std::optional<model::AssignmentRecord> NextTargetedAssignment(Transaction&, const std::string& player_id) override;
  Result MarkAssignmentDelivered(Transaction&, const std::string& phrase_id, const std::string& player_id,
                                 uint64_t delivered_at_ms) override;

  std::vector<model::PhraseRecord> EligibleGlobalPhrases(Transaction&, const std::string& player_id, int32_t max_difficulty,
                                                         uint32_t limit) override;
  std::vector<model::PhraseRecord> SkipFallbackPhrases(Transaction&, const std::string& player_id, uint32_t limit) override;

  Result InsertCompletion(Transaction&, const model::CompletionRecord&) override;
  Result InsertSkip(Transaction&, const model::SkipRecord&) override;
  bool HasCompletion(Transaction&, const std::string& player_id, const std::string& phrase_id) override;
  bool HasSkip(Transaction&, const std::string& player_id, const std::string& phrase_id) override;

  Result InsertHintUsage(Transaction&, const model::HintUsageRecord&) override;
  std::vector<model::HintUsageRecord> ListHintUsage(Transaction&, const std::string& player_id, const std::string& phrase_id) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace phrase::db::sqlite
