#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/assignment_record.hpp"
#include "internal/db/model/completion_record.hpp"
#include "internal/db/model/hint_usage_record.hpp"
#include "internal/db/model/phrase_query.hpp"
#include "internal/db/model/phrase_record.hpp"
#include "internal/db/model/player_record.hpp"
#include "internal/db/model/skip_record.hpp"

namespace phrase::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - InsertAssignment / InsertCompletion / InsertSkip / InsertHintUsage are
    conflict-ignoring: a duplicate key returns AlreadyExists and leaves the
    row untouched
  - InsertSkip also returns AlreadyExists when the pair is completed, checked
    in the same statement as the insert
  - Selection queries never return a phrase present in the player's
    completion set as of the transaction snapshot

  The DB is the source of truth for:
    phrases and their targeting
    per-player skip, completion and hint history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Players (mirrored from the external registry)
  // ---------------------------------------------------------------------

  virtual Result UpsertPlayer(Transaction&, const model::PlayerRecord&) = 0;

  virtual std::optional<model::PlayerRecord> GetPlayer(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Phrases
  // ---------------------------------------------------------------------

  virtual Result InsertPhrase(Transaction&, const model::PhraseRecord&) = 0;

  virtual std::optional<model::PhraseRecord> GetPhrase(Transaction&, const std::string& id) = 0;

  virtual Result SetPhraseApproved(Transaction&, const std::string& id, bool approved) = 0;

  virtual Result IncrementUsageCount(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::PhraseRecord> ListGlobalPhrases(Transaction&, const model::GlobalPhraseFilter& filter, uint32_t limit,
                                                             uint32_t offset) = 0;

  virtual uint64_t CountGlobalPhrases(Transaction&, const model::GlobalPhraseFilter& filter) = 0;

  virtual model::PhraseStats GetPhraseStats(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Assignments
  // ---------------------------------------------------------------------

  virtual Result InsertAssignment(Transaction&, const model::AssignmentRecord&) = 0;

  virtual std::optional<model::AssignmentRecord> GetAssignment(Transaction&, const std::string& phrase_id, const std::string& player_id) = 0;

  // Oldest, lowest-priority undelivered assignment whose phrase the player
  // has neither skipped nor completed. Ordered by priority, then assigned_at.
  virtual std::optional<model::AssignmentRecord> NextTargetedAssignment(Transaction&, const std::string& player_id) = 0;

  // No-op when the assignment is missing or already delivered.
  virtual Result MarkAssignmentDelivered(Transaction&, const std::string& phrase_id, const std::string& player_id,
                                         uint64_t delivered_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Global pool
  // ---------------------------------------------------------------------

  // Approved, global, not authored by the player, neither completed nor
  // skipped by them, difficulty <= max_difficulty. Random order.
  virtual std::vector<model::PhraseRecord> EligibleGlobalPhrases(Transaction&, const std::string& player_id, int32_t max_difficulty,
                                                                 uint32_t limit) = 0;

  // Skipped but not completed by the player, and either approved+global or
  // targeted to them. Random order.
  virtual std::vector<model::PhraseRecord> SkipFallbackPhrases(Transaction&, const std::string& player_id, uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Player history
  // ---------------------------------------------------------------------

  virtual Result InsertCompletion(Transaction&, const model::CompletionRecord&) = 0;

  virtual Result InsertSkip(Transaction&, const model::SkipRecord&) = 0;

  virtual bool HasCompletion(Transaction&, const std::string& player_id, const std::string& phrase_id) = 0;

  virtual bool HasSkip(Transaction&, const std::string& player_id, const std::string& phrase_id) = 0;

  // ---------------------------------------------------------------------
  // Hint usage
  // ---------------------------------------------------------------------

  virtual Result InsertHintUsage(Transaction&, const model::HintUsageRecord&) = 0;

  // Ordered by hint_level.
  virtual std::vector<model::HintUsageRecord> ListHintUsage(Transaction&, const std::string& player_id, const std::string& phrase_id) = 0;

  // ---------------------------------------------------------------------
  // Composite operations (built on the primitives above)
  // ---------------------------------------------------------------------

  // Inserts the phrase and one assignment per distinct target. Duplicate
  // targets are ignored. Throws on any storage failure; the caller's
  // transaction is then left uncommitted and rolls back as a whole.
  // Returns the number of assignments inserted.
  uint32_t CreatePhraseWithTargets(Transaction&, const model::PhraseRecord& phrase, const std::vector<std::string>& target_player_ids,
                                   int32_t priority);

  // Returns false when the pair was already completed.
  bool RecordCompletion(Transaction&, const model::CompletionRecord& record);

  // Returns false when the pair was already skipped or completed. A skip
  // counts as delivery of a matching assignment either way.
  bool RecordSkip(Transaction&, const model::SkipRecord& record);
};

} // namespace phrase::db
