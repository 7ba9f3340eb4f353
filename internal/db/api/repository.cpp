#include "internal/db/api/repository.hpp"

namespace phrase::db {

uint32_t Repository::CreatePhraseWithTargets(Transaction& tx, const model::PhraseRecord& phrase,
                                             const std::vector<std::string>& target_player_ids, int32_t priority) {
  ThrowIfError(InsertPhrase(tx, phrase), "insert phrase " + phrase.id);

  uint32_t inserted = 0;
  for (const auto& target : target_player_ids) {
    model::AssignmentRecord assignment;
    assignment.phrase_id        = phrase.id;
    assignment.target_player_id = target;
    assignment.priority         = priority;
    assignment.assigned_at_ms   = phrase.created_at_ms;

    auto result = InsertAssignment(tx, assignment);
    if (result.code == ErrorCode::AlreadyExists) continue;
    ThrowIfError(result, "insert assignment " + phrase.id + " -> " + target);
    ++inserted;
  }
  return inserted;
}

bool Repository::RecordCompletion(Transaction& tx, const model::CompletionRecord& record) {
  auto result = InsertCompletion(tx, record);
  if (result.code == ErrorCode::AlreadyExists) return false;
  ThrowIfError(result, "record completion " + record.player_id + "/" + record.phrase_id);

  ThrowIfError(MarkAssignmentDelivered(tx, record.phrase_id, record.player_id, record.completed_at_ms),
               "mark delivered " + record.phrase_id);
  return true;
}

bool Repository::RecordSkip(Transaction& tx, const model::SkipRecord& record) {
  // InsertSkip refuses completed pairs, so COMPLETED stays terminal.
  auto result = InsertSkip(tx, record);
  if (result.code != ErrorCode::AlreadyExists) {
    ThrowIfError(result, "record skip " + record.player_id + "/" + record.phrase_id);
  }

  ThrowIfError(MarkAssignmentDelivered(tx, record.phrase_id, record.player_id, record.skipped_at_ms), "mark delivered " + record.phrase_id);
  return result.code != ErrorCode::AlreadyExists;
}

} // namespace phrase::db
