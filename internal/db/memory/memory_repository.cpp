#include "memory_repository.hpp"

#include <algorithm>
#include <random>

#include "memory_tx.hpp"

namespace phrase::db::memory {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

bool Matches(const model::PhraseRecord& p, const model::GlobalPhraseFilter& filter) {
  if (!p.is_global) return false;
  if (filter.approved.has_value() && p.is_approved != *filter.approved) return false;
  return p.difficulty_score >= filter.min_difficulty && p.difficulty_score <= filter.max_difficulty;
}

std::vector<model::PhraseRecord> ShuffleAndCap(std::vector<model::PhraseRecord> out, uint32_t limit) {
  std::shuffle(out.begin(), out.end(), Rng());
  if (out.size() > limit) out.resize(limit);
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPlayer(Transaction& t, const model::PlayerRecord& r) {
  TX(t).Mutable().players[r.id] = r;
  return Result::Ok();
}

std::optional<model::PlayerRecord> MemoryRepository::GetPlayer(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.players.find(id);
  if (it == s.players.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Phrases
// ------------------------------------------------------------------

Result MemoryRepository::InsertPhrase(Transaction& t, const model::PhraseRecord& r) {
  if (TX(t).View().phrases.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().phrases[r.id] = r;
  return Result::Ok();
}

std::optional<model::PhraseRecord> MemoryRepository::GetPhrase(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.phrases.find(id);
  if (it == s.phrases.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetPhraseApproved(Transaction& t, const std::string& id, bool approved) {
  if (!TX(t).View().phrases.contains(id)) return Result::Err(ErrorCode::NotFound, id);
  TX(t).Mutable().phrases[id].is_approved = approved;
  return Result::Ok();
}

Result MemoryRepository::IncrementUsageCount(Transaction& t, const std::string& id) {
  if (!TX(t).View().phrases.contains(id)) return Result::Err(ErrorCode::NotFound, id);
  TX(t).Mutable().phrases[id].usage_count++;
  return Result::Ok();
}

std::vector<model::PhraseRecord> MemoryRepository::ListGlobalPhrases(Transaction& t, const model::GlobalPhraseFilter& filter, uint32_t limit,
                                                                     uint32_t offset) {
  std::vector<model::PhraseRecord> matched;
  for (const auto& [_, p] : TX(t).View().phrases)
    if (Matches(p, filter)) matched.push_back(p);

  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });

  if (offset >= matched.size()) return {};
  auto first = matched.begin() + offset;
  auto last  = matched.size() - offset > limit ? first + limit : matched.end();
  return std::vector<model::PhraseRecord>(first, last);
}

uint64_t MemoryRepository::CountGlobalPhrases(Transaction& t, const model::GlobalPhraseFilter& filter) {
  const auto& phrases = TX(t).View().phrases;
  return std::count_if(phrases.begin(), phrases.end(), [&](const auto& kv) { return Matches(kv.second, filter); });
}

model::PhraseStats MemoryRepository::GetPhraseStats(Transaction& t) {
  model::PhraseStats stats;
  uint64_t           usage_total = 0;
  for (const auto& [_, p] : TX(t).View().phrases) {
    ++stats.total_phrases;
    if (p.is_global) {
      ++stats.global_phrases;
    } else {
      ++stats.targeted_phrases;
    }
    usage_total += p.usage_count;
    stats.max_usage = std::max(stats.max_usage, p.usage_count);
  }
  if (stats.total_phrases > 0) stats.avg_usage = static_cast<double>(usage_total) / static_cast<double>(stats.total_phrases);
  return stats;
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result MemoryRepository::InsertAssignment(Transaction& t, const model::AssignmentRecord& r) {
  if (GetAssignment(t, r.phrase_id, r.target_player_id).has_value()) return Result::Err(ErrorCode::AlreadyExists);
  if (!TX(t).View().phrases.contains(r.phrase_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown phrase " + r.phrase_id);
  TX(t).Mutable().assignments.push_back(r);
  return Result::Ok();
}

std::optional<model::AssignmentRecord> MemoryRepository::GetAssignment(Transaction& t, const std::string& phrase_id,
                                                                       const std::string& player_id) {
  for (const auto& a : TX(t).View().assignments)
    if (a.phrase_id == phrase_id && a.target_player_id == player_id) return a;
  return std::nullopt;
}

std::optional<model::AssignmentRecord> MemoryRepository::NextTargetedAssignment(Transaction& t, const std::string& player_id) {
  const auto& s = TX(t).View();

  const model::AssignmentRecord* best = nullptr;
  for (const auto& a : s.assignments) {
    if (a.target_player_id != player_id || a.is_delivered) continue;

    const HistoryKey key{player_id, a.phrase_id};
    if (s.skips.contains(key) || s.completions.contains(key)) continue;

    // Strict comparison keeps the earliest inserted on ties.
    if (!best || a.priority < best->priority || (a.priority == best->priority && a.assigned_at_ms < best->assigned_at_ms)) {
      best = &a;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

Result MemoryRepository::MarkAssignmentDelivered(Transaction& t, const std::string& phrase_id, const std::string& player_id,
                                                 uint64_t delivered_at_ms) {
  const auto& view = TX(t).View().assignments;
  auto        it   = std::find_if(view.begin(), view.end(),
                                  [&](const auto& a) { return a.phrase_id == phrase_id && a.target_player_id == player_id; });
  if (it == view.end() || it->is_delivered) return Result::Ok();

  auto& target           = TX(t).Mutable().assignments[static_cast<size_t>(it - view.begin())];
  target.is_delivered    = true;
  target.delivered_at_ms = delivered_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Global pool
// ------------------------------------------------------------------

std::vector<model::PhraseRecord> MemoryRepository::EligibleGlobalPhrases(Transaction& t, const std::string& player_id, int32_t max_difficulty,
                                                                         uint32_t limit) {
  const auto& s = TX(t).View();

  std::vector<model::PhraseRecord> out;
  for (const auto& [id, p] : s.phrases) {
    if (!p.is_global || !p.is_approved) continue;
    if (p.created_by_player_id && *p.created_by_player_id == player_id) continue;
    if (p.difficulty_score > max_difficulty) continue;

    const HistoryKey key{player_id, id};
    if (s.completions.contains(key) || s.skips.contains(key)) continue;
    out.push_back(p);
  }
  return ShuffleAndCap(std::move(out), limit);
}

std::vector<model::PhraseRecord> MemoryRepository::SkipFallbackPhrases(Transaction& t, const std::string& player_id, uint32_t limit) {
  const auto& s = TX(t).View();

  std::vector<model::PhraseRecord> out;
  for (const auto& [key, skip] : s.skips) {
    if (key.first != player_id || s.completions.contains(key)) continue;

    auto it = s.phrases.find(key.second);
    if (it == s.phrases.end()) continue;

    const auto& p        = it->second;
    const bool  targeted = std::any_of(s.assignments.begin(), s.assignments.end(), [&](const auto& a) {
      return a.phrase_id == p.id && a.target_player_id == player_id;
    });
    if ((p.is_global && p.is_approved) || targeted) out.push_back(p);
  }
  return ShuffleAndCap(std::move(out), limit);
}

// ------------------------------------------------------------------
// Player history
// ------------------------------------------------------------------

Result MemoryRepository::InsertCompletion(Transaction& t, const model::CompletionRecord& r) {
  const HistoryKey key{r.player_id, r.phrase_id};
  if (TX(t).View().completions.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  if (!TX(t).View().phrases.contains(r.phrase_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown phrase " + r.phrase_id);
  TX(t).Mutable().completions.emplace(key, r);
  return Result::Ok();
}

Result MemoryRepository::InsertSkip(Transaction& t, const model::SkipRecord& r) {
  const HistoryKey key{r.player_id, r.phrase_id};
  if (TX(t).View().skips.contains(key) || TX(t).View().completions.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  if (!TX(t).View().phrases.contains(r.phrase_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown phrase " + r.phrase_id);
  TX(t).Mutable().skips.emplace(key, r);
  return Result::Ok();
}

bool MemoryRepository::HasCompletion(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  return TX(t).View().completions.contains(HistoryKey{player_id, phrase_id});
}

bool MemoryRepository::HasSkip(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  return TX(t).View().skips.contains(HistoryKey{player_id, phrase_id});
}

// ------------------------------------------------------------------
// Hint usage
// ------------------------------------------------------------------

Result MemoryRepository::InsertHintUsage(Transaction& t, const model::HintUsageRecord& r) {
  const HistoryKey key{r.player_id, r.phrase_id};
  const auto&      hints = TX(t).View().hints;
  if (auto it = hints.find(key); it != hints.end() && it->second.contains(r.hint_level)) return Result::Err(ErrorCode::AlreadyExists);
  if (!TX(t).View().phrases.contains(r.phrase_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown phrase " + r.phrase_id);
  TX(t).Mutable().hints[key].emplace(r.hint_level, r);
  return Result::Ok();
}

std::vector<model::HintUsageRecord> MemoryRepository::ListHintUsage(Transaction& t, const std::string& player_id, const std::string& phrase_id) {
  std::vector<model::HintUsageRecord> out;
  const auto&                         hints = TX(t).View().hints;
  auto                                it    = hints.find(HistoryKey{player_id, phrase_id});
  if (it == hints.end()) return out;
  for (const auto& [_, record] : it->second)
    out.push_back(record);
  return out;
}

} // namespace phrase::db::memory
