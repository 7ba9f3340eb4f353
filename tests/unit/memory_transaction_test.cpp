#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using phrase::db::memory::MemoryRepository;
using phrase::db::model::PhraseRecord;
using phrase::db::model::PlayerRecord;

PlayerRecord MakePlayer(const std::string& name) {
  PlayerRecord player;
  player.id             = phrase::util::NewId();
  player.name           = name;
  player.max_difficulty = 50;
  return player;
}

PhraseRecord MakeGlobalPhrase(int32_t difficulty) {
  PhraseRecord phrase;
  phrase.id               = phrase::util::NewId();
  phrase.content          = "hello world";
  phrase.difficulty_score = difficulty;
  phrase.is_global        = true;
  phrase.is_approved      = true;
  phrase.created_at_ms    = 1000;
  return phrase;
}

void TestWritesInvisibleUntilCommit() {
  MemoryRepository repo;
  const auto       player = MakePlayer("alice");

  auto writer = repo.Begin();
  assert(repo.UpsertPlayer(*writer, player));
  assert(repo.GetPlayer(*writer, player.id).has_value());

  {
    auto reader = repo.Begin();
    assert(!repo.GetPlayer(*reader, player.id).has_value());
  }

  writer->Commit();
  assert(writer->IsCommitted());

  auto reader = repo.Begin();
  assert(repo.GetPlayer(*reader, player.id).has_value());
}

void TestDestructorRollsBack() {
  MemoryRepository repo;
  const auto       phrase = MakeGlobalPhrase(10);

  {
    auto tx = repo.Begin();
    assert(repo.InsertPhrase(*tx, phrase));
  }

  auto tx = repo.Begin();
  assert(!repo.GetPhrase(*tx, phrase.id).has_value());
}

void TestConcurrentWriterLosesWithConflict() {
  MemoryRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();

  assert(repo.UpsertPlayer(*first, MakePlayer("alice")));
  assert(repo.UpsertPlayer(*second, MakePlayer("bob")));

  first->Commit();

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const phrase::util::Conflict&) {
    conflicted = true;
  }
  assert(conflicted);
  assert(!second->IsCommitted());
}

void TestReadOnlyTransactionNeverConflicts() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  auto writer = repo.Begin();

  assert(repo.UpsertPlayer(*writer, MakePlayer("alice")));
  writer->Commit();

  (void)repo.GetPlayer(*reader, "missing");
  reader->Commit();
  assert(reader->IsCommitted());
}

void TestDuplicateHistoryRowsReportAlreadyExists() {
  MemoryRepository repo;
  const auto       player = MakePlayer("alice");
  const auto       phrase = MakeGlobalPhrase(10);

  auto tx = repo.Begin();
  assert(repo.UpsertPlayer(*tx, player));
  assert(repo.InsertPhrase(*tx, phrase));

  phrase::db::model::SkipRecord skip{.player_id = player.id, .phrase_id = phrase.id, .skipped_at_ms = 5};
  assert(repo.InsertSkip(*tx, skip));
  assert(repo.InsertSkip(*tx, skip).code == phrase::db::ErrorCode::AlreadyExists);

  phrase::db::model::CompletionRecord completion{.player_id = player.id, .phrase_id = phrase.id, .score = 10};
  assert(repo.InsertCompletion(*tx, completion));
  assert(repo.InsertCompletion(*tx, completion).code == phrase::db::ErrorCode::AlreadyExists);

  // History rows need an existing phrase.
  phrase::db::model::SkipRecord dangling{.player_id = player.id, .phrase_id = phrase::util::NewId(), .skipped_at_ms = 5};
  assert(repo.InsertSkip(*tx, dangling).code == phrase::db::ErrorCode::ConstraintViolation);

  tx->Commit();
}

} // namespace

int main() {
  TestWritesInvisibleUntilCommit();
  TestDestructorRollsBack();
  TestConcurrentWriterLosesWithConflict();
  TestReadOnlyTransactionNeverConflicts();
  TestDuplicateHistoryRowsReportAlreadyExists();

  std::cout << "phrase_manager_unit_memory_transaction: pass\n";
  return 0;
}
