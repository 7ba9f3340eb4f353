#include "internal/core/completion_tracker.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/hint_tracker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using phrase::core::CompletionInput;
using phrase::core::CompletionTracker;
using phrase::db::memory::MemoryRepository;
using phrase::notify::RecordingNotifier;

struct Fixture {
  std::shared_ptr<MemoryRepository>  repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<RecordingNotifier> notifier   = std::make_shared<RecordingNotifier>();
  CompletionTracker                  tracker{repository, notifier};

  std::string player_id;
  std::string phrase_id;

  explicit Fixture(int32_t difficulty = 40, bool targeted = false) {
    phrase::db::model::PlayerRecord player;
    player.id   = phrase::util::NewId();
    player.name = "bob";

    phrase::db::model::PhraseRecord phrase;
    phrase.id               = phrase::util::NewId();
    phrase.content          = "hello world";
    phrase.difficulty_score = difficulty;
    phrase.is_global        = !targeted;
    phrase.is_approved      = true;
    phrase.created_at_ms    = 1000;

    auto tx = repository->Begin();
    assert(repository->UpsertPlayer(*tx, player));
    const std::vector<std::string> targets = targeted ? std::vector<std::string>{player.id} : std::vector<std::string>{};
    repository->CreatePhraseWithTargets(*tx, phrase, targets, 1);
    tx->Commit();

    player_id = player.id;
    phrase_id = phrase.id;
  }

  uint64_t UsageCount() {
    auto tx = repository->Begin();
    return repository->GetPhrase(*tx, phrase_id)->usage_count;
  }

  bool HasSkip() {
    auto tx = repository->Begin();
    return repository->HasSkip(*tx, player_id, phrase_id);
  }
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestScoreDerivedFromHints() {
  Fixture f(40);

  phrase::core::HintTracker hints(f.repository);
  hints.UseHint(f.player_id, f.phrase_id, 1);

  const auto outcome = f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id});
  assert(!outcome.no_op);
  assert(outcome.score == 36);
  assert(outcome.hints_used == 1);
  assert(f.notifier->Completed()[0].hints_used == 1);

  auto tx     = f.repository->Begin();
  auto stored = f.repository->HasCompletion(*tx, f.player_id, f.phrase_id);
  assert(stored);
}

void TestExplicitScoreIsKept() {
  Fixture f(40);

  phrase::core::HintTracker hints(f.repository);
  for (uint32_t level = 1; level <= 3; ++level)
    hints.UseHint(f.player_id, f.phrase_id, level);

  const auto outcome = f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id, .score = 77});
  assert(outcome.score == 77);
  assert(outcome.hints_used == 3);
}

void TestDuplicateCompletionIsNoOp() {
  Fixture f;

  assert(!f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id}).no_op);

  const auto again = f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id, .score = 99});
  assert(again.no_op);
  assert(again.score == 0);

  assert(f.UsageCount() == 1);
  assert(f.notifier->Completed().size() == 1);
  assert(f.notifier->Completed()[0].player_name == "bob");
}

void TestConcurrentDuplicateCompletions() {
  Fixture f;

  constexpr int            kThreads = 8;
  std::atomic<int>         recorded{0};
  std::atomic<int>         no_ops{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      const auto outcome = f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id});
      if (outcome.no_op) {
        no_ops++;
      } else {
        recorded++;
      }
    });
  }
  for (auto& t : threads)
    t.join();

  assert(recorded.load() == 1);
  assert(no_ops.load() == kThreads - 1);
  assert(f.UsageCount() == 1);
}

void TestConcurrentDuplicateSkips() {
  Fixture f;

  constexpr int            kThreads = 8;
  std::atomic<int>         recorded{0};
  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      try {
        if (!f.tracker.Skip(f.player_id, f.phrase_id).no_op) recorded++;
      } catch (const std::exception&) {
        failures++;
      }
    });
  }
  for (auto& t : threads)
    t.join();

  assert(failures.load() == 0);
  assert(recorded.load() == 1);
  assert(f.UsageCount() == 1);
  assert(f.HasSkip());
}

void TestSkipThenComplete() {
  Fixture f;

  assert(!f.tracker.Skip(f.player_id, f.phrase_id).no_op);
  assert(f.tracker.Skip(f.player_id, f.phrase_id).no_op);
  assert(f.UsageCount() == 1);

  assert(!f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id}).no_op);
  assert(f.UsageCount() == 2);
}

void TestSkipAfterCompletionIsNoOp() {
  Fixture f;

  assert(!f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id}).no_op);
  assert(f.tracker.Skip(f.player_id, f.phrase_id).no_op);
  assert(!f.HasSkip());
  assert(f.UsageCount() == 1);
}

void TestHistoryDeliversTargetedAssignment() {
  Fixture skipped(40, true);
  assert(!skipped.tracker.Skip(skipped.player_id, skipped.phrase_id).no_op);
  {
    auto tx         = skipped.repository->Begin();
    auto assignment = skipped.repository->GetAssignment(*tx, skipped.phrase_id, skipped.player_id);
    assert(assignment && assignment->is_delivered);
  }

  Fixture completed(40, true);
  assert(!completed.tracker.Complete({.player_id = completed.player_id, .phrase_id = completed.phrase_id}).no_op);
  {
    auto tx         = completed.repository->Begin();
    auto assignment = completed.repository->GetAssignment(*tx, completed.phrase_id, completed.player_id);
    assert(assignment && assignment->is_delivered);
  }
}

void TestRejectsUnknownAndMalformed() {
  Fixture f;

  assert(Throws<phrase::util::NotFound>([&] { f.tracker.Complete({.player_id = f.player_id, .phrase_id = phrase::util::NewId()}); }));
  assert(Throws<phrase::util::NotFound>([&] { f.tracker.Complete({.player_id = phrase::util::NewId(), .phrase_id = f.phrase_id}); }));
  assert(Throws<phrase::util::NotFound>([&] { f.tracker.Skip(f.player_id, phrase::util::NewId()); }));
  assert(Throws<phrase::util::InvalidArgument>([&] { f.tracker.Complete({.player_id = "bob", .phrase_id = f.phrase_id}); }));
  assert(Throws<phrase::util::InvalidArgument>([&] { f.tracker.Skip(f.player_id, ""); }));
  assert(Throws<phrase::util::InvalidArgument>([&] {
    f.tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id, .score = -5});
  }));

  assert(f.UsageCount() == 0);
  assert(f.notifier->Completed().empty());
}

} // namespace

int main() {
  TestScoreDerivedFromHints();
  TestExplicitScoreIsKept();
  TestDuplicateCompletionIsNoOp();
  TestConcurrentDuplicateCompletions();
  TestConcurrentDuplicateSkips();
  TestSkipThenComplete();
  TestSkipAfterCompletionIsNoOp();
  TestHistoryDeliversTargetedAssignment();
  TestRejectsUnknownAndMalformed();

  std::cout << "phrase_manager_unit_completion_tracker: pass\n";
  return 0;
}
