#include "internal/core/hint_tracker.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/completion_tracker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using phrase::core::CompletionTracker;
using phrase::core::HintContent;
using phrase::core::HintTracker;
using phrase::db::memory::MemoryRepository;

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  HintTracker                       hints{repository};

  std::string player_id;
  std::string phrase_id;

  explicit Fixture(const std::string& content = "hello big world", const std::string& hint = "a greeting", int32_t difficulty = 40) {
    phrase::db::model::PlayerRecord player;
    player.id   = phrase::util::NewId();
    player.name = "bob";

    phrase::db::model::PhraseRecord phrase;
    phrase.id               = phrase::util::NewId();
    phrase.content          = content;
    phrase.hint             = hint;
    phrase.difficulty_score = difficulty;
    phrase.is_global        = true;
    phrase.is_approved      = true;
    phrase.created_at_ms    = 1000;

    auto tx = repository->Begin();
    assert(repository->UpsertPlayer(*tx, player));
    repository->CreatePhraseWithTargets(*tx, phrase, {}, 1);
    tx->Commit();

    player_id = player.id;
    phrase_id = phrase.id;
  }

  size_t Recorded() {
    auto tx = repository->Begin();
    return repository->ListHintUsage(*tx, player_id, phrase_id).size();
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

void TestHintContentPerLevel() {
  assert(HintContent("hello big world", "a greeting", 1) == "This phrase has 3 words");
  assert(HintContent("single", "", 1) == "This phrase has 1 word");
  assert(HintContent("hello big world", "a greeting", 2) == "a greeting");
  assert(HintContent("hello big world", "a greeting", 3) == "First letters: H B W");
  assert(HintContent("ärlig över", "", 3) == "First letters: Ä Ö");
  assert(Throws<phrase::util::InvalidArgument>([] { HintContent("hello world", "", 0); }));
  assert(Throws<phrase::util::InvalidArgument>([] { HintContent("hello world", "", 4); }));
}

void TestLevelsMustBeUsedInOrder() {
  Fixture f;

  assert(Throws<phrase::util::FailedPrecondition>([&] { f.hints.UseHint(f.player_id, f.phrase_id, 2); }));
  assert(Throws<phrase::util::FailedPrecondition>([&] { f.hints.UseHint(f.player_id, f.phrase_id, 3); }));
  assert(f.Recorded() == 0);

  auto reveal = f.hints.UseHint(f.player_id, f.phrase_id, 1);
  assert(!reveal.no_op);
  assert(reveal.content == "This phrase has 3 words");
  assert(reveal.status.max_level == 1);
  assert(reveal.status.next_level == 2);
  assert(reveal.status.hints_remaining == 2);
  assert(reveal.status.current_score == 36);
  assert(reveal.status.next_hint_score == 28);

  assert(Throws<phrase::util::FailedPrecondition>([&] { f.hints.UseHint(f.player_id, f.phrase_id, 3); }));

  reveal = f.hints.UseHint(f.player_id, f.phrase_id, 2);
  assert(reveal.content == "a greeting");
  reveal = f.hints.UseHint(f.player_id, f.phrase_id, 3);
  assert(reveal.content == "First letters: H B W");
  assert(reveal.status.current_score == 20);
  assert(reveal.status.next_level == 0);
  assert(reveal.status.next_hint_score == 0);
  assert(!reveal.status.CanUseNextHint());
  assert(f.Recorded() == 3);
}

void TestRepeatedLevelIsNoOp() {
  Fixture f;

  assert(!f.hints.UseHint(f.player_id, f.phrase_id, 1).no_op);
  const auto again = f.hints.UseHint(f.player_id, f.phrase_id, 1);
  assert(again.no_op);
  assert(again.content == "This phrase has 3 words");
  assert(f.Recorded() == 1);

  // Re-reading an earlier level does not lower the recorded level.
  f.hints.UseHint(f.player_id, f.phrase_id, 2);
  const auto earlier = f.hints.UseHint(f.player_id, f.phrase_id, 1);
  assert(earlier.no_op);
  assert(earlier.status.max_level == 2);
}

void TestStatusWithoutHints() {
  Fixture f;

  const auto status = f.hints.Status(f.player_id, f.phrase_id);
  assert(status.used.empty());
  assert(status.max_level == 0);
  assert(status.next_level == 1);
  assert(status.hints_remaining == 3);
  assert(status.current_score == 40);
  assert(status.next_hint_score == 36);
  assert(status.score_preview.no_hints() == 40);
  assert(status.score_preview.level3() == 20);
  assert(status.CanUseNextHint());
}

void TestCompletedPhraseRefusesHints() {
  Fixture           f;
  CompletionTracker tracker(f.repository, nullptr);

  f.hints.UseHint(f.player_id, f.phrase_id, 1);
  assert(tracker.Complete({.player_id = f.player_id, .phrase_id = f.phrase_id}).score == 36);

  assert(Throws<phrase::util::FailedPrecondition>([&] { f.hints.UseHint(f.player_id, f.phrase_id, 2); }));
  assert(Throws<phrase::util::FailedPrecondition>([&] { f.hints.UseHint(f.player_id, f.phrase_id, 1); }));

  // Status stays readable after completion.
  assert(f.hints.Status(f.player_id, f.phrase_id).max_level == 1);
}

void TestRejectsUnknownAndMalformed() {
  Fixture f;

  assert(Throws<phrase::util::InvalidArgument>([&] { f.hints.UseHint(f.player_id, f.phrase_id, 0); }));
  assert(Throws<phrase::util::InvalidArgument>([&] { f.hints.UseHint(f.player_id, f.phrase_id, 4); }));
  assert(Throws<phrase::util::InvalidArgument>([&] { f.hints.UseHint("bob", f.phrase_id, 1); }));
  assert(Throws<phrase::util::NotFound>([&] { f.hints.UseHint(f.player_id, phrase::util::NewId(), 1); }));
  assert(Throws<phrase::util::NotFound>([&] { f.hints.UseHint(phrase::util::NewId(), f.phrase_id, 1); }));
  assert(Throws<phrase::util::NotFound>([&] { f.hints.Status(f.player_id, phrase::util::NewId()); }));
  assert(f.Recorded() == 0);
}

void TestConcurrentSameLevelRecordedOnce() {
  Fixture f;

  constexpr int            kThreads = 8;
  std::atomic<int>         written{0};
  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      try {
        if (!f.hints.UseHint(f.player_id, f.phrase_id, 1).no_op) written++;
      } catch (const std::exception&) {
        failures++;
      }
    });
  }
  for (auto& t : threads)
    t.join();

  assert(failures.load() == 0);
  assert(written.load() == 1);
  assert(f.Recorded() == 1);
}

} // namespace

int main() {
  TestHintContentPerLevel();
  TestLevelsMustBeUsedInOrder();
  TestRepeatedLevelIsNoOp();
  TestStatusWithoutHints();
  TestCompletedPhraseRefusesHints();
  TestRejectsUnknownAndMalformed();
  TestConcurrentSameLevelRecordedOnce();

  std::cout << "phrase_manager_unit_hint_tracker: pass\n";
  return 0;
}
