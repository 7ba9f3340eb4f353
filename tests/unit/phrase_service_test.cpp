#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/scoring/difficulty_scorer.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/phrase_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "phrase/manager/v1.hpp"

namespace {

using namespace phrase::manager::v1;

struct Harness {
  std::shared_ptr<phrase::notify::RecordingNotifier> notifier = std::make_shared<phrase::notify::RecordingNotifier>();
  phrase::service::ServiceContext                    ctx;
  std::shared_ptr<phrase::service::PhraseService>    phrases;
  std::shared_ptr<phrase::service::AdminService>     admin;

  Harness() {
    phrase::runtime::config::RuntimeConfig config;
    config.mutable_selection()->set_default_batch_size(5);

    ctx     = phrase::factory::BuildServiceContext(config, std::make_shared<phrase::db::memory::MemoryRepository>(), notifier);
    phrases = std::make_shared<phrase::service::PhraseService>(ctx);
    admin   = std::make_shared<phrase::service::AdminService>(ctx);
  }

  std::string Sync(const std::string& name, int32_t max_difficulty = 0) {
    SyncPlayerRequest req;
    req.mutable_id()->set_value(phrase::util::NewId());
    req.set_name(name);
    req.set_skill_level(1);
    req.set_max_difficulty(max_difficulty);
    admin->SyncPlayer(req);
    return req.id().value();
  }

  Phrase Create(const std::string& sender, const std::string& content, bool global, const std::string& target = {}) {
    CreatePhraseRequest req;
    req.set_content(content);
    req.set_language(LANGUAGE_ENGLISH);
    req.mutable_sender_id()->set_value(sender);
    req.set_is_global(global);
    if (!target.empty()) req.add_target_ids()->set_value(target);
    return phrases->CreatePhrase(req).phrase();
  }

  GetNextPhraseResponse Next(const std::string& player, uint32_t max_results = 0) {
    GetNextPhraseRequest req;
    req.mutable_player_id()->set_value(player);
    req.set_max_results(max_results);
    return phrases->GetNextPhrase(req);
  }

  UseHintResponse Hint(const std::string& player, const Phrase& phrase, uint32_t level) {
    UseHintRequest req;
    req.mutable_player_id()->set_value(player);
    *req.mutable_phrase_id() = phrase.id();
    req.set_level(level);
    return phrases->UseHint(req);
  }

  HintProgress HintStatus(const std::string& player, const Phrase& phrase) {
    GetHintStatusRequest req;
    req.mutable_player_id()->set_value(player);
    *req.mutable_phrase_id() = phrase.id();
    return phrases->GetHintStatus(req).status();
  }

  CompletePhraseResponse Complete(const std::string& player, const Phrase& phrase) {
    CompletePhraseRequest req;
    req.mutable_player_id()->set_value(player);
    *req.mutable_phrase_id() = phrase.id();
    return phrases->CompletePhrase(req);
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

void TestCreateReturnsStoredPhrase() {
  Harness    h;
  const auto alice = h.Sync("alice");
  const auto bob   = h.Sync("bob");

  CreatePhraseRequest req;
  req.set_content("hello world");
  req.set_hint("a greeting");
  req.set_language(LANGUAGE_ENGLISH);
  req.mutable_sender_id()->set_value(alice);
  req.add_target_ids()->set_value(bob);

  const auto resp = h.phrases->CreatePhrase(req);
  assert(resp.target_count() == 1);
  assert(phrase::util::IsUuidString(resp.phrase().id().value()));
  assert(resp.phrase().content() == "hello world");
  assert(resp.phrase().hint() == "a greeting");
  assert(resp.phrase().sender_name() == "alice");
  assert(resp.phrase().created_by().value() == alice);
  assert(resp.phrase().difficulty_score() >= 1 && resp.phrase().difficulty_score() <= 100);
  assert(resp.phrase().created_at().seconds() > 0);
  assert(h.notifier->Available().size() == 1);
}

void TestNextCarriesTierAndScorePreview() {
  Harness    h;
  const auto alice = h.Sync("alice");
  const auto bob   = h.Sync("bob");

  const auto created = h.Create(alice, "hello world", false, bob);

  const auto resp = h.Next(bob);
  assert(resp.available());
  assert(resp.tier() == SELECTION_TIER_TARGETED);
  assert(resp.phrases_size() == 1);

  const auto& selected = resp.phrases(0);
  assert(selected.phrase().id().value() == created.id().value());
  assert(selected.score_preview().no_hints() == created.difficulty_score());
  assert(selected.score_preview().level3() <= selected.score_preview().level1());

  const auto empty = h.Next(bob);
  assert(!empty.available());
  assert(empty.phrases_size() == 0);
}

void TestConfiguredBatchSizeApplies() {
  Harness    h;
  const auto author = h.Sync("author");
  const auto bob    = h.Sync("bob");

  for (const char* content : {"one a", "two b", "three c", "four d", "five e", "sea f", "seven g"})
    h.Create(author, content, true);

  const auto resp = h.Next(bob);
  assert(resp.tier() == SELECTION_TIER_GLOBAL);
  assert(resp.phrases_size() == 5);
  assert(h.Next(bob, 2).phrases_size() == 2);
}

void TestCompleteAndSkipRoundTrip() {
  Harness    h;
  const auto alice = h.Sync("alice");
  const auto bob   = h.Sync("bob");

  const auto first  = h.Create(alice, "first one", true);
  const auto second = h.Create(alice, "second one", true);

  h.Hint(bob, first, 1);
  h.Hint(bob, first, 2);

  auto done = h.Complete(bob, first);
  assert(!done.no_op());
  assert(done.hints_used() == 2);
  assert(done.score() == phrase::scoring::ScoreForHints(first.difficulty_score(), 2));
  assert(h.Complete(bob, first).no_op());

  SkipPhraseRequest skip;
  skip.mutable_player_id()->set_value(bob);
  *skip.mutable_phrase_id() = second.id();
  assert(!h.phrases->SkipPhrase(skip).no_op());
  assert(h.phrases->SkipPhrase(skip).no_op());

  const auto resp = h.Next(bob);
  assert(resp.tier() == SELECTION_TIER_SKIP_FALLBACK);
  assert(resp.phrases_size() == 1);
  assert(resp.phrases(0).phrase().id().value() == second.id().value());
}

void TestHintsRevealInOrderAndScoreCompletion() {
  Harness    h;
  const auto alice = h.Sync("alice");
  const auto bob   = h.Sync("bob");

  CreatePhraseRequest create;
  create.set_content("hello big world");
  create.set_hint("a greeting");
  create.mutable_sender_id()->set_value(alice);
  create.set_is_global(true);
  const auto phrase     = h.phrases->CreatePhrase(create).phrase();
  const auto difficulty = phrase.difficulty_score();

  auto status = h.HintStatus(bob, phrase);
  assert(status.hints_used_size() == 0);
  assert(status.next_hint_level() == 1);
  assert(status.hints_remaining() == 3);
  assert(status.current_score() == difficulty);
  assert(status.next_hint_score() == phrase::scoring::ScoreForHints(difficulty, 1));
  assert(status.can_use_next_hint());

  assert(Throws<phrase::util::FailedPrecondition>([&] { h.Hint(bob, phrase, 2); }));
  assert(Throws<phrase::util::InvalidArgument>([&] { h.Hint(bob, phrase, 0); }));
  assert(Throws<phrase::util::InvalidArgument>([&] { h.Hint(bob, phrase, 4); }));

  auto reveal = h.Hint(bob, phrase, 1);
  assert(!reveal.no_op());
  assert(reveal.level() == 1);
  assert(reveal.hint_content() == "This phrase has 3 words");
  assert(reveal.status().hints_remaining() == 2);
  assert(reveal.status().current_score() == phrase::scoring::ScoreForHints(difficulty, 1));

  assert(h.Hint(bob, phrase, 1).no_op());
  assert(h.Hint(bob, phrase, 2).hint_content() == "a greeting");
  assert(h.Hint(bob, phrase, 3).hint_content() == "First letters: H B W");

  status = h.HintStatus(bob, phrase);
  assert(status.hints_used_size() == 3);
  assert(status.hints_used(0).level() == 1);
  assert(status.hints_used(2).level() == 3);
  assert(status.hints_used(0).used_at_ms() > 0);
  assert(status.next_hint_level() == 0);
  assert(status.hints_remaining() == 0);
  assert(status.next_hint_score() == 0);
  assert(!status.can_use_next_hint());
  assert(status.score_preview().level3() == status.current_score());

  // Another player's hints are separate.
  assert(h.HintStatus(alice, phrase).next_hint_level() == 1);

  const auto done = h.Complete(bob, phrase);
  assert(done.hints_used() == 3);
  assert(done.score() == phrase::scoring::ScoreForHints(difficulty, 3));
  assert(h.notifier->Completed().back().hints_used == 3);

  assert(Throws<phrase::util::FailedPrecondition>([&] { h.Hint(bob, phrase, 3); }));
  assert(Throws<phrase::util::NotFound>([&] { h.HintStatus(phrase::util::NewId(), phrase); }));
}

void TestConcurrentAdminWritesSurviveLoad() {
  Harness    h;
  const auto author = h.Sync("author");

  std::vector<Phrase> pool;
  for (const char* content : {"one a", "two b", "three c", "four d"})
    pool.push_back(h.Create(author, content, true));

  constexpr int            kRounds = 15;
  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;

  auto guarded = [&](auto&& fn) {
    return [&, fn] {
      for (int i = 0; i < kRounds; ++i) {
        try {
          fn(i);
        } catch (const std::exception&) {
          failures++;
        }
      }
    };
  };

  threads.emplace_back(guarded([&](int i) { h.Sync("player" + std::to_string(i)); }));
  threads.emplace_back(guarded([&](int i) {
    ApprovePhraseRequest req;
    *req.mutable_id() = pool[i % pool.size()].id();
    req.set_approved(i % 2 == 0);
    h.admin->ApprovePhrase(req);
  }));
  threads.emplace_back(guarded([&](int i) { h.Create(author, "made number " + std::to_string(i), true); }));
  threads.emplace_back(guarded([&](int i) {
    SyncPlayerRequest req;
    req.mutable_id()->set_value(author);
    req.set_name("author");
    req.set_max_difficulty(i % 100);
    h.admin->SyncPlayer(req);
  }));
  for (auto& t : threads)
    t.join();

  assert(failures.load() == 0);
  assert(h.admin->GetPhraseStats(GetPhraseStatsRequest{}).total_phrases() == pool.size() + kRounds);
}

void TestApproveAndListGlobal() {
  Harness    h;
  const auto alice = h.Sync("alice");
  const auto bob   = h.Sync("bob");

  const auto kept    = h.Create(alice, "keep me", true);
  const auto revoked = h.Create(alice, "drop me", true);
  h.Create(alice, "for bob", false, bob);

  ApprovePhraseRequest approve;
  *approve.mutable_id() = revoked.id();
  approve.set_approved(false);
  const auto approved = h.admin->ApprovePhrase(approve);
  assert(!approved.phrase().is_approved());
  assert(approved.phrase().sender_name() == "alice");

  ListGlobalPhrasesRequest list;
  auto                     listed = h.admin->ListGlobalPhrases(list);
  assert(listed.total_count() == 1);
  assert(listed.phrases_size() == 1);
  assert(listed.phrases(0).id().value() == kept.id().value());

  list.set_approval(APPROVAL_FILTER_PENDING);
  listed = h.admin->ListGlobalPhrases(list);
  assert(listed.total_count() == 1);
  assert(listed.phrases(0).id().value() == revoked.id().value());

  list.set_approval(APPROVAL_FILTER_ANY);
  list.set_limit(1);
  listed = h.admin->ListGlobalPhrases(list);
  assert(listed.total_count() == 2);
  assert(listed.phrases_size() == 1);

  list.set_offset(5);
  assert(h.admin->ListGlobalPhrases(list).phrases_size() == 0);

  // The revoked phrase left the pool.
  const auto next = h.Next(bob, 10);
  assert(next.tier() == SELECTION_TIER_TARGETED);
  const auto pool = h.Next(bob, 10);
  assert(pool.tier() == SELECTION_TIER_GLOBAL);
  assert(pool.phrases_size() == 1);
  assert(pool.phrases(0).phrase().id().value() == kept.id().value());

  ListGlobalPhrasesRequest inverted;
  inverted.set_min_difficulty(80);
  inverted.set_max_difficulty(20);
  assert(Throws<phrase::util::InvalidArgument>([&] { h.admin->ListGlobalPhrases(inverted); }));

  ApprovePhraseRequest missing;
  missing.mutable_id()->set_value(phrase::util::NewId());
  missing.set_approved(true);
  assert(Throws<phrase::util::NotFound>([&] { h.admin->ApprovePhrase(missing); }));
}

void TestStatsCountUsage() {
  Harness    h;
  const auto alice = h.Sync("alice");
  const auto bob   = h.Sync("bob");

  const auto global = h.Create(alice, "hello world", true);
  h.Create(alice, "for bob", false, bob);

  CompletePhraseRequest complete;
  complete.mutable_player_id()->set_value(bob);
  *complete.mutable_phrase_id() = global.id();
  h.phrases->CompletePhrase(complete);

  const auto stats = h.admin->GetPhraseStats(GetPhraseStatsRequest{});
  assert(stats.total_phrases() == 2);
  assert(stats.global_phrases() == 1);
  assert(stats.targeted_phrases() == 1);
  assert(stats.max_usage() == 1);
  assert(stats.avg_usage() == 0.5);
}

void TestAnalyzeDifficultyDoesNotPersist() {
  Harness h;

  AnalyzeDifficultyRequest req;
  req.set_content("aaaa");
  req.set_language(LANGUAGE_ENGLISH);

  const auto resp = h.admin->AnalyzeDifficulty(req);
  assert(resp.score() == 19);
  assert(resp.label() == DIFFICULTY_LABEL_VERY_EASY);
  assert(resp.score_preview().level1() == 17);

  assert(h.admin->GetPhraseStats(GetPhraseStatsRequest{}).total_phrases() == 0);
}

void TestSyncPlayerValidation() {
  Harness h;

  SyncPlayerRequest req;
  req.mutable_id()->set_value(phrase::util::NewId());
  req.set_name("alice");
  req.set_max_difficulty(101);
  assert(Throws<phrase::util::InvalidArgument>([&] { h.admin->SyncPlayer(req); }));

  req.mutable_id()->set_value("alice");
  req.set_max_difficulty(10);
  assert(Throws<phrase::util::InvalidArgument>([&] { h.admin->SyncPlayer(req); }));

  // Upsert keeps the latest profile.
  const auto id = h.Sync("alice", 10);
  SyncPlayerRequest update;
  update.mutable_id()->set_value(id);
  update.set_name("alice2");
  update.set_max_difficulty(90);
  h.admin->SyncPlayer(update);

  auto tx     = h.ctx.repository->Begin();
  auto player = h.ctx.repository->GetPlayer(*tx, id);
  assert(player && player->name == "alice2" && player->max_difficulty == 90);
}

} // namespace

int main() {
  TestCreateReturnsStoredPhrase();
  TestNextCarriesTierAndScorePreview();
  TestConfiguredBatchSizeApplies();
  TestCompleteAndSkipRoundTrip();
  TestHintsRevealInOrderAndScoreCompletion();
  TestConcurrentAdminWritesSurviveLoad();
  TestApproveAndListGlobal();
  TestStatsCountUsage();
  TestAnalyzeDifficultyDoesNotPersist();
  TestSyncPlayerValidation();

  std::cout << "phrase_manager_unit_phrase_service: pass\n";
  return 0;
}
