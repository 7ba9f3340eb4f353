#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "phrase/manager/v1.hpp"

using namespace phrase::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  phrasectl <addr> create <sender_id|-> <content> [--hint <text>] [--target <player_id>]... [--global]\n"
            << "                   [--lang en|sv] [--type custom|global|community|challenge] [--contributor <name>]\n"
            << "  phrasectl <addr> next <player_id> [max_results] [max_difficulty]\n"
            << "  phrasectl <addr> complete <player_id> <phrase_id> [score] [time_ms]\n"
            << "  phrasectl <addr> skip <player_id> <phrase_id>\n"
            << "  phrasectl <addr> hint <player_id> <phrase_id> <1|2|3>\n"
            << "  phrasectl <addr> hint-status <player_id> <phrase_id>\n"
            << "  phrasectl <addr> approve <phrase_id> [true|false]\n"
            << "  phrasectl <addr> list-global [limit] [offset] [approved|pending|any]\n"
            << "  phrasectl <addr> stats\n"
            << "  phrasectl <addr> analyze <content> [en|sv]\n"
            << "  phrasectl <addr> sync-player <player_id> <name> [skill_level] [max_difficulty]\n";
}

static std::optional<Language> ParseLanguage(const std::string& value) {
  if (value == "en") return LANGUAGE_ENGLISH;
  if (value == "sv") return LANGUAGE_SWEDISH;
  return std::nullopt;
}

static std::optional<PhraseType> ParsePhraseType(const std::string& value) {
  if (value == "custom") return PHRASE_TYPE_CUSTOM;
  if (value == "global") return PHRASE_TYPE_GLOBAL;
  if (value == "community") return PHRASE_TYPE_COMMUNITY;
  if (value == "challenge") return PHRASE_TYPE_CHALLENGE;
  return std::nullopt;
}

static std::optional<ApprovalFilter> ParseApproval(const std::string& value) {
  if (value == "approved") return APPROVAL_FILTER_APPROVED;
  if (value == "pending") return APPROVAL_FILTER_PENDING;
  if (value == "any") return APPROVAL_FILTER_ANY;
  return std::nullopt;
}

static const char* TierName(SelectionTier tier) {
  switch (tier) {
    case SELECTION_TIER_TARGETED:
      return "targeted";
    case SELECTION_TIER_GLOBAL:
      return "global";
    case SELECTION_TIER_SKIP_FALLBACK:
      return "skip_fallback";
    default:
      return "none";
  }
}

static void PrintPhrase(const Phrase& p) {
  std::cout << "id=" << p.id().value() << " difficulty=" << p.difficulty_score() << " global=" << (p.is_global() ? "true" : "false")
            << " approved=" << (p.is_approved() ? "true" : "false") << " usage=" << p.usage_count() << " sender=\"" << p.sender_name()
            << "\" content=\"" << p.content() << "\"";
  if (!p.hint().empty()) std::cout << " hint=\"" << p.hint() << "\"";
  std::cout << "\n";
}

static void PrintHintProgress(const HintProgress& progress) {
  std::cout << "hints_used=" << progress.hints_used_size() << " remaining=" << progress.hints_remaining()
            << " score=" << progress.current_score();
  if (progress.can_use_next_hint()) {
    std::cout << " next_level=" << progress.next_hint_level() << " next_score=" << progress.next_hint_score();
  }
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto phrase_stub = PhraseService::NewStub(channel);
  auto admin_stub  = PhraseAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      CreatePhraseRequest req;
      if (std::string(argv[3]) != "-") req.mutable_sender_id()->set_value(argv[3]);
      req.set_content(argv[4]);
      req.set_language(LANGUAGE_ENGLISH);

      for (int i = 5; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--global") {
          req.set_is_global(true);
          continue;
        }
        if (i + 1 >= argc) {
          std::cerr << "missing value for " << flag << "\n";
          return 1;
        }
        const std::string value = argv[++i];
        if (flag == "--hint") {
          req.set_hint(value);
        } else if (flag == "--target") {
          req.add_target_ids()->set_value(value);
        } else if (flag == "--contributor") {
          req.set_contributor_name(value);
        } else if (flag == "--lang") {
          auto language = ParseLanguage(value);
          if (!language) {
            std::cerr << "unsupported language: " << value << "\n";
            return 1;
          }
          req.set_language(*language);
        } else if (flag == "--type") {
          auto type = ParsePhraseType(value);
          if (!type) {
            std::cerr << "unsupported phrase type: " << value << "\n";
            return 1;
          }
          req.set_phrase_type(*type);
        } else {
          std::cerr << "unknown flag: " << flag << "\n";
          return 1;
        }
      }

      CreatePhraseResponse resp;
      auto                 status = phrase_stub->CreatePhrase(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintPhrase(resp.phrase());
      std::cout << "targets=" << resp.target_count() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "next") {
      if (argc < 4) return 1;

      GetNextPhraseRequest req;
      req.mutable_player_id()->set_value(argv[3]);
      if (argc >= 5) req.set_max_results(static_cast<uint32_t>(std::stoul(argv[4])));
      if (argc >= 6) req.set_max_difficulty(std::stoi(argv[5]));

      GetNextPhraseResponse resp;
      auto                  status = phrase_stub->GetNextPhrase(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      if (!resp.available()) {
        std::cout << "available=false\n";
        return 0;
      }

      std::cout << "tier=" << TierName(resp.tier()) << " count=" << resp.phrases_size() << "\n";
      for (const auto& selected : resp.phrases()) {
        PrintPhrase(selected.phrase());
        const auto& preview = selected.score_preview();
        std::cout << "  points=" << preview.no_hints() << "/" << preview.level1() << "/" << preview.level2() << "/" << preview.level3() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "complete") {
      if (argc < 5) return 1;

      CompletePhraseRequest req;
      req.mutable_player_id()->set_value(argv[3]);
      req.mutable_phrase_id()->set_value(argv[4]);
      if (argc >= 6) req.set_score(std::stoi(argv[5]));
      if (argc >= 7) req.set_completion_time_ms(std::stoull(argv[6]));

      CompletePhraseResponse resp;
      auto                   status = phrase_stub->CompletePhrase(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      if (resp.no_op()) {
        std::cout << "already completed\n";
      } else {
        std::cout << "completed score=" << resp.score() << " hints_used=" << resp.hints_used() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "skip") {
      if (argc < 5) return 1;

      SkipPhraseRequest req;
      req.mutable_player_id()->set_value(argv[3]);
      req.mutable_phrase_id()->set_value(argv[4]);

      SkipPhraseResponse resp;
      auto               status = phrase_stub->SkipPhrase(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.no_op() ? "already recorded" : "skipped") << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "hint") {
      if (argc < 6) return 1;

      UseHintRequest req;
      req.mutable_player_id()->set_value(argv[3]);
      req.mutable_phrase_id()->set_value(argv[4]);
      req.set_level(static_cast<uint32_t>(std::stoul(argv[5])));

      UseHintResponse resp;
      auto            status = phrase_stub->UseHint(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "level=" << resp.level() << (resp.no_op() ? " (already used)" : "") << "\n"
                << "  " << resp.hint_content() << "\n";
      PrintHintProgress(resp.status());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "hint-status") {
      if (argc < 5) return 1;

      GetHintStatusRequest req;
      req.mutable_player_id()->set_value(argv[3]);
      req.mutable_phrase_id()->set_value(argv[4]);

      GetHintStatusResponse resp;
      auto                  status = phrase_stub->GetHintStatus(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintHintProgress(resp.status());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "approve") {
      if (argc < 4) return 1;

      ApprovePhraseRequest req;
      req.mutable_id()->set_value(argv[3]);
      req.set_approved(argc < 5 || std::string(argv[4]) != "false");

      ApprovePhraseResponse resp;
      auto                  status = admin_stub->ApprovePhrase(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintPhrase(resp.phrase());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list-global") {
      ListGlobalPhrasesRequest req;
      if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));
      if (argc >= 5) req.set_offset(static_cast<uint32_t>(std::stoul(argv[4])));
      if (argc >= 6) {
        auto approval = ParseApproval(argv[5]);
        if (!approval) {
          std::cerr << "unsupported approval filter: " << argv[5] << "\n";
          return 1;
        }
        req.set_approval(*approval);
      }

      ListGlobalPhrasesResponse resp;
      auto                      status = admin_stub->ListGlobalPhrases(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& p : resp.phrases())
        PrintPhrase(p);
      std::cout << "total=" << resp.total_count() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      GetPhraseStatsRequest  req;
      GetPhraseStatsResponse resp;

      auto status = admin_stub->GetPhraseStats(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "total=" << resp.total_phrases() << " global=" << resp.global_phrases() << " targeted=" << resp.targeted_phrases()
                << " avg_usage=" << resp.avg_usage() << " max_usage=" << resp.max_usage() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "analyze") {
      if (argc < 4) return 1;

      AnalyzeDifficultyRequest req;
      req.set_content(argv[3]);
      req.set_language(LANGUAGE_ENGLISH);
      if (argc >= 5) {
        auto language = ParseLanguage(argv[4]);
        if (!language) {
          std::cerr << "unsupported language: " << argv[4] << "\n";
          return 1;
        }
        req.set_language(*language);
      }

      AnalyzeDifficultyResponse resp;
      auto                      status = admin_stub->AnalyzeDifficulty(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& preview = resp.score_preview();
      std::cout << "score=" << resp.score() << " label=" << DifficultyLabel_Name(resp.label()) << " points=" << preview.no_hints() << "/"
                << preview.level1() << "/" << preview.level2() << "/" << preview.level3() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "sync-player") {
      if (argc < 5) return 1;

      SyncPlayerRequest req;
      req.mutable_id()->set_value(argv[3]);
      req.set_name(argv[4]);
      req.set_skill_level(argc >= 6 ? std::stoi(argv[5]) : 1);
      if (argc >= 7) req.set_max_difficulty(std::stoi(argv[6]));

      SyncPlayerResponse resp;
      auto               status = admin_stub->SyncPlayer(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "synced\n";
      return 0;
    }
  } catch (const std::logic_error& e) {
    // std::stoi and friends on malformed numbers
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
