#include "phrase_convert.hpp"

#include "internal/util/time.hpp"

namespace phrase::service {

using namespace phrase::manager::v1;

Phrase ToProto(const db::model::PhraseRecord& record, const std::string& sender_name) {
  Phrase out;
  out.mutable_id()->set_value(record.id);
  out.set_content(record.content);
  out.set_hint(record.hint);
  out.set_language(record.language);
  out.set_difficulty_score(record.difficulty_score);
  out.set_is_global(record.is_global);
  out.set_is_approved(record.is_approved);
  if (record.created_by_player_id) out.mutable_created_by()->set_value(*record.created_by_player_id);
  out.set_sender_name(sender_name);
  out.set_phrase_type(record.phrase_type);
  out.set_usage_count(record.usage_count);
  *out.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return out;
}

HintProgress ToProto(const core::HintStatus& status) {
  HintProgress out;
  for (const auto& used : status.used) {
    auto* hint = out.add_hints_used();
    hint->set_level(used.hint_level);
    hint->set_used_at_ms(used.used_at_ms);
  }
  out.set_next_hint_level(status.next_level);
  out.set_hints_remaining(status.hints_remaining);
  out.set_current_score(status.current_score);
  out.set_next_hint_score(status.next_hint_score);
  *out.mutable_score_preview() = status.score_preview;
  out.set_can_use_next_hint(status.CanUseNextHint());
  return out;
}

} // namespace phrase::service
