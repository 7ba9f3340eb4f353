#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "phrase/manager/v1.hpp"

namespace phrase::db::model {

/*
  Persistent phrase row.

  IMPORTANT:
  - difficulty_score is written once at creation and never updated.
  - Only is_approved and usage_count change after insert.
*/

struct PhraseRecord {
  std::string id;  // UUID text

  std::string content;
  std::string hint;

  phrase::manager::v1::Language language = phrase::manager::v1::LANGUAGE_ENGLISH;

  int32_t difficulty_score = 1;

  bool is_global   = false;
  bool is_approved = false;

  // Unset for system or external contributions.
  std::optional<std::string> created_by_player_id;
  std::string                contributor_name;

  phrase::manager::v1::PhraseType phrase_type = phrase::manager::v1::PHRASE_TYPE_CUSTOM;

  uint64_t usage_count   = 0;
  uint64_t created_at_ms = 0;
};

} // namespace phrase::db::model
