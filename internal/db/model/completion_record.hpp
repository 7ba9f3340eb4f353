#pragma once

#include <cstdint>
#include <string>

namespace phrase::db::model {

/*
  At most one row per (player_id, phrase_id).
  This is the only source of truth for "has solved".
*/
struct CompletionRecord {
  std::string player_id;
  std::string phrase_id;
  int32_t     score              = 0;
  uint32_t    hints_used         = 0;
  uint64_t    completion_time_ms = 0;
  uint64_t    completed_at_ms    = 0;
};

} // namespace phrase::db::model
