#pragma once

#include <cstdint>
#include <string>

namespace phrase::db::model {

// Targeting edge from a phrase to one player. Unique per (phrase_id, target_player_id).
struct AssignmentRecord {
  std::string phrase_id;
  std::string target_player_id;

  // Lower is delivered sooner.
  int32_t  priority       = 1;
  uint64_t assigned_at_ms = 0;

  bool     is_delivered    = false;
  uint64_t delivered_at_ms = 0;
};

} // namespace phrase::db::model
