#pragma once

#include <cstdint>
#include <string>

namespace phrase::db::model {

constexpr uint32_t kMaxHintLevel = 3;

// One revealed hint level for a (player, phrase) pair.
struct HintUsageRecord {
  std::string player_id;
  std::string phrase_id;
  uint32_t    hint_level = 0;
  uint64_t    used_at_ms = 0;
};

} // namespace phrase::db::model
