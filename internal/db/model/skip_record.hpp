#pragma once

#include <cstdint>
#include <string>

namespace phrase::db::model {

struct SkipRecord {
  std::string player_id;
  std::string phrase_id;
  uint64_t    skipped_at_ms = 0;
};

} // namespace phrase::db::model
