#pragma once

#include <cstdint>
#include <string>

namespace phrase::db::model {

// Mirror of the external player registry. The core only reads it.
struct PlayerRecord {
  std::string id;
  std::string name;
  int32_t     skill_level    = 1;
  int32_t     max_difficulty = 0;
  uint64_t    updated_at_ms  = 0;
};

} // namespace phrase::db::model
