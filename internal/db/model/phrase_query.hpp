#pragma once

#include <cstdint>
#include <optional>

namespace phrase::db::model {

// Admin listing filter over global phrases.
struct GlobalPhraseFilter {
  int32_t min_difficulty = 1;
  int32_t max_difficulty = 100;

  // nullopt matches both approved and pending phrases.
  std::optional<bool> approved = true;
};

struct PhraseStats {
  uint64_t total_phrases    = 0;
  uint64_t global_phrases   = 0;
  uint64_t targeted_phrases = 0;
  double   avg_usage        = 0.0;
  uint64_t max_usage        = 0;
};

} // namespace phrase::db::model
