#pragma once

#include <algorithm>
#include <chrono>
#include <random>
#include <string_view>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace phrase::db {

// Attempts per write before a write-write conflict is surfaced to the caller.
constexpr int kMaxConflictAttempts = 10;

// Upper bound of the pause after the first lost race; doubles per attempt.
constexpr std::chrono::microseconds kConflictBackoff{50};

/*
  Runs fn until it returns without util::Conflict.

  fn must open its own transaction so every attempt starts from a fresh
  snapshot. Validation and other pure work belong outside fn.
*/
template <typename Fn>
auto RetryOnConflict(std::string_view what, Fn&& fn, int max_attempts = kMaxConflictAttempts) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::Conflict&) {
      if (attempt >= max_attempts) throw;
      PHRASE_LOG_DEBUG("write conflict, retrying", {observability::StringField("operation", what), observability::IntField("attempt", attempt)});

      static thread_local std::minstd_rand rng{std::random_device{}()};
      const auto ceiling = kConflictBackoff.count() << std::min(attempt - 1, 6);
      std::this_thread::sleep_for(std::chrono::microseconds(std::uniform_int_distribution<long long>(0, ceiling)(rng)));
    }
  }
}

} // namespace phrase::db
