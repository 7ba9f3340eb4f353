#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace phrase::notify {

// Emitted once per target, plus once with no target for a global publish.
struct PhraseAvailableEvent {
  std::string                phrase_id;
  std::optional<std::string> target_player_id;
  std::string                sender_name;
  uint64_t                   created_at_ms = 0;
};

struct PhraseCompletedEvent {
  std::string phrase_id;
  std::string player_id;
  std::string player_name;
  int32_t     score      = 0;
  uint32_t    hints_used = 0;
};

/*
  Outbound hook for push delivery. Called only after the write commits.
  Implementations may throw; callers log and continue.
*/
class PhraseNotifier {
 public:
  virtual ~PhraseNotifier() = default;

  virtual void PhraseAvailable(const PhraseAvailableEvent& event) = 0;
  virtual void PhraseCompleted(const PhraseCompletedEvent& event) = 0;
};

class LoggingNotifier final : public PhraseNotifier {
 public:
  void PhraseAvailable(const PhraseAvailableEvent& event) override;
  void PhraseCompleted(const PhraseCompletedEvent& event) override;
};

// Keeps every event in memory.
class RecordingNotifier final : public PhraseNotifier {
 public:
  void PhraseAvailable(const PhraseAvailableEvent& event) override;
  void PhraseCompleted(const PhraseCompletedEvent& event) override;

  std::vector<PhraseAvailableEvent> Available() const;
  std::vector<PhraseCompletedEvent> Completed() const;

 private:
  mutable std::mutex                mutex_;
  std::vector<PhraseAvailableEvent> available_;
  std::vector<PhraseCompletedEvent> completed_;
};

} // namespace phrase::notify
