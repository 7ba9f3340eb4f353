#include "notifier.hpp"

#include "internal/observability/logging.hpp"

namespace phrase::notify {

using observability::IntField;
using observability::StringField;

void LoggingNotifier::PhraseAvailable(const PhraseAvailableEvent& event) {
  PHRASE_LOG_INFO("phrase available", {StringField("phrase_id", event.phrase_id),
                                       StringField("target_player_id", event.target_player_id.value_or("*")),
                                       StringField("sender_name", event.sender_name),
                                       IntField("created_at_ms", static_cast<int64_t>(event.created_at_ms))});
}

void LoggingNotifier::PhraseCompleted(const PhraseCompletedEvent& event) {
  PHRASE_LOG_INFO("phrase completed", {StringField("phrase_id", event.phrase_id), StringField("player_id", event.player_id),
                                       StringField("player_name", event.player_name), IntField("score", event.score),
                                       IntField("hints_used", event.hints_used)});
}

void RecordingNotifier::PhraseAvailable(const PhraseAvailableEvent& event) {
  std::lock_guard lock(mutex_);
  available_.push_back(event);
}

void RecordingNotifier::PhraseCompleted(const PhraseCompletedEvent& event) {
  std::lock_guard lock(mutex_);
  completed_.push_back(event);
}

std::vector<PhraseAvailableEvent> RecordingNotifier::Available() const {
  std::lock_guard lock(mutex_);
  return available_;
}

std::vector<PhraseCompletedEvent> RecordingNotifier::Completed() const {
  std::lock_guard lock(mutex_);
  return completed_;
}

} // namespace phrase::notify
