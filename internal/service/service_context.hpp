#pragma once

#include <memory>

namespace phrase::core { class AssignmentEngine; class CompletionTracker; class HintTracker; }
namespace phrase::scoring { class DifficultyScorer; }
namespace phrase::db { class Repository; }

namespace phrase::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<phrase::db::Repository> repository;
  std::shared_ptr<phrase::core::AssignmentEngine> engine;
  std::shared_ptr<phrase::core::CompletionTracker> tracker;
  std::shared_ptr<phrase::core::HintTracker> hints;
  std::shared_ptr<phrase::scoring::DifficultyScorer> scorer;
};

}
