#ifndef INCLUDE_AUTOJUDGE_EVALUATION_H_
#define INCLUDE_AUTOJUDGE_EVALUATION_H_

#include <mutex>
#include <future>
#include <optional>

#include "directory.h"
#include "result_cache.h"
#include "scorer_registry.h"

class EvaluationCoordinator {
  ContestDirectory& directory_;
  const ScorerRegistry& registry_;
  ResultCache& cache_;
  std::mutex& eval_lock_; // one sandbox run at a time
  UpdateFn update_;
 public:
  EvaluationCoordinator(ContestDirectory& directory, const ScorerRegistry& registry,
                        ResultCache& cache, std::mutex& eval_lock, UpdateFn update) :
      directory_(directory), registry_(registry), cache_(cache),
      eval_lock_(eval_lock), update_(std::move(update)) {}

  // Returns nullopt if the submission is not auto-evaluated (unknown context,
  //   missing artifact or no scorer). Never throws on scorer or persistence failure.
  std::optional<EvaluationOutcome> Evaluate(const Submission&);
  std::future<std::optional<EvaluationOutcome>> EvaluateAsync(Submission);

  // Wrap submission creation so every created submission is evaluated
  //   before the caller regains control
  CreateFn InterceptCreate(CreateFn create);
};

#endif  // INCLUDE_AUTOJUDGE_EVALUATION_H_
