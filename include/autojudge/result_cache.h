#ifndef INCLUDE_AUTOJUDGE_RESULT_CACHE_H_
#define INCLUDE_AUTOJUDGE_RESULT_CACHE_H_

#include <mutex>
#include <optional>
#include <unordered_map>

#include "submission.h"

// Outcomes waiting to be picked up by the flow that created the submission.
// Entries that are never popped stay until process exit.
class ResultCache {
  mutable std::mutex mtx_;
  std::unordered_map<long, EvaluationOutcome> results_;
 public:
  void Put(long submission_id, const EvaluationOutcome&);
  std::optional<EvaluationOutcome> Pop(long submission_id);
  size_t Size() const;
};

#endif  // INCLUDE_AUTOJUDGE_RESULT_CACHE_H_
