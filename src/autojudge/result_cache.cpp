#include <autojudge/result_cache.h>

void ResultCache::Put(long submission_id, const EvaluationOutcome& outcome) {
  std::lock_guard lck(mtx_);
  results_.insert_or_assign(submission_id, outcome);
}

std::optional<EvaluationOutcome> ResultCache::Pop(long submission_id) {
  std::lock_guard lck(mtx_);
  auto it = results_.find(submission_id);
  if (it == results_.end()) return std::nullopt;
  EvaluationOutcome ret = std::move(it->second);
  results_.erase(it);
  return ret;
}

size_t ResultCache::Size() const {
  std::lock_guard lck(mtx_);
  return results_.size();
}
