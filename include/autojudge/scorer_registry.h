#ifndef INCLUDE_AUTOJUDGE_SCORER_REGISTRY_H_
#define INCLUDE_AUTOJUDGE_SCORER_REGISTRY_H_

#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include <unordered_map>

#include "submission.h"

struct ScoringRequest {
  std::filesystem::path artifact; // absolute
  Submission submission;
  Team team;
  Track track;
};

// nullopt means the scorer has nothing to say about this submission
using Scorer = std::function<std::optional<EvaluationOutcome>(const ScoringRequest&)>;

class ScorerRegistry {
  std::unordered_map<std::string, Scorer> scorers_;
  bool sealed_ = false;
 public:
  // throws std::logic_error after Seal() or on an empty slug
  void Register(const std::string& track_slug, Scorer scorer);
  void Seal() { sealed_ = true; }
  bool Sealed() const { return sealed_; }
  std::optional<Scorer> Resolve(const std::string& track_slug) const;
};

#endif  // INCLUDE_AUTOJUDGE_SCORER_REGISTRY_H_
