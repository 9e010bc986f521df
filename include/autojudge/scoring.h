#ifndef INCLUDE_AUTOJUDGE_SCORING_H_
#define INCLUDE_AUTOJUDGE_SCORING_H_

#include <string>
#include <filesystem>
#include <functional>
#include <unordered_map>

#include "submission.h"

// id -> num of a CSV file with "id" and "num" columns. Rows with an empty id or a
//   non-numeric value are skipped; a missing column throws ScoringError.
std::unordered_map<std::string, double> ReadScoreTable(const std::filesystem::path&);

class ScoringEngine {
 public:
  using Transform = std::function<double(double)>;
  using BonusSource = std::function<double()>; // [0, 1)

 private:
  Transform transform_;
  BonusSource bonus_;
  double tolerance_;

 public:
  // default transform is x*x, default bonus is a uniform random draw
  explicit ScoringEngine(Transform transform = {}, BonusSource bonus = {}, double tolerance = 1e-6);

  // value = correct + bonus; throws ScoringError
  EvaluationOutcome Score(const std::filesystem::path& reference,
                          const std::filesystem::path& produced) const;
};

#endif  // INCLUDE_AUTOJUDGE_SCORING_H_
