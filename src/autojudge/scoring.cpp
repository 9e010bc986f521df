#include <autojudge/scoring.h>

#include <cmath>
#include <random>
#include <vector>
#include <algorithm>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <autojudge/errors.h>
#include <autojudge/utils.h>

namespace {

// Split one CSV record. Quoted fields may contain commas and doubled quotes.
std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> ret(1);
  bool quoted = false;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        ret.back() += '"';
        i++;
      } else if (c == '"') {
        quoted = false;
      } else {
        ret.back() += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      ret.emplace_back();
    } else {
      ret.back() += c;
    }
  }
  return ret;
}

bool ParseDouble(const std::string& str, double& out) {
  std::string s = Trim(str);
  if (s.empty()) return false;
  size_t pos = 0;
  try {
    out = std::stod(s, &pos);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
  return pos == s.size();
}

double RandomBonus() {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(gen);
}

} // namespace

std::unordered_map<std::string, double> ReadScoreTable(const std::filesystem::path& path) {
  std::ifstream fin(path);
  if (!fin) throw ScoringError(fmt::format("CSV {} cannot be opened", path.c_str()));
  std::string line;
  if (!std::getline(fin, line)) {
    throw ScoringError(fmt::format("CSV {} lacks required columns 'id' and 'num'", path.c_str()));
  }
  if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  auto header = SplitCsvLine(line);
  int id_col = -1, num_col = -1;
  for (size_t i = 0; i < header.size(); i++) {
    if (header[i] == "id" && id_col == -1) id_col = i;
    if (header[i] == "num" && num_col == -1) num_col = i;
  }
  if (id_col == -1 || num_col == -1) {
    throw ScoringError(fmt::format("CSV {} lacks required columns 'id' and 'num'", path.c_str()));
  }

  std::unordered_map<std::string, double> ret;
  while (std::getline(fin, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    auto fields = SplitCsvLine(line);
    if ((int)fields.size() <= std::max(id_col, num_col)) continue;
    std::string id = Trim(fields[id_col]);
    double num;
    if (id.empty() || !ParseDouble(fields[num_col], num)) continue;
    ret[id] = num;
  }
  return ret;
}

ScoringEngine::ScoringEngine(Transform transform, BonusSource bonus, double tolerance) :
    transform_(std::move(transform)), bonus_(std::move(bonus)), tolerance_(tolerance) {
  if (!transform_) transform_ = [](double x) { return x * x; };
  if (!bonus_) bonus_ = RandomBonus;
}

EvaluationOutcome ScoringEngine::Score(const std::filesystem::path& reference,
                                       const std::filesystem::path& produced) const {
  auto expected = ReadScoreTable(reference);
  auto predictions = ReadScoreTable(produced);
  int correct = 0;
  for (auto& [id, num] : expected) {
    auto it = predictions.find(id);
    if (it == predictions.end()) continue;
    if (std::abs(it->second - transform_(num)) < tolerance_) correct++;
  }
  int total = expected.size();
  double bonus = bonus_();
  spdlog::info("Scored {}: correct={} total={} bonus={:.3f}", produced.c_str(), correct, total, bonus);
  return {
    .status = SubmissionStatus::ACCEPTED,
    .value = correct + bonus,
    .message = fmt::format("Correct: {}/{}, bonus={:.3f}", correct, total, bonus),
    .success = true,
  };
}
