#ifndef INCLUDE_AUTOJUDGE_EXECUTOR_H_
#define INCLUDE_AUTOJUDGE_EXECUTOR_H_

#include <functional>

#include "runtime.h"
#include "submission.h"

// seconds
extern long kSandboxTimeout;

struct SandboxProfile {
  std::string entry_point = "main.py";
  std::vector<std::string> interpreter = {"/usr/bin/env", "python3"};
  std::string output_file = "output.csv";
  // copied read-only into the workspace root before the run
  std::vector<fs::path> reference_files;
  long timeout = kSandboxTimeout;
};

// Called with (workspace, produced output) while the box still exists
using OutputScorer = std::function<EvaluationOutcome(const fs::path&, const fs::path&)>;

class SandboxExecutor {
  SandboxRuntime& runtime_;
  ArchiveExtractor& extractor_;
  SandboxProfile profile_;
 public:
  SandboxExecutor(SandboxRuntime& runtime, ArchiveExtractor& extractor, SandboxProfile profile) :
      runtime_(runtime), extractor_(extractor), profile_(std::move(profile)) {}

  const SandboxProfile& Profile() const { return profile_; }

  // Unpack the archive into a fresh box under kBoxRoot, run the entry point
  //   and score its output. The box is removed before returning.
  EvaluationOutcome Execute(const fs::path& archive, const OutputScorer& score) const;
};

// If the top level of dir (ignoring __MACOSX) is a single directory,
//   move its contents up one level. The wrapper is parked in a temporary
//   directory beside dir. Throws fs::filesystem_error.
void Denest(const fs::path& dir);

#endif  // INCLUDE_AUTOJUDGE_EXECUTOR_H_
