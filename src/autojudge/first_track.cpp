#include <autojudge/first_track.h>

#include <spdlog/spdlog.h>
#include <autojudge/paths.h>

Scorer MakeSandboxScorer(SandboxExecutor executor, ScoringEngine engine) {
  return [executor = std::move(executor), engine = std::move(engine)](
      const ScoringRequest& req) -> std::optional<EvaluationOutcome> {
    spdlog::info("Auto-judge {}: evaluating submission {} ({})",
                 req.track.slug, req.submission.id, req.artifact.c_str());
    const auto& refs = executor.Profile().reference_files;
    try {
      // the workspace copy is writable by the run, so score against the host dataset
      return executor.Execute(req.artifact, [&](const fs::path&, const fs::path& output) {
        return engine.Score(refs.at(0), output);
      });
    } catch (const std::exception& err) {
      spdlog::error("Auto-judge {} failed for submission {}: {}", req.track.slug, req.submission.id, err.what());
      return EvaluationOutcome{
        .status = SubmissionStatus::ERROR,
        .value = std::nullopt,
        .message = std::string("Auto evaluation failed: ") + err.what(),
        .success = false,
      };
    }
  };
}

void RegisterDefaultScorers(ScorerRegistry& registry, SandboxRuntime& runtime, ArchiveExtractor& extractor) {
  SandboxProfile profile;
  profile.reference_files = {ReferenceDataPath(kFirstTrackSlug, kFirstTrackInput)};
  registry.Register(kFirstTrackSlug,
      MakeSandboxScorer(SandboxExecutor(runtime, extractor, std::move(profile)), ScoringEngine()));
}
