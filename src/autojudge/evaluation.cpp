#include <autojudge/evaluation.h>

#include <spdlog/spdlog.h>
#include <autojudge/paths.h>
#include <autojudge/utils.h>

std::optional<EvaluationOutcome> EvaluationCoordinator::Evaluate(const Submission& sub) {
  auto membership = directory_.GetMembership(sub.team_membership_id);
  if (!membership) {
    spdlog::debug("Submission {}: membership {} not found", sub.id, sub.team_membership_id);
    return std::nullopt;
  }
  auto team = directory_.GetTeam(membership->team_id);
  if (!team || !team->track_id) {
    spdlog::debug("Submission {}: team {} has no track", sub.id, membership->team_id);
    return std::nullopt;
  }
  auto track = directory_.GetTrack(*team->track_id);
  if (!track) {
    spdlog::debug("Submission {}: track {} not found", sub.id, *team->track_id);
    return std::nullopt;
  }
  auto scorer = registry_.Resolve(track->slug);
  if (!scorer) {
    spdlog::debug("No auto-judge registered for track slug '{}'", NormalizeSlug(track->slug));
    return std::nullopt;
  }
  auto artifact = ResolveArtifact(sub.artifact_path);
  if (!artifact) {
    spdlog::warn("Submission {}: file {} not found for auto-judge", sub.id, sub.artifact_path);
    return std::nullopt;
  }

  ScoringRequest req{
    .artifact = *artifact,
    .submission = sub,
    .team = *team,
    .track = *track,
  };
  std::optional<EvaluationOutcome> outcome;
  {
    std::lock_guard lck(eval_lock_);
    try {
      outcome = (*scorer)(req);
    } catch (const std::exception& err) {
      spdlog::error("Auto-judge scorer failed for submission {}: {}", sub.id, err.what());
      outcome = EvaluationOutcome{.message = err.what(), .success = false};
    }
  }
  if (!outcome) return std::nullopt;

  if (outcome->status || outcome->value) {
    SubmissionUpdate update{.id = sub.id, .status = outcome->status, .value = outcome->value};
    try {
      update_(update);
    } catch (const std::exception& err) {
      spdlog::error("Failed to persist auto-judge result for submission {} (status={} value={}): {}",
                    sub.id, outcome->status ? SubmissionStatusName(*outcome->status) : "-",
                    FormatValue(outcome->value), err.what());
      outcome->success = false;
    }
  }

  cache_.Put(sub.id, *outcome);
  spdlog::info("Auto-judge stored result for submission {}: success={} status={} value={}",
               sub.id, outcome->success,
               outcome->status ? SubmissionStatusName(*outcome->status) : "-",
               FormatValue(outcome->value));
  return outcome;
}

std::future<std::optional<EvaluationOutcome>> EvaluationCoordinator::EvaluateAsync(Submission sub) {
  return std::async(std::launch::async, [this, sub = std::move(sub)]() {
    return Evaluate(sub);
  });
}

CreateFn EvaluationCoordinator::InterceptCreate(CreateFn create) {
  return [this, create = std::move(create)](const Submission& draft) {
    Submission created = create(draft);
    try {
      Evaluate(created);
    } catch (const std::exception& err) {
      spdlog::error("Auto-judge failed for new submission {}: {}", created.id, err.what());
    }
    return created;
  };
}
