#ifndef INCLUDE_AUTOJUDGE_FIRST_TRACK_H_
#define INCLUDE_AUTOJUDGE_FIRST_TRACK_H_

#include "executor.h"
#include "scoring.h"
#include "scorer_registry.h"

constexpr char kFirstTrackSlug[] = "first_track";
constexpr char kFirstTrackInput[] = "input.csv";

// Sandbox run followed by table scoring of the produced output against
//   the first reference file of the profile
Scorer MakeSandboxScorer(SandboxExecutor executor, ScoringEngine engine);

void RegisterDefaultScorers(ScorerRegistry&, SandboxRuntime&, ArchiveExtractor&);

#endif  // INCLUDE_AUTOJUDGE_FIRST_TRACK_H_
