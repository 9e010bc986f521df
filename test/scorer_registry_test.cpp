#include <stdexcept>

#include <autojudge/first_track.h>
#include <autojudge/scorer_registry.h>
#include "utils.h"

namespace {

Scorer Fixed(double value) {
  return [value](const ScoringRequest&) -> std::optional<EvaluationOutcome> {
    return EvaluationOutcome{.status = SubmissionStatus::ACCEPTED, .value = value};
  };
}

} // namespace

TEST(ScorerRegistryTest, ResolveNormalizesSlug) {
  ScorerRegistry registry;
  registry.Register(" First_Track ", Fixed(1));
  auto scorer = registry.Resolve("first_track");
  ASSERT_TRUE(scorer);
  EXPECT_EQ((*scorer)(ScoringRequest{})->value, 1.0);
  EXPECT_TRUE(registry.Resolve("FIRST_TRACK "));
  EXPECT_FALSE(registry.Resolve("second_track"));
}

TEST(ScorerRegistryTest, LaterRegistrationReplaces) {
  ScorerRegistry registry;
  registry.Register("t", Fixed(1));
  registry.Register("t", Fixed(2));
  EXPECT_EQ((*registry.Resolve("t"))(ScoringRequest{})->value, 2.0);
}

TEST(ScorerRegistryTest, SealedRegistryRejectsRegistration) {
  ScorerRegistry registry;
  registry.Register("t", Fixed(1));
  registry.Seal();
  EXPECT_TRUE(registry.Sealed());
  EXPECT_THROW(registry.Register("u", Fixed(1)), std::logic_error);
  EXPECT_FALSE(registry.Resolve("u"));
  EXPECT_TRUE(registry.Resolve("t"));
}

TEST(ScorerRegistryTest, EmptySlug) {
  ScorerRegistry registry;
  EXPECT_THROW(registry.Register("  ", Fixed(1)), std::logic_error);
}

TEST(ScorerRegistryTest, DefaultScorers) {
  FakeRuntime runtime;
  DirectoryExtractor extractor;
  ScorerRegistry registry;
  RegisterDefaultScorers(registry, runtime, extractor);
  EXPECT_TRUE(registry.Resolve(kFirstTrackSlug));
  EXPECT_FALSE(registry.Resolve("second_track"));
}
