#include <autojudge/scorer_registry.h>

#include <stdexcept>

#include <spdlog/spdlog.h>
#include <autojudge/utils.h>

void ScorerRegistry::Register(const std::string& track_slug, Scorer scorer) {
  if (sealed_) throw std::logic_error("scorer registered after startup: " + track_slug);
  std::string slug = NormalizeSlug(track_slug);
  if (slug.empty()) throw std::logic_error("scorer registered with an empty track slug");
  spdlog::info("Registered scorer for track {}", slug);
  scorers_[slug] = std::move(scorer);
}

std::optional<Scorer> ScorerRegistry::Resolve(const std::string& track_slug) const {
  auto it = scorers_.find(NormalizeSlug(track_slug));
  if (it == scorers_.end()) return std::nullopt;
  return it->second;
}
