#include "paths.h"

#include <spdlog/spdlog.h>
#include "utils.h"

fs::path kStorageRoot = "/var/lib/autojudge";
fs::path kBoxRoot = "/tmp/autojudge_box";

namespace internal {
fs::path kDataDir = fs::path(AUTOJUDGE_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path BoxErrorFile(const fs::path& box, bool inside_box) {
  return BoxRoot(box, inside_box) / "stderr";
}
fs::path BoxArchive(const fs::path& box, bool inside_box) {
  return BoxRoot(box, inside_box) / "archive.zip";
}

fs::path SubmissionsRoot() {
  return kStorageRoot / "submissions";
}
fs::path TeamSubmissionsPath(long team_id) {
  return SubmissionsRoot() / std::to_string(team_id);
}
fs::path SubmissionArtifact(long team_id, const std::string& safe_slug, int seq) {
  return TeamSubmissionsPath(team_id) / (safe_slug + "_" + std::to_string(seq) + ".zip");
}
fs::path TransferWorkspace(const std::string& safe_slug, int seq) {
  return SubmissionsRoot() / "tmp" / safe_slug / std::to_string(seq);
}

fs::path ReferenceDataPath(const std::string& track_slug, const std::string& filename) {
  return internal::kDataDir / "auto_judge" / track_slug / filename;
}

bool IsInsideRoot(const fs::path& root, const fs::path& path) {
  std::error_code ec;
  fs::path norm_root = fs::weakly_canonical(root, ec);
  if (ec) return false;
  fs::path norm_path = fs::weakly_canonical(path, ec);
  if (ec) return false;
  auto rel = norm_path.lexically_relative(norm_root);
  if (rel.empty()) return false;
  return *rel.begin() != "..";
}

std::optional<fs::path> ResolveArtifact(const fs::path& stored) {
  if (stored.empty()) return std::nullopt;
  fs::path candidate = stored.is_absolute() ? stored : kStorageRoot / stored;
  if (!IsInsideRoot(kStorageRoot, candidate)) {
    spdlog::warn("Artifact {} escapes storage root {}", stored.c_str(), kStorageRoot.c_str());
    return std::nullopt;
  }
  std::error_code ec;
  if (!fs::is_regular_file(candidate, ec)) {
    spdlog::warn("Artifact {} not found; checked {}", stored.c_str(), candidate.c_str());
    return std::nullopt;
  }
  return candidate.lexically_normal();
}
