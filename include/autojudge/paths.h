#ifndef INCLUDE_AUTOJUDGE_PATHS_H_
#define INCLUDE_AUTOJUDGE_PATHS_H_

#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// root of all stored artifacts; Submission::artifact_path is relative to it
extern fs::path kStorageRoot;
extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path SubmissionsRoot();
fs::path TeamSubmissionsPath(long team_id);
fs::path SubmissionArtifact(long team_id, const std::string& safe_slug, int seq);
fs::path TransferWorkspace(const std::string& safe_slug, int seq);
// reference data of a track, e.g. <data_dir>/auto_judge/first_track/input.csv
fs::path ReferenceDataPath(const std::string& track_slug, const std::string& filename);

// Resolve a stored artifact path against kStorageRoot.
// Returns nullopt if the result escapes the root or is not an existing regular file.
std::optional<fs::path> ResolveArtifact(const fs::path& stored);
// Whether path lies inside root after normalization (the file need not exist)
bool IsInsideRoot(const fs::path& root, const fs::path& path);

#endif  // INCLUDE_AUTOJUDGE_PATHS_H_
