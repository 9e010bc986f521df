#include <autojudge/executor.h>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <autojudge/errors.h>
#include "paths.h"
#include "utils.h"

long kSandboxTimeout = 120;

namespace {

constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;
constexpr fs::perms kPerm444 =
    fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;

EvaluationOutcome ErrorOutcome(std::string message) {
  return {
    .status = SubmissionStatus::ERROR,
    .value = std::nullopt,
    .message = std::move(message),
    .success = false,
  };
}

// The first regular file named name, preferring shallower ones
std::optional<fs::path> FindFile(const fs::path& root, const std::string& name) {
  std::optional<fs::path> ret;
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(root, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code file_ec;
    if (it->path().filename() != name || !it->is_regular_file(file_ec)) continue;
    if (!ret || it.depth() == 0) ret = it->path();
    if (it.depth() == 0) break;
  }
  return ret;
}

// The host side runs as root, so nothing it touches in the workspace may be a link
void RejectLinks(const fs::path& root) {
  for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
    if (it->is_symlink()) {
      spdlog::info("Archive entry {} is a symbolic link", it->path().c_str());
      throw ArchiveError("Submission archive must not contain symbolic links.");
    }
  }
}

} // namespace

void Denest(const fs::path& dir) {
  std::vector<fs::path> entries;
  for (auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename() == "__MACOSX") continue;
    entries.push_back(entry.path());
  }
  if (entries.size() != 1 || !fs::is_directory(entries[0]) || fs::is_symlink(entries[0])) return;
  fs::path root = entries[0];
  spdlog::debug("Archive wrapped in folder {}, flattening", root.filename().c_str());
  // park the wrapper outside dir so none of its children can collide with it
  TempDirectory aside(dir.parent_path(), ".denest");
  if (aside.Path().empty()) {
    throw fs::filesystem_error("cannot flatten archive", dir,
                               std::make_error_code(std::errc::io_error));
  }
  fs::path wrapper = aside.Path() / "wrapper";
  fs::rename(root, wrapper);
  for (auto& child : fs::directory_iterator(wrapper)) {
    fs::path target = dir / child.path().filename();
    if (fs::exists(fs::symlink_status(target))) fs::remove_all(target);
    fs::rename(child.path(), target);
  }
}

EvaluationOutcome SandboxExecutor::Execute(const fs::path& archive, const OutputScorer& score) const {
  for (auto& i : profile_.reference_files) {
    if (!fs::is_regular_file(i)) {
      spdlog::error("Reference dataset missing at {}", i.c_str());
      return ErrorOutcome(fmt::format("Input dataset is missing at {}", i.c_str()));
    }
  }

  TempDirectory box(kBoxRoot, "box");
  if (box.Path().empty()) return ErrorOutcome("Failed to prepare the sandbox.");
  fs::path workspace = Workdir(fs::path(box.Path()));
  std::error_code ec;
  fs::permissions(box.Path(), kPerm755, ec);
  if (ec || !CreateDirs(workspace, fs::perms::all)) {
    return ErrorOutcome("Failed to prepare the sandbox.");
  }

  try {
    extractor_.Extract(archive, box.Path(), InsideBox(box.Path(), workspace));
    Denest(workspace);
    RejectLinks(workspace);
  } catch (const ArchiveError& err) {
    spdlog::info("Archive {} rejected: {}", archive.c_str(), err.what());
    return ErrorOutcome(err.what());
  } catch (const fs::filesystem_error& err) {
    spdlog::warn("Failed to lay out {}: {}", archive.c_str(), err.what());
    return ErrorOutcome("Submission archive has an unsupported layout.");
  }

  auto entry = FindFile(workspace, profile_.entry_point);
  if (!entry) {
    return ErrorOutcome(fmt::format("{} was not found inside the submission archive.",
                                    profile_.entry_point));
  }
  if (entry->parent_path() != workspace) {
    return ErrorOutcome(fmt::format("{} must be located in the archive root.",
                                    profile_.entry_point));
  }

  for (auto& i : profile_.reference_files) {
    fs::path target = workspace / i.filename();
    if (!RemoveAll(target) || !Copy(i, target, kPerm444)) {
      return ErrorOutcome("Failed to prepare the sandbox.");
    }
  }

  SandboxRequest req{
    .boxdir = box.Path(),
    .workdir = InsideBox(box.Path(), entry->parent_path()),
    .command = profile_.interpreter,
    .timeout = profile_.timeout,
  };
  req.command.push_back(profile_.entry_point);
  SandboxRunResult res = runtime_.Run(req);
  switch (res.kind) {
    case RunKind::UNAVAILABLE:
      spdlog::error("Sandbox runtime unavailable: {}", res.diagnostics);
      return ErrorOutcome("Sandbox runtime is not available.");
    case RunKind::TIMED_OUT:
      spdlog::warn("Sandbox run of {} timed out after {}s", archive.c_str(), profile_.timeout);
      return ErrorOutcome(fmt::format("Execution timed out after {}s.", profile_.timeout));
    case RunKind::EXITED:
      if (res.exit_code != 0) {
        spdlog::warn("Sandbox run of {} exited with {}, stderr={}",
                     archive.c_str(), res.exit_code, res.diagnostics);
        return ErrorOutcome(fmt::format("Execution failed (exit {}). stderr: {}",
                                        res.exit_code, res.diagnostics));
      }
      break;
  }

  fs::path output = workspace / profile_.output_file;
  auto output_status = fs::symlink_status(output, ec);
  if (fs::exists(output_status) && !fs::is_regular_file(output_status)) {
    spdlog::warn("{} of {} is not a regular file", profile_.output_file, archive.c_str());
    return ErrorOutcome(fmt::format("{} must be a regular file.", profile_.output_file));
  }
  if (!fs::is_regular_file(output_status)) {
    spdlog::warn("{} missing for {}, awarding 0 points", profile_.output_file, archive.c_str());
    return {
      .status = SubmissionStatus::ACCEPTED,
      .value = 0.0,
      .message = fmt::format("{} is missing, score 0.", profile_.output_file),
      .success = true,
    };
  }
  return score(workspace, output);
}
