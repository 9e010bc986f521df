#ifndef INCLUDE_AUTOJUDGE_RUNTIME_H_
#define INCLUDE_AUTOJUDGE_RUNTIME_H_

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// KiB
extern long kMaxRSS;
extern long kMaxOutput;
extern int kSandboxUid;

#define ENUM_RUN_KIND_ \
  X(EXITED) \
  X(TIMED_OUT) \
  X(UNAVAILABLE) /* the isolation runtime itself failed */
enum class RunKind {
#define X(name) name,
  ENUM_RUN_KIND_
#undef X
};

struct SandboxRequest {
  fs::path boxdir; // becomes / inside the box
  fs::path workdir; // inside box, absolute
  std::vector<std::string> command;
  long timeout; // seconds, wall clock
};

struct SandboxRunResult {
  RunKind kind = RunKind::UNAVAILABLE;
  int exit_code = -1;
  std::string diagnostics; // captured stderr, truncated
};

// Runs a command with no network, a chroot onto boxdir and a hard time limit
class SandboxRuntime {
 public:
  virtual ~SandboxRuntime() = default;
  virtual SandboxRunResult Run(const SandboxRequest&) = 0;
};

// Unpacks an archive into a directory inside a box; throws ArchiveError
class ArchiveExtractor {
 public:
  virtual ~ArchiveExtractor() = default;
  virtual void Extract(const fs::path& archive, const fs::path& boxdir, const fs::path& dest) = 0;
};

// SandboxRuntime backed by cjail through the sandbox-exec helper
class CJailRuntime : public SandboxRuntime {
 public:
  SandboxRunResult Run(const SandboxRequest&) override;
};

// Runs unzip(1) inside the sandbox
class SandboxedUnzip : public ArchiveExtractor {
  SandboxRuntime& runtime_;
  long timeout_;
 public:
  explicit SandboxedUnzip(SandboxRuntime& runtime, long timeout = 60) :
      runtime_(runtime), timeout_(timeout) {}
  void Extract(const fs::path& archive, const fs::path& boxdir, const fs::path& dest) override;
};

const char* RunKindName(RunKind);

#endif  // INCLUDE_AUTOJUDGE_RUNTIME_H_
