#include <autojudge/runtime.h>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstring>
#include <cstdlib>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <autojudge/errors.h>
#include "paths.h"
#include "utils.h"
#include "sandbox_exec.h"

long kMaxRSS = 1024L * 1024; // 1 GiB
long kMaxOutput = 256L * 1024; // 256 MiB
int kSandboxUid = 65534;

namespace {

constexpr size_t kMaxMsgLen = 4000;

} // namespace

SandboxRunResult CJailRuntime::Run(const SandboxRequest& req) {
  SandboxRunResult ret;
  spdlog::debug("Generating sandbox settings: boxdir={} workdir={} command={}",
                req.boxdir.c_str(), req.workdir.c_str(), fmt::format("{}", req.command));
  fs::path error_file = BoxErrorFile(req.boxdir);
  int fd_error = open(error_file.c_str(), O_WRONLY | O_TRUNC | O_CREAT, 0600);
  if (fd_error < 0) {
    ret.diagnostics = fmt::format("cannot open {}: {}", error_file.c_str(), strerror(errno));
    spdlog::warn("Sandbox setup failed: {}", ret.diagnostics);
    return ret;
  }

  JailConfig conf;
  conf.root = req.boxdir;
  conf.argv = req.command;
  if (char* path = getenv("PATH")) conf.env.push_back(std::string("PATH=") + path);
  conf.env.push_back("HOME=" + req.workdir.string());
  conf.env.push_back("PYTHONDONTWRITEBYTECODE=1");
  conf.workdir = req.workdir;
  conf.stderr_fd = fd_error;
  conf.uid = conf.gid = kSandboxUid;
  conf.wall_time_us = req.timeout * 1'000'000;
  conf.memory_kib = kMaxRSS;
  conf.max_procs = 64;
  conf.max_file_kib = kMaxOutput;
  conf.ro_binds = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
  conf.DropMissingBinds();
  struct cjail_result res = RunInJail(conf);
  close(fd_error);

  ret.diagnostics = Trim(ReadTruncated(error_file, kMaxMsgLen));
  if (res.timekill == -1) {
    ret.kind = RunKind::UNAVAILABLE;
    if (ret.diagnostics.empty()) ret.diagnostics = strerror(res.oomkill);
  } else if (res.timekill) {
    ret.kind = RunKind::TIMED_OUT;
  } else {
    ret.kind = RunKind::EXITED;
    if (res.info.si_code == CLD_EXITED) {
      ret.exit_code = res.info.si_status;
    } else {
      ret.exit_code = 128 + res.info.si_status;
      if (ret.diagnostics.empty()) {
        ret.diagnostics = fmt::format("killed by signal {}", strsignal(res.info.si_status));
      }
    }
    if (res.oomkill > 0 && ret.diagnostics.empty()) ret.diagnostics = "memory limit exceeded";
  }
  spdlog::debug("Sandbox finished: kind={} exit={} time={}.{:06d}s rss={}KiB",
                RunKindName(ret.kind), ret.exit_code, res.time.tv_sec, (long)res.time.tv_usec,
                res.stats.hiwater_vm);
  return ret;
}

void SandboxedUnzip::Extract(const fs::path& archive, const fs::path& boxdir, const fs::path& dest) {
  fs::path box_archive = BoxArchive(boxdir);
  if (!Copy(archive, box_archive, kPerm666)) {
    throw ArchiveError("Submission archive could not be read.");
  }
  SandboxRequest req{
    .boxdir = boxdir,
    .workdir = dest,
    .command = {"/usr/bin/env", "unzip", "-qq", "-o", BoxArchive(boxdir, true).string(),
                "-d", dest.string()},
    .timeout = timeout_,
  };
  SandboxRunResult res = runtime_.Run(req);
  RemoveAll(box_archive);
  // unzip exits with 1 on warnings only
  if (res.kind == RunKind::EXITED && (res.exit_code == 0 || res.exit_code == 1)) return;
  spdlog::info("unzip failed: kind={} exit={} {}", RunKindName(res.kind), res.exit_code, res.diagnostics);
  switch (res.kind) {
    case RunKind::EXITED:
      throw ArchiveError("Submission archive could not be unpacked: " + res.diagnostics);
    case RunKind::TIMED_OUT:
      throw ArchiveError("Unpacking the submission archive timed out.");
    case RunKind::UNAVAILABLE:
      throw SandboxError("Sandbox runtime is not available: " + res.diagnostics);
  }
}
