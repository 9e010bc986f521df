#include "sandbox_exec.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"

namespace {

struct Pipe {
  int fd[2] = {-1, -1};
  ~Pipe() { Close(0); Close(1); }
  bool Open() { return pipe(fd) == 0; }
  void Close(int end) {
    if (fd[end] >= 0) close(fd[end]);
    fd[end] = -1;
  }
};

bool WriteAll(int fd, const void* buf, size_t len) {
  auto ptr = static_cast<const uint8_t*>(buf);
  while (len) {
    ssize_t n = write(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

struct cjail_result LaunchFailure(int err) {
  spdlog::warn("Cannot launch sandbox-exec: {}", strerror(err));
  struct cjail_result ret = {};
  ret.timekill = -1;
  ret.oomkill = err;
  return ret;
}

} // namespace

struct cjail_result RunInJail(const JailConfig& conf) {
  Pipe to_helper, from_helper;
  if (!to_helper.Open() || !from_helper.Open()) return LaunchFailure(errno);
  fs::path helper = internal::kDataDir / "sandbox-exec";
  pid_t pid = fork();
  if (pid < 0) return LaunchFailure(errno);
  if (pid == 0) {
    dup2(to_helper.fd[0], 0);
    dup2(from_helper.fd[1], 1);
    to_helper.Close(0); to_helper.Close(1);
    from_helper.Close(0); from_helper.Close(1);
    execl(helper.c_str(), helper.c_str(), nullptr);
    _exit(127);
  }
  to_helper.Close(0);
  from_helper.Close(1);
  spdlog::debug("sandbox-exec pid={} root={} argv={}", pid, conf.root, fmt::format("{}", conf.argv));

  auto packed = conf.Pack();
  uint64_t len = packed.size();
  struct cjail_result ret = {};
  bool ok = WriteAll(to_helper.fd[1], &len, sizeof(len)) &&
            WriteAll(to_helper.fd[1], packed.data(), packed.size());
  int err = errno;
  to_helper.Close(1);
  if (ok) {
    ok = read(from_helper.fd[0], &ret, sizeof(ret)) == sizeof(ret);
    err = errno;
  }
  if (!ok) {
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    // EOF without errno: the helper exited before answering
    return LaunchFailure(err ? err : ECHILD);
  }
  waitpid(pid, nullptr, 0);
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec failed in sandbox-exec: {}", strerror(ret.oomkill));
  }
  return ret;
}
