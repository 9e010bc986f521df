#include <errno.h>
#include <unistd.h>

#include "sandbox.h"

// sandbox-exec: reads a length-prefixed JailConfig on stdin, runs it under
// cjail and writes the raw cjail_result to stdout.

namespace {

bool ReadExact(int fd, void* buf, size_t len) {
  auto ptr = static_cast<uint8_t*>(buf);
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

} // namespace

int main() {
  uint64_t len = 0;
  if (!ReadExact(0, &len, sizeof(len)) || len > (64u << 20)) return 1;
  std::vector<uint8_t> buf(len);
  JailConfig conf;
  if (!ReadExact(0, buf.data(), len) || !conf.Unpack(buf)) return 1;

  JailContext jail;
  conf.Fill(jail);
  struct cjail_result res = {};
  if (cjail_exec(jail.Get(), &res) < 0) {
    res.timekill = -1;
    res.oomkill = errno;
  }
  return write(1, &res, sizeof(res)) == sizeof(res) ? 0 : 1;
}
