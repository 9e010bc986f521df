#ifndef AUTOJUDGE_SANDBOX_H_
#define AUTOJUDGE_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

// Owns every buffer a cjail_ctx points into
class JailContext {
  std::vector<const char*> argv_;
  std::vector<const char*> env_;
  std::vector<struct jail_mount_ctx> mounts_;
  struct jail_mount_list* mount_list_;
  struct cjail_ctx ctx_;

  friend struct JailConfig;
 public:
  JailContext() : mount_list_(mnt_list_new()) {}
  JailContext(const JailContext&) = delete;
  JailContext& operator=(const JailContext&) = delete;
  ~JailContext() { mnt_list_free(mount_list_); }

  struct cjail_ctx* Get() { return &ctx_; }
};

// One contestant run as the privileged helper sees it.
// Paths except root are inside the box.
struct JailConfig {
  std::string root;
  std::vector<std::string> argv;
  std::vector<std::string> env;
  std::string workdir;
  int stderr_fd = -1; // inherited from the caller; -1 keeps the helper's stderr
  bool network = false;
  int uid = 65534, gid = 65534;
  long wall_time_us = 0;
  long memory_kib = 0;
  int max_procs = 0;
  long max_file_kib = 0;
  // bind-mounted read-only at the same path inside the box
  std::vector<std::string> ro_binds;

  // only exchanged between processes of the same build on the same host
  std::vector<uint8_t> Pack() const;
  // false on a truncated or malformed buffer
  bool Unpack(const std::vector<uint8_t>& buf);

  // removes ro_binds that are not directories on this host
  void DropMissingBinds();
  // ctx stays valid while this config is unchanged
  void Fill(JailContext& ctx) const;

 private:
  template <class Self, class Visitor>
  static bool VisitFields(Self& self, Visitor&& visit) {
    return visit(self.root) && visit(self.argv) && visit(self.env) &&
           visit(self.workdir) && visit(self.stderr_fd) && visit(self.network) &&
           visit(self.uid) && visit(self.gid) && visit(self.wall_time_us) &&
           visit(self.memory_kib) && visit(self.max_procs) &&
           visit(self.max_file_kib) && visit(self.ro_binds);
  }
};

#endif  // AUTOJUDGE_SANDBOX_H_
