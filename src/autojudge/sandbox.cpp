#include "sandbox.h"

#include <sys/stat.h>
#include <cstring>
#include <type_traits>

namespace {

using Word = int64_t;

class Packer {
  std::vector<uint8_t>& out_;

  void PutWord(Word w) {
    size_t at = out_.size();
    out_.resize(at + sizeof(w));
    memcpy(out_.data() + at, &w, sizeof(w));
  }
 public:
  explicit Packer(std::vector<uint8_t>& out) : out_(out) {}

  template <class T>
  std::enable_if_t<std::is_arithmetic_v<T>, bool> operator()(const T& val) {
    PutWord(static_cast<Word>(val));
    return true;
  }
  bool operator()(const std::string& str) {
    PutWord(str.size());
    out_.insert(out_.end(), str.begin(), str.end());
    return true;
  }
  bool operator()(const std::vector<std::string>& list) {
    PutWord(list.size());
    for (auto& i : list) (*this)(i);
    return true;
  }
};

class Unpacker {
  const std::vector<uint8_t>& in_;
  size_t pos_ = 0;

  bool GetWord(Word& w) {
    if (in_.size() - pos_ < sizeof(w)) return false;
    memcpy(&w, in_.data() + pos_, sizeof(w));
    pos_ += sizeof(w);
    return true;
  }
 public:
  explicit Unpacker(const std::vector<uint8_t>& in) : in_(in) {}

  template <class T>
  std::enable_if_t<std::is_arithmetic_v<T>, bool> operator()(T& val) {
    Word w;
    if (!GetWord(w)) return false;
    val = static_cast<T>(w);
    return true;
  }
  bool operator()(std::string& str) {
    Word len;
    if (!GetWord(len) || len < 0 || (size_t)len > in_.size() - pos_) return false;
    str.assign(reinterpret_cast<const char*>(in_.data() + pos_), len);
    pos_ += len;
    return true;
  }
  bool operator()(std::vector<std::string>& list) {
    Word count;
    if (!GetWord(count) || count < 0 || (size_t)count > in_.size()) return false;
    list.resize(count);
    for (auto& i : list) {
      if (!(*this)(i)) return false;
    }
    return true;
  }
  bool Done() const { return pos_ == in_.size(); }
};

} // namespace

std::vector<uint8_t> JailConfig::Pack() const {
  std::vector<uint8_t> ret;
  VisitFields(*this, Packer(ret));
  return ret;
}

bool JailConfig::Unpack(const std::vector<uint8_t>& buf) {
  Unpacker unpacker(buf);
  return VisitFields(*this, unpacker) && unpacker.Done();
}

void JailConfig::DropMissingBinds() {
  std::vector<std::string> kept;
  for (auto& dir : ro_binds) {
    struct stat st;
    if (stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) kept.push_back(dir);
  }
  ro_binds.swap(kept);
}

void JailConfig::Fill(JailContext& jail) const {
  static char kBind[] = "bind";
  struct cjail_ctx& ctx = jail.ctx_;
  cjail_ctx_init(&ctx);
  ctx.sharenet = network;
  if (stderr_fd >= 0) ctx.fd_error = stderr_fd;

  jail.argv_.clear();
  for (auto& i : argv) jail.argv_.push_back(i.c_str());
  jail.argv_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(jail.argv_.data());
  jail.env_.clear();
  for (auto& i : env) jail.env_.push_back(i.c_str());
  jail.env_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(jail.env_.data());

  ctx.chroot = const_cast<char*>(root.c_str());
  ctx.working_dir = const_cast<char*>(workdir.c_str());
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0;
  ctx.rlim_fsize = max_file_kib;
  ctx.rlim_proc = max_procs;
  ctx.cg_rss = memory_kib;
  ctx.lim_time.tv_sec = wall_time_us / 1'000'000;
  ctx.lim_time.tv_usec = wall_time_us % 1'000'000;

  // mnt_list_add keeps pointers into mounts_, so it must not reallocate
  jail.mounts_.assign(ro_binds.size(), {});
  for (size_t i = 0; i < ro_binds.size(); i++) {
    struct jail_mount_ctx& mnt = jail.mounts_[i];
    mnt.type = kBind;
    mnt.source = mnt.target = const_cast<char*>(ro_binds[i].c_str());
    mnt.fstype = mnt.data = nullptr;
    mnt.flags = 0;
    mnt_list_add(jail.mount_list_, &mnt);
  }
  ctx.mount_cfg = jail.mount_list_;
}
