#ifndef AUTOJUDGE_UTILS_H_
#define AUTOJUDGE_UTILS_H_

#include <filesystem>

#include <autojudge/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

fs::path InsideBox(const fs::path& box, const fs::path& path);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

// These functions resolve symlinks; Move allows cross-device move
bool Move(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);

// At most max_len bytes, with a note appended if the file is longer
std::string ReadTruncated(const fs::path&, size_t max_len);

class TempDirectory { // RAII tempdir
  fs::path path_;
 public:
  // path is empty if creation failed
  explicit TempDirectory(const fs::path& parent, const char* prefix = "tmp");
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;
  ~TempDirectory();
  const fs::path& Path() const { return path_; }
};

#endif  // AUTOJUDGE_UTILS_H_
