#ifndef AUTOJUDGE_PATHS_H_
#define AUTOJUDGE_PATHS_H_

#include <autojudge/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// inside the box, stderr of the run is written next to the workdir
fs::path BoxErrorFile(const fs::path& box, bool inside_box = false);
fs::path BoxArchive(const fs::path& box, bool inside_box = false);

#endif  // AUTOJUDGE_PATHS_H_
