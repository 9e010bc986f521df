#ifndef AUTOJUDGE_SANDBOX_EXEC_H_
#define AUTOJUDGE_SANDBOX_EXEC_H_

#include "sandbox.h"

// Hands the config to the sandbox-exec helper in kDataDir and waits for it.
// The helper needs root. timekill == -1 in the result reports a launch
// failure, with the errno in oomkill.
// The caller creates root and workdir and opens stderr_fd beforehand.
struct cjail_result RunInJail(const JailConfig&);

#endif  // AUTOJUDGE_SANDBOX_EXEC_H_
