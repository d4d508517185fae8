#ifndef SCRIPTBOX_SANDBOX_EXEC_H_
#define SCRIPTBOX_SANDBOX_EXEC_H_

#include <functional>

#include <scriptbox/execution.h>
#include "sandbox.h"

// We separate this from sandbox.h because this function needs the logging and
//   result types, while sandbox.h only describes what to run

struct SandboxCallbacks {
  std::function<void(ExecutionState)> ReportState;
  std::function<void(int pid)> ReportSpawned; // right after a successful fork
};

// Launch opt.command and supervise it until it reaches a terminal state:
// - the child gets its own process group, a fresh signal state, no inherited
//   descriptors beyond stdin/stdout/stderr, no_new_privs, the configured rlimits,
//   and the given uid/gid
// - stdout and stderr are captured separately; stdin receives opt.input
// - one poll loop serves all pipes against a single deadline; when it passes
//   the group gets SIGTERM, and SIGKILL after opt.kill_grace
// - exec failures come back through a close-on-exec pipe as LAUNCH_FAILED
// elapsed_seconds spans fork to reap.
ExecutionOutcome SandboxExec(const SandboxOptions&, const SandboxCallbacks& = {});

#endif  // SCRIPTBOX_SANDBOX_EXEC_H_
