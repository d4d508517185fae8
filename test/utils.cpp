#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <linux/fs.h>
#include <filesystem>
#include <scriptbox/paths.h>

ExecutionHooks ExecutionRecorder::GetHooks() {
  ExecutionHooks hooks;
  hooks.ReportStaged = [this](long, const std::string& path) { workspace = path; };
  hooks.ReportFindings = [this](long, const std::vector<PolicyFinding>& f) { findings = f; };
  hooks.ReportState = [this](long, ExecutionState state) { states.push_back(state); };
  hooks.ReportSpawned = [this](long, int pid) { pids.push_back(pid); };
  hooks.ReportFinished = [this](long, const ExecutionResult&) { finished++; };
  return hooks;
}

bool ExecutionRecorder::WorkspaceRemoved() const {
  return workspace.empty() || !fs::exists(workspace);
}

ConfigGuard::ConfigGuard() :
    interpreter_(kInterpreter), interpreter_path_(kInterpreterPath), constrained_(kConstrainedMode),
    max_output_(kMaxOutput), max_timeout_(kMaxTimeoutSeconds),
    kill_grace_(kKillGraceMs), blocking_(kBlockingSeverity),
    policy_(GetExecutionPolicy()) {}

ConfigGuard::~ConfigGuard() {
  kInterpreter = interpreter_;
  kInterpreterPath = interpreter_path_;
  kConstrainedMode = constrained_;
  kMaxOutput = max_output_;
  kMaxTimeoutSeconds = max_timeout_;
  kKillGraceMs = kill_grace_;
  kBlockingSeverity = blocking_;
  SetExecutionPolicy(policy_);
}

ExecutionRequest MakeRequest(const std::string& script, const ParameterList& params,
                             int timeout_seconds) {
  ExecutionRequest req;
  req.script_content = script;
  req.parameters = params;
  req.timeout_seconds = timeout_seconds;
  return req;
}

size_t WorkspaceCount() {
  std::error_code ec;
  if (!fs::exists(kWorkspaceRoot, ec)) return 0;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(kWorkspaceRoot, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    ret++;
  }
  return ret;
}

namespace {

bool SetImmutable(const fs::path& path, bool on) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return false;
  int flags = 0;
  bool ok = ioctl(fd, FS_IOC_GETFLAGS, &flags) == 0;
  if (ok) {
    flags = on ? (flags | FS_IMMUTABLE_FL) : (flags & ~FS_IMMUTABLE_FL);
    ok = ioctl(fd, FS_IOC_SETFLAGS, &flags) == 0;
  }
  close(fd);
  return ok;
}

} // namespace

bool RemovalBlocker::Block(const fs::path& dir) {
  dir_ = dir;
  fs::path sub = dir / "pinned";
  std::error_code ec;
  if (!fs::create_directory(sub, ec)) return false;
  locked_ = sub / "keep";
  int fd = open(locked_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) return false;
  close(fd);
  if (geteuid() == 0) {
    // permission bits do not stop root
    immutable_ = SetImmutable(locked_, true);
    return immutable_;
  }
  return chmod(sub.c_str(), 0500) == 0;
}

RemovalBlocker::~RemovalBlocker() {
  if (dir_.empty()) return;
  if (immutable_) SetImmutable(locked_, false);
  std::error_code ec;
  if (!locked_.empty()) fs::permissions(locked_.parent_path(), fs::perms::owner_all, ec);
  fs::remove_all(dir_, ec);
}
