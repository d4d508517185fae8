#include <scriptbox/workspace.h>

#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "launcher.h"

bool Workspace::Stage(const std::string& script_content, Interpreter lang) {
  if (Staged()) {
    spdlog::warn("[{}] Workspace {} already staged", execution_id_, path_.c_str());
    return false;
  }
  lang_ = lang;
  if (!CreateDirs(kWorkspaceRoot, kPerm711)) return false;
  std::string tmpl = WorkspaceTemplate(execution_id_);
  // mkdtemp creates the directory exclusively with mode 0700 and a random suffix,
  //   so concurrent executions can neither collide nor predict each other's path
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("[{}] Failed creating workspace from {}: {}", execution_id_, tmpl, strerror(errno));
    return false;
  }
  path_ = tmpl;
  id_ = path_.filename();
  spdlog::info("[{}] Created workspace {}", execution_id_, path_.c_str());

  bool ok = WriteNewFile(ScriptPath(), script_content);
  if (ok) {
    if (auto runner = RunnerPath(); !runner.empty()) ok = WriteNewFile(runner, RunnerScript(lang_));
  }
  if (ok && kSandboxUid >= 0) ok = ChownTree(path_, kSandboxUid, kSandboxUid);
  if (!ok) {
    Release();
    return false;
  }
  spdlog::debug("[{}] Wrote script to {}", execution_id_, ScriptPath().c_str());
  return true;
}

void Workspace::Release() {
  if (path_.empty()) return;
  // cleanup errors are logged, never surfaced
  if (RemoveAll(path_)) {
    spdlog::info("[{}] Cleaned up workspace {}", execution_id_, path_.c_str());
  } else {
    spdlog::warn("[{}] Workspace {} left behind", execution_id_, path_.c_str());
  }
  path_.clear();
}

fs::path Workspace::ScriptPath() const {
  if (path_.empty()) return {};
  return WorkspaceScript(path_, lang_);
}

fs::path Workspace::RunnerPath() const {
  if (path_.empty()) return {};
  return WorkspaceRunner(path_, lang_);
}
