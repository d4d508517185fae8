#include "paths.h"

fs::path kWorkspaceRoot = "/tmp/scriptbox";

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline std::string ScriptExtension(Interpreter lang) {
  switch (lang) {
    case Interpreter::POWERSHELL: return ".ps1";
    case Interpreter::POSIX_SH: return ".sh";
    case Interpreter::PYTHON3: return ".py";
  }
  __builtin_unreachable();
}

} // namespace

std::string WorkspaceTemplate(long execution_id) {
  return kWorkspaceRoot / ("exec_" + PadInt(execution_id, 6) + "_XXXXXX");
}

fs::path WorkspaceScript(const fs::path& workspace, Interpreter lang) {
  return workspace / ("script" + ScriptExtension(lang));
}

fs::path WorkspaceRunner(const fs::path& workspace, Interpreter lang) {
  switch (lang) {
    case Interpreter::POWERSHELL: return workspace / "runner.ps1";
    case Interpreter::POSIX_SH: return {};
    case Interpreter::PYTHON3: return workspace / "runner.py";
  }
  __builtin_unreachable();
}
