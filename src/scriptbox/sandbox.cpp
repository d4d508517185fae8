#include "sandbox.h"

ExecCtxClass SandboxOptions::ToExecCtx() const {
  ExecCtxClass ret;
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  for (auto& i : envs) ret.env_buf_.push_back(i.data());
  ret.env_buf_.push_back(nullptr);
  return ret;
}
