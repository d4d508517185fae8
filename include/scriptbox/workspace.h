#ifndef INCLUDE_SCRIPTBOX_WORKSPACE_H_
#define INCLUDE_SCRIPTBOX_WORKSPACE_H_

#include <string>
#include <filesystem>

#include "execution.h"

// RAII workspace: one private directory holding the script (and the launcher's
//   runner file, if the interpreter needs one) for exactly one execution.
// The directory is removed when the object is destroyed, whatever path the
//   execution took out of its scope.
class Workspace {
  long execution_id_;
  std::string id_;
  std::filesystem::path path_;
  Interpreter lang_;
 public:
  explicit Workspace(long execution_id = 0) : execution_id_(execution_id), lang_(kInterpreter) {}
  ~Workspace() { Release(); }
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  // Creates the directory and writes the script; false on any I/O error
  //   (nothing is left on disk in that case). Only valid once per object.
  bool Stage(const std::string& script_content, Interpreter lang = kInterpreter);
  // Best-effort and idempotent; failures are logged, never reported
  void Release();

  bool Staged() const { return !path_.empty(); }
  long ExecutionId() const { return execution_id_; }
  const std::string& Id() const { return id_; }
  const std::filesystem::path& Path() const { return path_; }
  Interpreter Lang() const { return lang_; }
  std::filesystem::path ScriptPath() const;
  std::filesystem::path RunnerPath() const;
};

#endif  // INCLUDE_SCRIPTBOX_WORKSPACE_H_
