#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <filesystem>
#include <gtest/gtest.h>
#include <scriptbox/utils.h>
#include <scriptbox/execution.h>

// Collects everything the pipeline reports about one execution
class ExecutionRecorder {
 public:
  std::vector<ExecutionState> states;
  std::vector<int> pids;
  std::string workspace;
  std::vector<PolicyFinding> findings;
  int finished = 0;

  ExecutionHooks GetHooks();
  size_t SpawnCount() const { return pids.size(); }
  bool WorkspaceRemoved() const;
};

// Restores the engine settings a test changes
class ConfigGuard {
  Interpreter interpreter_;
  std::string interpreter_path_;
  bool constrained_;
  long max_output_;
  int max_timeout_;
  long kill_grace_;
  Severity blocking_;
  std::shared_ptr<const Policy> policy_;
 public:
  ConfigGuard();
  ~ConfigGuard();
};

// Makes a directory impossible to remove by plugging an undeletable entry
//   into it: an immutable file as root, a read-only subdirectory otherwise.
// Everything is unlocked and removed again on destruction.
class RemovalBlocker {
  std::filesystem::path dir_;
  std::filesystem::path locked_;
  bool immutable_ = false;
 public:
  RemovalBlocker() = default;
  ~RemovalBlocker();
  RemovalBlocker(const RemovalBlocker&) = delete;
  RemovalBlocker& operator=(const RemovalBlocker&) = delete;

  // false if this environment cannot make the entry undeletable
  bool Block(const std::filesystem::path& dir);
};

ExecutionRequest MakeRequest(const std::string& script, const ParameterList& params = {},
                             int timeout_seconds = 10);

// entries currently under the workspace root
size_t WorkspaceCount();

#endif // TEST_UTILS_H_
