#ifndef INCLUDE_SCRIPTBOX_EXECUTION_H_
#define INCLUDE_SCRIPTBOX_EXECUTION_H_

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <functional>

#include <scriptbox/policy.h>

extern int kDefaultTimeoutSeconds;
extern int kMaxTimeoutSeconds;
// ms between SIGTERM and SIGKILL after the deadline
extern long kKillGraceMs;
// KiB per captured stream
extern long kMaxOutput;
// KiB; 0 = no limit
extern long kMaxVSS;
extern long kMaxFileSize;
extern int kMaxOpenFiles;
// -1 = run as the server's own uid
extern int kSandboxUid;
extern bool kConstrainedMode;

#define ENUM_INTERPRETER_ \
  X(POWERSHELL, "pwsh") \
  X(POSIX_SH, "sh") \
  X(PYTHON3, "python3")
enum class Interpreter {
#define X(name, progname) name,
  ENUM_INTERPRETER_
#undef X
};

extern Interpreter kInterpreter;
// empty = look up the interpreter's program name in PATH
extern std::string kInterpreterPath;

// name, sentinel result code, HTTP status
#define ENUM_RESULT_STATUS_ \
  X(SUCCESS, "success", 0, 200) \
  X(SCRIPT_ERROR, "script_error", -1, 200) /* the script's own exit code */ \
  X(SECURITY_VIOLATION, "security_violation", 125, 403) \
  X(TIMEOUT, "timeout", 124, 408) \
  X(LAUNCH_FAILURE, "launch_failure", 127, 500) \
  X(VALIDATION_ERROR, "validation_error", 126, 400)
enum class ResultStatus {
#define X(name, str, code, http) name,
  ENUM_RESULT_STATUS_
#undef X
};

#define ENUM_EXECUTION_STATE_ \
  X(PENDING) \
  X(LAUNCHING) \
  X(RUNNING) \
  X(COMPLETED) \
  X(TIMED_OUT) \
  X(LAUNCH_FAILED)
enum class ExecutionState {
#define X(name) name,
  ENUM_EXECUTION_STATE_
#undef X
};

// ordered; caller order is kept in the encoded payload
using ParameterList = std::vector<std::pair<std::string, std::string>>;

struct ExecutionRequest {
  std::string script_content;
  ParameterList parameters;
  int timeout_seconds;

  ExecutionRequest() : timeout_seconds(kDefaultTimeoutSeconds) {}
};

struct ExecutionOutcome {
  ExecutionState state;
  std::optional<int> exit_code; // absent if the process never completed
  int term_signal; // 0 if exited normally
  std::string stdout_text, stderr_text;
  bool output_truncated;
  bool timed_out;
  std::optional<std::string> launch_error;
  double elapsed_seconds;

  ExecutionOutcome() :
      state(ExecutionState::PENDING), term_signal(0), output_truncated(false),
      timed_out(false), elapsed_seconds(0) {}
};

struct ExecutionResult {
  ResultStatus status;
  std::optional<int> exit_code;
  int result_code;
  std::string stdout_text, stderr_text;
  bool output_truncated;
  double elapsed_seconds;
  std::string message;
  std::vector<PolicyFinding> findings;

  ExecutionResult() :
      status(ResultStatus::SUCCESS), result_code(0), output_truncated(false),
      elapsed_seconds(0) {}
};

// Everything the classifier looks at. Fields left empty mean the stage was
// not reached or passed.
struct ClassifyInput {
  std::optional<std::string> validation_error;
  std::vector<PolicyFinding> findings;
  Severity blocking_severity = Severity::HIGH;
  std::optional<ExecutionOutcome> outcome;
  double elapsed_seconds = 0; // used when outcome is absent
};

// Pure. Priority: validation error > blocking finding > launch failure >
//   timeout > non-zero exit > success
ExecutionResult Classify(const ClassifyInput&);

// Observation points for one execution; all optional, called on the executing thread
struct ExecutionHooks {
  std::function<void(long execution_id, const std::string& workspace_path)> ReportStaged;
  std::function<void(long execution_id, const std::vector<PolicyFinding>&)> ReportFindings;
  std::function<void(long execution_id, ExecutionState)> ReportState;
  std::function<void(long execution_id, int pid)> ReportSpawned;
  std::function<void(long execution_id, const ExecutionResult&)> ReportFinished;
};

// Runs the whole pipeline: stage, screen, marshal, launch, supervise, classify, release.
// Never throws; every failure is expressed through the returned status.
ExecutionResult Execute(const ExecutionRequest&, const ExecutionHooks& = {});

// The policy used by Execute; defaults to the built-in catalog
void SetExecutionPolicy(std::shared_ptr<const Policy>);
std::shared_ptr<const Policy> GetExecutionPolicy();

#endif  // INCLUDE_SCRIPTBOX_EXECUTION_H_
