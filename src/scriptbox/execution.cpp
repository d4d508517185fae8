#include <scriptbox/execution.h>

#include <mutex>
#include <chrono>

#include <spdlog/spdlog.h>
#include <scriptbox/params.h>
#include <scriptbox/utils.h>
#include <scriptbox/workspace.h>
#include "launcher.h"
#include "sandbox_exec.h"

int kDefaultTimeoutSeconds = 60;
int kMaxTimeoutSeconds = 3600;
long kKillGraceMs = 2000;
long kMaxOutput = 16 * 1024;
long kMaxVSS = 0;
long kMaxFileSize = 256 * 1024;
int kMaxOpenFiles = 4096;
int kSandboxUid = -1;
bool kConstrainedMode = true;
Interpreter kInterpreter = Interpreter::POWERSHELL;
std::string kInterpreterPath;

namespace {

// bytes of each stream kept in a timeout result
constexpr size_t kTimeoutTail = 1024;

std::mutex policy_mtx;
std::shared_ptr<const Policy> execution_policy;

bool KeepTail(std::string& str, size_t len) {
  if (str.size() <= len) return false;
  str.erase(0, str.size() - len);
  return true;
}

std::string FindingIds(const std::vector<PolicyFinding>& findings, Severity threshold) {
  std::string ret;
  for (auto& i : findings) {
    if (!i.IsBlocking(threshold)) continue;
    if (!ret.empty()) ret += ", ";
    ret += i.pattern_id + " (" + i.description + ")";
  }
  return ret;
}

bool IsBlank(const std::string& str) {
  return str.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

void SetExecutionPolicy(std::shared_ptr<const Policy> policy) {
  std::lock_guard lck(policy_mtx);
  execution_policy = std::move(policy);
}

std::shared_ptr<const Policy> GetExecutionPolicy() {
  std::lock_guard lck(policy_mtx);
  if (!execution_policy) execution_policy = DefaultPolicy();
  return execution_policy;
}

ExecutionResult Classify(const ClassifyInput& in) {
  ExecutionResult ret;
  ret.findings = in.findings;
  ret.elapsed_seconds = in.outcome ? in.outcome->elapsed_seconds : in.elapsed_seconds;
  auto set_status = [&](ResultStatus status) {
    ret.status = status;
    ret.result_code = ResultStatusCode(status);
  };

  if (in.validation_error) {
    set_status(ResultStatus::VALIDATION_ERROR);
    ret.message = *in.validation_error;
    return ret;
  }
  if (HasBlockingFinding(in.findings, in.blocking_severity)) {
    set_status(ResultStatus::SECURITY_VIOLATION);
    ret.message = "Script blocked by security policy: " + FindingIds(in.findings, in.blocking_severity);
    return ret;
  }
  if (!in.outcome) {
    set_status(ResultStatus::LAUNCH_FAILURE);
    ret.message = "Script was not launched";
    return ret;
  }
  const ExecutionOutcome& outcome = *in.outcome;
  if (outcome.launch_error || outcome.state == ExecutionState::LAUNCH_FAILED) {
    set_status(ResultStatus::LAUNCH_FAILURE);
    ret.message = outcome.launch_error.value_or("Failed to start the interpreter");
    return ret;
  }
  ret.stdout_text = outcome.stdout_text;
  ret.stderr_text = outcome.stderr_text;
  ret.output_truncated = outcome.output_truncated;
  if (outcome.timed_out) {
    set_status(ResultStatus::TIMEOUT);
    ret.message = "Script execution timed out";
    // evaluate both: no short-circuit
    bool trimmed = KeepTail(ret.stdout_text, kTimeoutTail);
    trimmed = KeepTail(ret.stderr_text, kTimeoutTail) || trimmed;
    if (trimmed) ret.output_truncated = true;
    return ret;
  }
  ret.exit_code = outcome.exit_code;
  if (outcome.exit_code.value_or(0) != 0) {
    ret.status = ResultStatus::SCRIPT_ERROR;
    ret.result_code = *outcome.exit_code;
    ret.message = outcome.term_signal ?
        "Script terminated by signal " + std::to_string(outcome.term_signal) :
        "Script exited with code " + std::to_string(*outcome.exit_code);
    return ret;
  }
  set_status(ResultStatus::SUCCESS);
  return ret;
}

ExecutionResult Execute(const ExecutionRequest& req, const ExecutionHooks& hooks) {
  const long id = GetUniqueExecutionId();
  const auto start = std::chrono::steady_clock::now();
  ClassifyInput in;
  in.blocking_severity = kBlockingSeverity;

  auto report_state = [&](ExecutionState state) {
    spdlog::debug("[{}] State {}", id, ExecutionStateName(state));
    if (hooks.ReportState) hooks.ReportState(id, state);
  };
  auto finish = [&]() {
    in.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    ExecutionResult res = Classify(in);
    spdlog::info("[{}] Finished: status={} result_code={} elapsed={:.3f}s", id,
        ResultStatusName(res.status), res.result_code, res.elapsed_seconds);
    if (hooks.ReportFinished) hooks.ReportFinished(id, res);
    return res;
  };

  spdlog::info("[{}] Accepted: {} bytes of script, {} parameters, timeout {}s", id,
      req.script_content.size(), req.parameters.size(), req.timeout_seconds);
  report_state(ExecutionState::PENDING);
  if (IsBlank(req.script_content)) {
    in.validation_error = "Script content is required";
    return finish();
  }
  if (req.timeout_seconds <= 0 || req.timeout_seconds > kMaxTimeoutSeconds) {
    in.validation_error = "Timeout must be between 1 and " + std::to_string(kMaxTimeoutSeconds) + " seconds";
    return finish();
  }

  Workspace ws(id);
  if (!ws.Stage(req.script_content)) {
    ExecutionOutcome outcome;
    outcome.state = ExecutionState::LAUNCH_FAILED;
    outcome.launch_error = "Failed to prepare the execution workspace";
    in.outcome = std::move(outcome);
    return finish();
  }
  if (hooks.ReportStaged) hooks.ReportStaged(id, ws.Path());

  in.findings = GetExecutionPolicy()->Evaluate(req.script_content);
  for (auto& i : in.findings) {
    auto level = i.IsBlocking(in.blocking_severity) ? spdlog::level::warn : spdlog::level::info;
    spdlog::log(level, "[{}] Policy finding {} ({}) at line {}: {}", id,
        i.pattern_id, SeverityName(i.severity), i.line_number, i.line);
  }
  if (hooks.ReportFindings) hooks.ReportFindings(id, in.findings);

  EncodedArguments args;
  std::string error;
  if (!MarshalParameters(req.parameters, args, error)) {
    spdlog::info("[{}] Rejected parameters: {}", id, error);
    in.validation_error = error;
  }
  if (in.validation_error || HasBlockingFinding(in.findings, in.blocking_severity)) {
    ws.Release();
    return finish();
  }

  SandboxOptions opt;
  if (!BuildLaunchOptions(ws, args, req.timeout_seconds, opt, error)) {
    spdlog::warn("[{}] {}", id, error);
    report_state(ExecutionState::LAUNCHING);
    ExecutionOutcome outcome;
    outcome.state = ExecutionState::LAUNCH_FAILED;
    outcome.launch_error = error;
    report_state(outcome.state);
    in.outcome = std::move(outcome);
    ws.Release();
    return finish();
  }
  SandboxCallbacks cb;
  cb.ReportState = report_state;
  cb.ReportSpawned = [&](int pid) {
    spdlog::info("[{}] Spawned {} as pid {}", id, InterpreterName(ws.Lang()), pid);
    if (hooks.ReportSpawned) hooks.ReportSpawned(id, pid);
  };
  in.outcome = SandboxExec(opt, cb);
  ws.Release();
  return finish();
}
