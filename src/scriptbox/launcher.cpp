#include "launcher.h"

#include <unistd.h>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

namespace {

// Binds the JSON payload on stdin to named script parameters, runs the script
//   inside a job (optionally in ConstrainedLanguage mode) and relays its exit code.
// The job's own timeout is only a backstop: the supervisor's deadline is shorter.
const char kPowerShellRunner[] = R"PS(param(
  [Parameter(Mandatory = $true)][string]$ScriptPath,
  [int]$TimeoutSeconds = 60,
  [switch]$UseConstrainedMode
)
$ErrorActionPreference = 'Stop'
$PSModuleAutoLoadingPreference = 'None'
Import-Module Microsoft.PowerShell.Utility, Microsoft.PowerShell.Management

$arguments = @{}
$payload = [Console]::In.ReadToEnd()
if ($payload) {
  foreach ($p in (ConvertFrom-Json -InputObject $payload).PSObject.Properties) {
    $arguments[$p.Name] = [string]$p.Value
  }
}

$job = Start-Job -ArgumentList $ScriptPath, $arguments, $UseConstrainedMode.IsPresent -ScriptBlock {
  param($Path, $Arguments, $Constrained)
  $PSModuleAutoLoadingPreference = 'None'
  if ($Constrained) {
    $ExecutionContext.SessionState.LanguageMode = 'ConstrainedLanguage'
  }
  $global:LASTEXITCODE = 0
  & $Path @Arguments
  "__SCRIPTBOX_EXIT__=$LASTEXITCODE"
}

if (-not (Wait-Job -Job $job -Timeout $TimeoutSeconds)) {
  Stop-Job -Job $job
  Remove-Job -Job $job -Force
  [Console]::Error.WriteLine("Script exceeded $TimeoutSeconds seconds")
  exit 124
}
$exitCode = 0
$output = @(Receive-Job -Job $job -ErrorAction Continue)
$count = $output.Count
# the marker is trusted only as the last item of a job that ran to its end;
# script output that looks like one is passed through untouched
if ($job.State -ne 'Failed' -and $count -gt 0) {
  $last = $output[$count - 1]
  $parsed = 0
  if ($last -is [string] -and $last.StartsWith('__SCRIPTBOX_EXIT__=') -and
      [int]::TryParse($last.Substring(19), [ref]$parsed)) {
    $exitCode = $parsed
    $count--
  }
}
for ($i = 0; $i -lt $count; $i++) { Write-Output $output[$i] }
if ($job.State -eq 'Failed' -and $exitCode -eq 0) { $exitCode = 1 }
Remove-Job -Job $job -Force
exit $exitCode
)PS";

// Exposes the payload as a dict named `params` and runs the script as __main__
const char kPythonRunner[] = R"PY(import json
import runpy
import sys

payload = sys.stdin.read()
params = json.loads(payload) if payload else {}
script = sys.argv[1]
sys.argv = [script]
runpy.run_path(script, init_globals={"params": params}, run_name="__main__")
)PY";

constexpr char kChildPath[] = "/usr/local/bin:/usr/bin:/bin";

std::vector<std::string> BaseEnvironment(const fs::path& workspace) {
  return {
    std::string("PATH=") + kChildPath,
    "HOME=" + workspace.string(),
    "TMPDIR=" + workspace.string(),
    "LANG=C.UTF-8",
  };
}

} // namespace

const char* RunnerScript(Interpreter lang) {
  switch (lang) {
    case Interpreter::POWERSHELL: return kPowerShellRunner;
    case Interpreter::PYTHON3: return kPythonRunner;
    case Interpreter::POSIX_SH: return nullptr;
  }
  __builtin_unreachable();
}

bool ResolveInterpreter(Interpreter lang, fs::path& out) {
  if (!kInterpreterPath.empty()) {
    out = kInterpreterPath;
    return access(out.c_str(), X_OK) == 0;
  }
  std::string name = InterpreterName(lang);
  const char* env_path = getenv("PATH");
  std::string search = env_path && *env_path ? env_path : kChildPath;
  for (size_t start = 0; start <= search.size();) {
    size_t end = search.find(':', start);
    if (end == std::string::npos) end = search.size();
    if (end > start) {
      fs::path candidate = fs::path(search.substr(start, end - start)) / name;
      if (candidate.is_absolute() && access(candidate.c_str(), X_OK) == 0) {
        out = candidate;
        return true;
      }
    }
    start = end + 1;
  }
  return false;
}

bool BuildLaunchOptions(const Workspace& ws, const EncodedArguments& args,
                        int timeout_seconds, SandboxOptions& opt, std::string& error) {
  fs::path program;
  if (!ResolveInterpreter(ws.Lang(), program)) {
    error = fmt::format("Interpreter {} not found",
        kInterpreterPath.empty() ? InterpreterName(ws.Lang()) : kInterpreterPath);
    return false;
  }
  opt.command.clear();
  opt.envs = BaseEnvironment(ws.Path());
  switch (ws.Lang()) {
    case Interpreter::POWERSHELL:
      opt.command = {
        program, "-NoLogo", "-NoProfile", "-NonInteractive",
        "-ExecutionPolicy", "Bypass",
        "-File", ws.RunnerPath(),
        "-ScriptPath", ws.ScriptPath(),
        "-TimeoutSeconds", std::to_string(timeout_seconds + 1),
      };
      if (kConstrainedMode) opt.command.push_back("-UseConstrainedMode");
      opt.envs.push_back("PSModulePath=");
      opt.envs.push_back("POWERSHELL_TELEMETRY_OPTOUT=1");
      opt.envs.push_back("POWERSHELL_UPDATECHECK=Off");
      opt.envs.push_back("DOTNET_CLI_TELEMETRY_OPTOUT=1");
      break;
    case Interpreter::POSIX_SH:
      opt.command = {program, ws.ScriptPath()};
      opt.envs.insert(opt.envs.end(), args.env_bindings.begin(), args.env_bindings.end());
      break;
    case Interpreter::PYTHON3:
      opt.command = {program, "-I", "-B", ws.RunnerPath(), ws.ScriptPath()};
      opt.envs.push_back("PYTHONIOENCODING=utf-8");
      break;
  }
  opt.workdir = ws.Path();
  opt.input = args.payload;
  opt.wall_time = (long)timeout_seconds * 1'000'000;
  opt.kill_grace = kKillGraceMs * 1000;
  opt.vss = kMaxVSS;
  opt.fsize = kMaxFileSize;
  opt.file_num = kMaxOpenFiles;
  opt.max_output = kMaxOutput;
  if (kSandboxUid >= 0) opt.uid = opt.gid = kSandboxUid;
  spdlog::debug("[{}] Launch command: {}", ws.ExecutionId(), fmt::format("{}", opt.command));
  return true;
}
