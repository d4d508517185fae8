#include <scriptbox/policy.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <scriptbox/utils.h>

Severity kBlockingSeverity = Severity::HIGH;

namespace {

// longer lines are not matched at all; they are reported instead (fail closed)
constexpr size_t kMaxScreenedLine = 8192;
constexpr size_t kMaxReportedLine = 200;

std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t\r\v\f");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t\r\v\f");
  std::string ret = str.substr(l, r - l + 1);
  if (ret.size() > kMaxReportedLine) ret = ret.substr(0, kMaxReportedLine) + "...";
  return ret;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t pos = text.find('\n', start);
    std::string line = text.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return lines;
}

PolicyFinding MakeFinding(const PatternRule& rule, int line_number, const std::string& line) {
  return {rule.id, rule.description, rule.severity, rule.category, rule.cwe,
          line_number, Trim(line)};
}

} // namespace

bool HasBlockingFinding(const std::vector<PolicyFinding>& findings, Severity threshold) {
  return std::any_of(findings.begin(), findings.end(),
      [threshold](const PolicyFinding& f) { return f.IsBlocking(threshold); });
}

PatternPolicy::PatternPolicy(const std::vector<PatternRule>& rules) {
  rules_.reserve(rules.size());
  for (auto& rule : rules) {
    rules_.push_back({rule, std::regex(rule.pattern,
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize)});
  }
}

std::vector<PolicyFinding> PatternPolicy::Evaluate(const std::string& script_content) const {
  std::vector<PolicyFinding> findings;
  std::vector<std::string> lines = SplitLines(script_content);
  for (size_t i = 0; i < lines.size(); i++) {
    if (lines[i].size() > kMaxScreenedLine) {
      findings.push_back({"SCAN-001", "Line too long to screen", Severity::CRITICAL,
                          RuleCategory::CODE_INJECTION, "", (int)i + 1, Trim(lines[i])});
    }
  }
  for (auto& [rule, regex] : rules_) {
    for (size_t i = 0; i < lines.size(); i++) {
      if (lines[i].size() > kMaxScreenedLine) continue;
      try {
        if (std::regex_search(lines[i], regex)) {
          findings.push_back(MakeFinding(rule, i + 1, lines[i]));
        }
      } catch (std::regex_error& err) {
        // the matcher gave up (complexity/stack); treat the line as hostile
        spdlog::warn("Rule {} failed on line {}: {}", rule.id, i + 1, err.what());
        findings.push_back({"SCAN-002", "Line could not be screened", Severity::CRITICAL,
                            rule.category, "", (int)i + 1, Trim(lines[i])});
      }
    }
  }
  return findings;
}

// Blocked: dynamic evaluation of unvalidated input, certificate validation bypass,
//   credential literals, destructive filesystem operations, execution-policy and
//   privilege downgrades, log/audit suppression.
// Reported only: the lower-severity hygiene rules.
const std::vector<PatternRule>& DefaultRules() {
  static const std::vector<PatternRule> rules = {
    // dynamic code evaluation
    {"INJ-001", R"(Invoke-Expression\s*\(?\s*\$(?!.*Validated))",
     "Unvalidated Invoke-Expression usage", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-78"},
    {"INJ-002", R"(\biex\s*\(?\s*\$(?!.*Validated))",
     "Unvalidated IEX usage (alias for Invoke-Expression)", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-78"},
    {"INJ-003", R"(&\s*\(\s*\$(?!.*Validated))",
     "Unvalidated script block invocation", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-78"},
    {"INJ-004", R"(\|\s*(?:powershell|pwsh)\b)",
     "Potential pipeline command injection", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-78"},
    {"INJ-005", R"(\[ScriptBlock\]::Create\s*\(\s*\$)",
     "Script block created from a variable", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-95"},
    {"INJ-006", R"(\beval\s+["']?\$)",
     "Shell eval of a variable", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-95"},
    {"INJ-007", R"(\|\s*(?:ba|da|z)?sh\b)",
     "Output piped into a shell", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-78"},
    {"INJ-008", R"(\bAdd-Type\b|\[Reflection\.Assembly\]::Load|\bDllImport\b)",
     "Dynamic assembly or native interop loading", Severity::HIGH, RuleCategory::CODE_INJECTION, "CWE-829"},
    // certificate validation bypass
    {"NET-001", R"(ServerCertificateValidationCallback\s*=\s*\{\s*\$true\s*\})",
     "Disabled certificate validation", Severity::HIGH, RuleCategory::INSECURE_TRANSPORT, "CWE-295"},
    {"NET-002", R"(-SkipCertificateCheck\b)",
     "Web request skipping certificate validation", Severity::HIGH, RuleCategory::INSECURE_TRANSPORT, "CWE-295"},
    {"NET-003", R"(TrustAllCertsPolicy|ICertificatePolicy)",
     "Trust-all certificate policy", Severity::HIGH, RuleCategory::INSECURE_TRANSPORT, "CWE-295"},
    {"NET-004", R"(\bcurl\b.*\s(?:-k|--insecure)(?:\s|$))",
     "curl without certificate validation", Severity::HIGH, RuleCategory::INSECURE_TRANSPORT, "CWE-295"},
    {"NET-005", R"(\bwget\b.*--no-check-certificate)",
     "wget without certificate validation", Severity::HIGH, RuleCategory::INSECURE_TRANSPORT, "CWE-295"},
    {"NET-006", R"(Net\.WebClient\.DownloadString|Invoke-WebRequest|Invoke-RestMethod)",
     "Outbound network request", Severity::LOW, RuleCategory::INSECURE_TRANSPORT, "CWE-319"},
    // credential literals
    {"CRED-001", R"(\b(?:password|passwd|pwd|credential|secret|token|api[\s_-]?key|key)\s*=\s*["'][^"'$\s][^"'$]*["'])",
     "Hardcoded credential", Severity::CRITICAL, RuleCategory::CREDENTIAL_EXPOSURE, "CWE-798"},
    {"CRED-002", R"(ConvertTo-SecureString.*AsPlainText)",
     "Plain text conversion to secure string", Severity::CRITICAL, RuleCategory::CREDENTIAL_EXPOSURE, "CWE-798"},
    {"CRED-003", R"(-----BEGIN (?:RSA |EC |DSA |OPENSSH )?PRIVATE KEY-----)",
     "Embedded private key", Severity::CRITICAL, RuleCategory::CREDENTIAL_EXPOSURE, "CWE-798"},
    {"CRED-004", R"(\bAKIA[0-9A-Z]{16}\b)",
     "Embedded cloud access key", Severity::CRITICAL, RuleCategory::CREDENTIAL_EXPOSURE, "CWE-798"},
    // authentication hygiene
    {"AUTH-001", R"(Get-Credential(?!\s+.*prompt))",
     "Get-Credential without explicit prompt", Severity::MEDIUM, RuleCategory::AUTHENTICATION, "CWE-287"},
    {"AUTH-002", R"(PSCredential\s*\(\s*["'][^"']+["']\s*,)",
     "Hardcoded username in PSCredential", Severity::MEDIUM, RuleCategory::AUTHENTICATION, "CWE-287"},
    {"AUTH-003", R"(New-Object\s+System\.Net\.NetworkCredential)",
     "Use of NetworkCredential instead of PSCredential", Severity::MEDIUM, RuleCategory::AUTHENTICATION, "CWE-287"},
    // destructive filesystem operations
    {"FS-001", R"(Remove-Item\s+(?:-\w+\s+)*["']?(?:[A-Z]:\\?|/|~)["']?(?:\s|$))",
     "Recursive removal of a filesystem root", Severity::CRITICAL, RuleCategory::DESTRUCTIVE_FILESYSTEM, "CWE-732"},
    {"FS-002", R"(\brm\s+(?:-[\w-]+\s+)*["']?(?:/|~/?)\*?["']?(?:\s|$))",
     "rm of a filesystem root or home", Severity::CRITICAL, RuleCategory::DESTRUCTIVE_FILESYSTEM, "CWE-732"},
    {"FS-003", R"(\b(?:Format-Volume|Clear-Disk|Initialize-Disk|Remove-Partition)\b)",
     "Disk formatting or partition removal", Severity::CRITICAL, RuleCategory::DESTRUCTIVE_FILESYSTEM, "CWE-732"},
    {"FS-004", R"(\bmkfs(?:\.\w+)?\b|\bdd\b.*\bof=/dev/)",
     "Raw device overwrite", Severity::CRITICAL, RuleCategory::DESTRUCTIVE_FILESYSTEM, "CWE-732"},
    // execution policy & privilege
    {"PRIV-001", R"(Set-ExecutionPolicy\s+(?:-ExecutionPolicy\s+)?(?:Unrestricted|Bypass))",
     "Unrestricted execution policy", Severity::HIGH, RuleCategory::PRIVILEGE_DOWNGRADE, "CWE-1188"},
    {"PRIV-002", R"(-ExecutionPolicy\s+(?:Unrestricted|Bypass))",
     "Nested interpreter with execution policy bypass", Severity::HIGH, RuleCategory::PRIVILEGE_DOWNGRADE, "CWE-1188"},
    {"PRIV-003", R"(LanguageMode\s*=)",
     "Language mode change", Severity::HIGH, RuleCategory::PRIVILEGE_DOWNGRADE, "CWE-1188"},
    {"PRIV-004", R"(Start-Process\b.*-Verb\s+["']?RunAs)",
     "Elevated process start", Severity::HIGH, RuleCategory::PRIVILEGE_DOWNGRADE, "CWE-250"},
    {"PRIV-005", R"(\bsudo\b|\bsu\s+(?:-|root\b))",
     "Privilege escalation through sudo/su", Severity::HIGH, RuleCategory::PRIVILEGE_DOWNGRADE, "CWE-250"},
    {"PRIV-006", R"(\bchmod\s+(?:-\w+\s+)*(?:[ugoa]*\+s|[2467][0-7]{3})\b)",
     "setuid/setgid permission change", Severity::HIGH, RuleCategory::PRIVILEGE_DOWNGRADE, "CWE-250"},
    {"CFG-001", R"(New-SelfSignedCertificate(?!.*NotExportable))",
     "Self-signed certificate without export protection", Severity::MEDIUM, RuleCategory::PRIVILEGE_DOWNGRADE, "CWE-1004"},
    // log & audit suppression
    {"LOG-001", R"(\b(?:Remove-EventLog|Clear-EventLog|Limit-EventLog)\b)",
     "Event log manipulation", Severity::HIGH, RuleCategory::AUDIT_SUPPRESSION, "CWE-778"},
    {"LOG-002", R"(\bwevtutil(?:\.exe)?\s+(?:cl|clear-log)\b)",
     "Event log clearing", Severity::HIGH, RuleCategory::AUDIT_SUPPRESSION, "CWE-778"},
    {"LOG-003", R"(HistorySaveStyle\s+SaveNothing|\bhistory\s+-c\b|\bunset\s+HISTFILE\b|HISTFILE=/dev/null)",
     "Command history suppression", Severity::HIGH, RuleCategory::AUDIT_SUPPRESSION, "CWE-778"},
    {"LOG-004", R"(\bauditctl\s+-D\b|\bsystemctl\s+(?:stop|disable|mask)\s+(?:auditd|rsyslog|systemd-journald)\b)",
     "Audit service suppression", Severity::HIGH, RuleCategory::AUDIT_SUPPRESSION, "CWE-778"},
    {"LOG-005", R"(Out-Null|SilentlyContinue)",
     "Suppressed errors or output", Severity::LOW, RuleCategory::AUDIT_SUPPRESSION, "CWE-778"},
  };
  return rules;
}

std::shared_ptr<const Policy> DefaultPolicy() {
  static const std::shared_ptr<const Policy> policy = std::make_shared<PatternPolicy>(DefaultRules());
  return policy;
}
