#ifndef INCLUDE_SCRIPTBOX_POLICY_H_
#define INCLUDE_SCRIPTBOX_POLICY_H_

#include <regex>
#include <memory>
#include <string>
#include <vector>

// ordered from least to most severe
#define ENUM_SEVERITY_ \
  X(INFO, "info") \
  X(LOW, "low") \
  X(MEDIUM, "medium") \
  X(HIGH, "high") \
  X(CRITICAL, "critical")
enum class Severity {
#define X(name, str) name,
  ENUM_SEVERITY_
#undef X
};

// findings at or above this severity prevent execution
extern Severity kBlockingSeverity;

#define ENUM_RULE_CATEGORY_ \
  X(CODE_INJECTION, "Command Injection") \
  X(INSECURE_TRANSPORT, "Insecure Transport") \
  X(CREDENTIAL_EXPOSURE, "Sensitive Data Exposure") \
  X(DESTRUCTIVE_FILESYSTEM, "Destructive Filesystem Operation") \
  X(PRIVILEGE_DOWNGRADE, "Security Misconfiguration") \
  X(AUDIT_SUPPRESSION, "Insufficient Logging & Monitoring") \
  X(AUTHENTICATION, "Broken Authentication")
enum class RuleCategory {
#define X(name, desc) name,
  ENUM_RULE_CATEGORY_
#undef X
};

struct PolicyFinding {
  std::string pattern_id;
  std::string description;
  Severity severity;
  RuleCategory category;
  std::string cwe;
  int line_number; // 1-based
  std::string line; // trimmed

  bool IsBlocking(Severity threshold = kBlockingSeverity) const {
    return (int)severity >= (int)threshold;
  }
};

bool HasBlockingFinding(const std::vector<PolicyFinding>&, Severity threshold = kBlockingSeverity);

class Policy {
 public:
  virtual ~Policy() = default;
  // must be thread-safe; called concurrently by request workers
  virtual std::vector<PolicyFinding> Evaluate(const std::string& script_content) const = 0;
};

struct PatternRule {
  std::string id;
  std::string pattern; // ECMAScript regex, matched case-insensitively on each line
  std::string description;
  Severity severity;
  RuleCategory category;
  std::string cwe;
};

// Rules are checked in order against every line; each (rule, line) match is one finding.
class PatternPolicy : public Policy {
  struct CompiledRule {
    PatternRule rule;
    std::regex regex;
  };
  std::vector<CompiledRule> rules_;
 public:
  // throws std::regex_error on an invalid pattern
  explicit PatternPolicy(const std::vector<PatternRule>& rules);

  std::vector<PolicyFinding> Evaluate(const std::string& script_content) const override;
  size_t RuleCount() const { return rules_.size(); }
};

const std::vector<PatternRule>& DefaultRules();
std::shared_ptr<const Policy> DefaultPolicy();

#endif  // INCLUDE_SCRIPTBOX_POLICY_H_
