#ifndef INCLUDE_SCRIPTBOX_UTILS_H_
#define INCLUDE_SCRIPTBOX_UTILS_H_

#include <string>

#include "policy.h"
#include "execution.h"

long GetUniqueExecutionId();

const char* ResultStatusName(ResultStatus);
// sentinel code of the status; SCRIPT_ERROR has none (-1)
int ResultStatusCode(ResultStatus);
int ResultStatusHttp(ResultStatus);

const char* InterpreterName(Interpreter);
// false if unknown
bool GetInterpreter(const std::string&, Interpreter&);

const char* SeverityName(Severity);
bool GetSeverity(const std::string&, Severity&);
const char* RuleCategoryName(RuleCategory);

// logging
const char* ExecutionStateName(ExecutionState);

#endif  // INCLUDE_SCRIPTBOX_UTILS_H_
