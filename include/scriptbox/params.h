#ifndef INCLUDE_SCRIPTBOX_PARAMS_H_
#define INCLUDE_SCRIPTBOX_PARAMS_H_

#include <string>
#include <vector>

#include "execution.h"

extern const char kParamEnvPrefix[];

struct EncodedArguments {
  // JSON object, keys in caller order, all values strings; written to the child's stdin
  std::string payload;
  // "SCRIPTBOX_PARAM_<name>=<value>", for interpreters that bind through the environment
  std::vector<std::string> env_bindings;
  size_t count = 0;
};

bool IsValidParameterName(const std::string&);

// Fails on the first invalid or duplicated name; error receives the reason
bool MarshalParameters(const ParameterList&, EncodedArguments& out, std::string& error);

#endif  // INCLUDE_SCRIPTBOX_PARAMS_H_
