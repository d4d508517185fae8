#include <scriptbox/params.h>

#include <unordered_set>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

const char kParamEnvPrefix[] = "SCRIPTBOX_PARAM_";

namespace {

inline bool IsIdentStart(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}
inline bool IsIdentChar(char c) {
  return IsIdentStart(c) || (c >= '0' && c <= '9');
}

} // namespace

// ^[A-Za-z_][A-Za-z0-9_]*$
bool IsValidParameterName(const std::string& name) {
  if (name.empty() || !IsIdentStart(name[0])) return false;
  for (char c : name) {
    if (!IsIdentChar(c)) return false;
  }
  return true;
}

bool MarshalParameters(const ParameterList& params, EncodedArguments& out, std::string& error) {
  nlohmann::ordered_json payload = nlohmann::ordered_json::object();
  std::vector<std::string> env;
  std::unordered_set<std::string> seen;
  for (auto& [name, value] : params) {
    if (!IsValidParameterName(name)) {
      error = "Invalid parameter name: " + name +
          ". Parameter names must contain only letters, numbers, and underscores.";
      return false;
    }
    if (!seen.insert(name).second) {
      error = "Duplicate parameter name: " + name;
      return false;
    }
    // values are arbitrary bytes: no character of them is ever interpreted by the launcher
    if (value.find('\0') != std::string::npos) {
      error = "Parameter " + name + " contains a NUL byte";
      return false;
    }
    payload[name] = value;
    env.push_back(kParamEnvPrefix + name + '=' + value);
  }
  try {
    out.payload = payload.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::strict);
  } catch (nlohmann::json::exception& err) {
    // invalid UTF-8 in a value
    error = std::string("Parameters cannot be encoded: ") + err.what();
    return false;
  }
  out.env_bindings = std::move(env);
  out.count = params.size();
  spdlog::debug("Marshalled {} parameters, payload {} bytes", out.count, out.payload.size());
  return true;
}
