#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  if (str.size() > 64) return fmt::format("({} bytes)", str.size());
  return str;
}
std::string FormatOneParam(const httplib::Headers& headers) {
  // header values may carry the API token
  std::vector<std::string> names;
  for (auto& i : headers) names.push_back(i.first);
  return fmt::format("headers {}", names);
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

std::string AccessLogLine(const httplib::Request& req, const httplib::Response& res) {
  return fmt::format("{}:{} \"{} {} {}\" {} {} \"{}\"", req.remote_addr, req.remote_port,
      req.method, req.path, req.version, res.status, res.body.size(),
      req.get_header_value("User-Agent"));
}

bool TokenEquals(const std::string& provided, const std::string& expected) {
  if (provided.size() != expected.size()) return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < expected.size(); i++) diff |= provided[i] ^ expected[i];
  return diff == 0;
}

} // namespace http_utils

void ReplyJSON(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

void ReplyError(httplib::Response& res, int status, const std::string& message) {
  ReplyJSON(res, status, {{"status", "failed"}, {"error", message}});
}
