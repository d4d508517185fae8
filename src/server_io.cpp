#include "server_io.h"

#include <time.h>
#include <cmath>
#include <algorithm>
#include <chrono>
#include <climits>

#include <httplib.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <scriptbox/utils.h>
#include "http_utils.h"

std::string kListenHost = "0.0.0.0";
int kPort = 5001;
std::string kApiKey = "";
int kMaxParallel = 4;
size_t kMaxQueue = 32;
size_t kMaxPayload = 50;

namespace {

const char kTokenHeader[] = "X-Executor-Token";

httplib::Server server;

std::string ISOTimestamp() {
  auto now = std::chrono::system_clock::now();
  time_t secs = std::chrono::system_clock::to_time_t(now);
  long ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count() % 1000;
  struct tm tm_buf;
  gmtime_r(&secs, &tm_buf);
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms);
}

// String(value) for the scalar JSON types; false for objects and arrays
bool StringifyScalar(const nlohmann::ordered_json& val, std::string& out) {
  if (val.is_string()) {
    out = val.get<std::string>();
  } else if (val.is_boolean()) {
    out = val.get<bool>() ? "true" : "false";
  } else if (val.is_null()) {
    out = "null";
  } else if (val.is_number()) {
    out = val.dump();
  } else {
    return false;
  }
  return true;
}

bool Authenticate(const httplib::Request& req) {
  if (kApiKey.empty()) return true;
  if (!req.has_header(kTokenHeader)) return false;
  return http_utils::TokenEquals(req.get_header_value(kTokenHeader), kApiKey);
}

void HandleHealth(const httplib::Request&, httplib::Response& res) {
  ReplyJSON(res, 200, {{"status", "ok"}, {"timestamp", ISOTimestamp()}});
}

void HandleExecute(const httplib::Request& req, httplib::Response& res) {
  if (!Authenticate(req)) {
    spdlog::warn("Authentication failed for {}: invalid or missing API key", req.remote_addr);
    ReplyError(res, 401, "Unauthorized");
    return;
  }
  ExecutionRequest exec_req;
  std::string error;
  if (!ParseExecuteRequest(req.body, exec_req, error)) {
    spdlog::info("Rejected request from {}: {}", req.remote_addr, error);
    ClassifyInput in;
    in.validation_error = error;
    ExecutionResult result = Classify(in);
    ReplyJSON(res, ResultStatusHttp(result.status), ResultToJSON(result));
    return;
  }
  ExecutionResult result = Execute(exec_req);
  ReplyJSON(res, ResultStatusHttp(result.status), ResultToJSON(result));
}

} // namespace

bool ParseExecuteRequest(const std::string& body, ExecutionRequest& req, std::string& error) {
  nlohmann::ordered_json data;
  try {
    data = nlohmann::ordered_json::parse(body);
  } catch (nlohmann::json::exception& err) {
    error = std::string("Malformed JSON body: ") + err.what();
    return false;
  }
  if (!data.is_object()) {
    error = "Request body must be a JSON object";
    return false;
  }
  // missing and empty content are both left to the validator
  if (auto it = data.find("scriptContent"); it != data.end() && !it->is_null()) {
    if (!it->is_string()) {
      error = "scriptContent must be a string";
      return false;
    }
    req.script_content = it->get<std::string>();
  }
  if (auto it = data.find("timeoutSeconds"); it != data.end() && !it->is_null()) {
    if (it->is_number_integer()) {
      // unsigned values above INT_MAX and negative ones go through as out of range
      long long val = it->is_number_unsigned() ?
          (long long)std::min<uint64_t>(it->get<uint64_t>(), (uint64_t)LLONG_MAX) : it->get<long long>();
      req.timeout_seconds = (int)std::clamp<long long>(val, INT_MIN, INT_MAX);
    } else if (it->is_number_float() && std::trunc(it->get<double>()) == it->get<double>() &&
               std::fabs(it->get<double>()) < 1e9) {
      req.timeout_seconds = (int)it->get<double>();
    } else {
      error = "timeoutSeconds must be an integer";
      return false;
    }
  }
  if (auto it = data.find("parameters"); it != data.end() && !it->is_null()) {
    if (!it->is_object()) {
      error = "parameters must be an object";
      return false;
    }
    for (auto& [name, val] : it->items()) {
      std::string str;
      if (!StringifyScalar(val, str)) {
        error = "Parameter " + name + " must be a string, number, boolean or null";
        return false;
      }
      req.parameters.emplace_back(name, std::move(str));
    }
  }
  return true;
}

nlohmann::json ResultToJSON(const ExecutionResult& result) {
  double elapsed = std::round(result.elapsed_seconds * 1000) / 1000;
  nlohmann::json ret = {
    {"status", ResultStatusName(result.status)},
    {"resultCode", result.result_code},
    {"stdout", result.stdout_text},
    {"stderr", result.stderr_text},
    {"elapsedSeconds", elapsed},
    {"executionTimeSeconds", elapsed},
    {"outputTruncated", result.output_truncated},
  };
  if (result.exit_code) ret["exitCode"] = *result.exit_code;
  if (result.message.size()) {
    ret["message"] = result.message;
    if (result.status != ResultStatus::SUCCESS) ret["error"] = result.message;
  }
  if (result.findings.size()) {
    nlohmann::json findings = nlohmann::json::array();
    for (auto& i : result.findings) {
      findings.push_back({
        {"patternId", i.pattern_id},
        {"description", i.description},
        {"severity", SeverityName(i.severity)},
        {"category", RuleCategoryName(i.category)},
        {"cwe", i.cwe},
        {"lineNumber", i.line_number},
        {"line", i.line},
      });
    }
    ret["findings"] = std::move(findings);
  }
  return ret;
}

void SetupServer(httplib::Server& svr) {
  svr.new_task_queue = [] {
    return new httplib::ThreadPool(kMaxParallel, kMaxQueue);
  };
  svr.set_payload_max_length(kMaxPayload * 1024 * 1024);
  svr.set_default_headers({
    {"X-Content-Type-Options", "nosniff"},
    {"X-Frame-Options", "SAMEORIGIN"},
    {"X-DNS-Prefetch-Control", "off"},
    {"X-Download-Options", "noopen"},
    {"X-Permitted-Cross-Domain-Policies", "none"},
    {"X-XSS-Protection", "0"},
    {"Referrer-Policy", "no-referrer"},
    {"Strict-Transport-Security", "max-age=15552000; includeSubDomains"},
    {"Content-Security-Policy", "default-src 'none'; frame-ancestors 'self'"},
    {"Cross-Origin-Resource-Policy", "same-origin"},
  });
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    auto level = res.status < 500 ? spdlog::level::info : spdlog::level::warn;
    spdlog::log(level, "{}", http_utils::AccessLogLine(req, res));
  });
  svr.Get("/health", HandleHealth);
  svr.Post("/execute", HandleExecute);
}

bool ServerWorkLoop() {
  SetupServer(server);
  if (kApiKey.empty()) {
    spdlog::warn("No API key configured; POST /execute accepts unauthenticated requests");
  }
  spdlog::info("Listening on {}:{} with {} workers, queue {}", kListenHost, kPort, kMaxParallel, kMaxQueue);
  if (!server.listen(kListenHost, kPort)) {
    spdlog::error("Failed to listen on {}:{}", kListenHost, kPort);
    return false;
  }
  spdlog::info("Server stopped");
  return true;
}

void StopServer() {
  server.stop();
}
