#include <thread>
#include <chrono>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "http_utils.h"
#include "server_io.h"
#include "utils.h"

namespace {

class ServerTest : public testing::Test {
 protected:
  httplib::Server svr;
  std::thread thread;
  int port = -1;
  ConfigGuard guard;

  void SetUp() override {
    kApiKey = "";
    SetupServer(svr);
    port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this]() { svr.listen_after_bind(); });
    for (int i = 0; i < 200 && !svr.is_running(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(svr.is_running());
  }
  void TearDown() override {
    svr.stop();
    if (thread.joinable()) thread.join();
    kApiKey = "";
  }

  httplib::Result Post(const nlohmann::json& body, const httplib::Headers& headers = {}) {
    httplib::Client cli("127.0.0.1", port);
    cli.set_read_timeout(30, 0);
    return HTTPRequest<HTTPPost>(cli, "/execute", headers, body.dump(), "application/json");
  }
};

} // namespace

TEST_F(ServerTest, Health) {
  httplib::Client cli("127.0.0.1", port);
  auto res = HTTPRequest<HTTPGet>(cli, "/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_TRUE(body["timestamp"].is_string());
  EXPECT_EQ(res->get_header_value("X-Content-Type-Options"), "nosniff");
}

TEST_F(ServerTest, Success) {
  auto res = Post({{"scriptContent", "echo hello"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "success");
  EXPECT_EQ(body["exitCode"], 0);
  EXPECT_EQ(body["resultCode"], 0);
  EXPECT_EQ(body["stdout"], "hello\n");
  EXPECT_EQ(body["stderr"], "");
  EXPECT_TRUE(body["elapsedSeconds"].is_number());
  EXPECT_EQ(body["outputTruncated"], false);
}

TEST_F(ServerTest, ScriptError) {
  auto res = Post({{"scriptContent", "exit 3"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "script_error");
  EXPECT_EQ(body["exitCode"], 3);
}

TEST_F(ServerTest, Timeout) {
  auto res = Post({{"scriptContent", "while :; do :; done"}, {"timeoutSeconds", 1}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 408);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "timeout");
  EXPECT_EQ(body["resultCode"], 124);
  EXPECT_FALSE(body.contains("exitCode"));
}

TEST_F(ServerTest, SecurityViolation) {
  auto res = Post({{"scriptContent", "[Net.ServicePointManager]::ServerCertificateValidationCallback = {$true}"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 403);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "security_violation");
  ASSERT_TRUE(body["findings"].is_array());
  EXPECT_EQ(body["findings"][0]["patternId"], "NET-001");
  EXPECT_EQ(body["findings"][0]["severity"], "high");
  EXPECT_EQ(body["findings"][0]["lineNumber"], 1);
}

TEST_F(ServerTest, InvalidParameter) {
  auto res = Post({{"scriptContent", "echo hi"}, {"parameters", {{"bad name", "x"}}}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "validation_error");
  EXPECT_EQ(body["resultCode"], 126);
}

TEST_F(ServerTest, MissingScript) {
  auto res = Post({{"timeoutSeconds", 5}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(nlohmann::json::parse(res->body)["resultCode"], 126);
}

TEST_F(ServerTest, MalformedJSON) {
  httplib::Client cli("127.0.0.1", port);
  const std::string body_text = "{\"scriptContent\": ", content_type = "application/json";
  auto res = HTTPRequest<HTTPPost>(cli, "/execute", body_text, content_type);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "validation_error");
  EXPECT_EQ(body["resultCode"], 126);
  EXPECT_TRUE(body["elapsedSeconds"].is_number());
  EXPECT_FALSE(body.contains("exitCode"));
  EXPECT_TRUE(body["error"].is_string());
}

TEST_F(ServerTest, NestedParameterValue) {
  auto res = Post({{"scriptContent", "echo hi"}, {"parameters", {{"a", {{"b", 1}}}}}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "validation_error");
  EXPECT_EQ(body["resultCode"], 126);
  EXPECT_EQ(body["stdout"], "");
}

TEST_F(ServerTest, NonIntegerTimeout) {
  auto res = Post({{"scriptContent", "echo hi"}, {"timeoutSeconds", "soon"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  auto body = nlohmann::json::parse(res->body);
  EXPECT_EQ(body["status"], "validation_error");
  EXPECT_EQ(body["resultCode"], 126);
}

TEST_F(ServerTest, ScalarParameters) {
  auto res = Post({
    {"scriptContent", "cat"},
    {"parameters", {{"n", 5}, {"flag", true}}},
  });
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto stdin_payload = nlohmann::json::parse(nlohmann::json::parse(res->body)["stdout"].get<std::string>());
  EXPECT_EQ(stdin_payload["n"], "5");
  EXPECT_EQ(stdin_payload["flag"], "true");
}

TEST_F(ServerTest, LaunchFailure) {
  kInterpreterPath = "/nonexistent/sh";
  auto res = Post({{"scriptContent", "exit 0"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "launch_failure");
}

TEST_F(ServerTest, Authentication) {
  kApiKey = "s3cret";
  auto res = Post({{"scriptContent", "exit 0"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);
  res = Post({{"scriptContent", "exit 0"}}, {{"X-Executor-Token", "wrong"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);
  res = Post({{"scriptContent", "exit 0"}}, {{"x-executor-token", "s3cret"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  httplib::Client cli("127.0.0.1", port);
  auto health = HTTPRequest<HTTPGet>(cli, "/health");
  ASSERT_TRUE(health);
  EXPECT_EQ(health->status, 200);
}

TEST(ParseRequestTest, Fields) {
  ExecutionRequest req;
  std::string error;
  ASSERT_TRUE(ParseExecuteRequest(R"({"scriptContent":"x","timeoutSeconds":7,
      "parameters":{"z":"1","a":2.5,"n":null,"b":false}})", req, error));
  EXPECT_EQ(req.script_content, "x");
  EXPECT_EQ(req.timeout_seconds, 7);
  ParameterList expected = {{"z", "1"}, {"a", "2.5"}, {"n", "null"}, {"b", "false"}};
  EXPECT_EQ(req.parameters, expected);
}

TEST(ParseRequestTest, Defaults) {
  ExecutionRequest req;
  std::string error;
  ASSERT_TRUE(ParseExecuteRequest(R"({"scriptContent":"x"})", req, error));
  EXPECT_EQ(req.timeout_seconds, kDefaultTimeoutSeconds);
  EXPECT_TRUE(req.parameters.empty());
}

TEST(ParseRequestTest, Rejects) {
  for (const char* body : {
      "[]",
      R"({"scriptContent":5})",
      R"({"scriptContent":"x","timeoutSeconds":"10"})",
      R"({"scriptContent":"x","timeoutSeconds":1.5})",
      R"({"scriptContent":"x","parameters":[1]})",
      R"({"scriptContent":"x","parameters":{"a":{"b":1}}})",
      "not json"}) {
    ExecutionRequest req;
    std::string error;
    EXPECT_FALSE(ParseExecuteRequest(body, req, error)) << body;
    EXPECT_FALSE(error.empty());
  }
}

TEST(ParseRequestTest, OutOfRangeTimeoutLeftToValidator) {
  ExecutionRequest req;
  std::string error;
  ASSERT_TRUE(ParseExecuteRequest(R"({"scriptContent":"x","timeoutSeconds":99999999999})", req, error));
  EXPECT_GT(req.timeout_seconds, kMaxTimeoutSeconds);
}

TEST(ResultJSONTest, Timeout) {
  ExecutionResult res;
  res.status = ResultStatus::TIMEOUT;
  res.result_code = 124;
  res.elapsed_seconds = 1.23456;
  res.message = "Script execution timed out";
  auto body = ResultToJSON(res);
  EXPECT_FALSE(body.contains("exitCode"));
  EXPECT_EQ(body["status"], "timeout");
  EXPECT_DOUBLE_EQ(body["elapsedSeconds"].get<double>(), 1.235);
  EXPECT_EQ(body["error"], "Script execution timed out");
  EXPECT_FALSE(body.contains("findings"));
}

TEST(HTTPUtilsTest, TokenEquals) {
  EXPECT_TRUE(http_utils::TokenEquals("abc", "abc"));
  EXPECT_FALSE(http_utils::TokenEquals("abd", "abc"));
  EXPECT_FALSE(http_utils::TokenEquals("ab", "abc"));
  EXPECT_FALSE(http_utils::TokenEquals("", "abc"));
}
