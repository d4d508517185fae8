#include <signal.h>
#include <unistd.h>
#include <pthread.h>
#include <cstdlib>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <scriptbox/logger.h>
#include <scriptbox/paths.h>
#include <scriptbox/utils.h>
#include <scriptbox/execution.h>
#include "server_io.h"

namespace {

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) {
    // the configuration file is optional; built-in defaults apply
    spdlog::info("Configuration file {} not found, using defaults", conf_path.c_str());
    return true;
  }
  tortellini::ini ini;
  fin >> ini;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  std::string interpreter = ini[""]["interpreter"] | "";
  if (interpreter.size() && !GetInterpreter(interpreter, kInterpreter)) {
    spdlog::error("Unknown interpreter {}", interpreter);
    return false;
  }
  std::string severity = ini[""]["blocking_severity"] | "";
  if (severity.size() && !GetSeverity(severity, kBlockingSeverity)) {
    spdlog::error("Unknown severity {}", severity);
    return false;
  }
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kPort = ini[""]["port"] | kPort;
  kApiKey = ini[""]["api_key"] | kApiKey;
  kInterpreterPath = ini[""]["interpreter_path"] | kInterpreterPath;
  kConstrainedMode = ini[""]["constrained_mode"] | kConstrainedMode;
  kDefaultTimeoutSeconds = ini[""]["default_timeout_seconds"] | kDefaultTimeoutSeconds;
  kMaxTimeoutSeconds = ini[""]["max_timeout_seconds"] | kMaxTimeoutSeconds;
  kKillGraceMs = ini[""]["kill_grace_ms"] | kKillGraceMs;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  kMaxPayload = ini[""]["max_payload_mib"] | kMaxPayload;
  kMaxVSS = (ini[""]["max_vss_mib"] | (kMaxVSS / 1024)) * 1024;
  kMaxFileSize = (ini[""]["max_file_size_mib"] | (kMaxFileSize / 1024)) * 1024;
  kMaxOpenFiles = ini[""]["max_open_files"] | kMaxOpenFiles;
  kSandboxUid = ini[""]["sandbox_uid"] | kSandboxUid;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxQueue = ini[""]["max_queue"] | kMaxQueue;
  return true;
}

// deployment environment variables; they override the file
bool ParseEnvironment() {
  if (const char* port = getenv("EXECUTOR_API_PORT"); port && *port) {
    char* end;
    long val = strtol(port, &end, 10);
    if (*end || val <= 0 || val > 65535) {
      spdlog::error("Invalid EXECUTOR_API_PORT {}", port);
      return false;
    }
    kPort = val;
  }
  if (const char* key = getenv("EXECUTOR_API_KEY")) kApiKey = key;
  if (const char* sandbox = getenv("USE_POWERSHELL_SANDBOX")) {
    kConstrainedMode = std::string(sandbox) != "false";
  }
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "scriptbox-server");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/scriptbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("--interpreter")
    .default_value(std::string(""))
    .help("Interpreter to run scripts with (pwsh, sh or python3)");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (!ParseEnvironment()) exit(1);
  if (auto val = parser.present<int>("--port")) {
    kPort = val.value();
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto name = parser.get<std::string>("--interpreter"); name.size()) {
    if (!GetInterpreter(name, kInterpreter)) {
      spdlog::error("Unknown interpreter {}", name);
      exit(1);
    }
  }
  if (kMaxParallel <= 0 || kDefaultTimeoutSeconds <= 0 ||
      kDefaultTimeoutSeconds > kMaxTimeoutSeconds || kKillGraceMs < 0) {
    spdlog::error("Invalid limits in configuration");
    exit(1);
  }
}

// SIGINT/SIGTERM are blocked in every thread and consumed here
void SignalLoop(sigset_t set) {
  int sig;
  if (sigwait(&set, &sig) == 0) {
    spdlog::info("Received signal {}, stopping", sig);
    StopServer();
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  // child output pipes may close under a write
  signal(SIGPIPE, SIG_IGN);
  ParseArgs(argc, argv);
  if (geteuid() != 0 && kSandboxUid >= 0) {
    spdlog::error("sandbox_uid requires running as root.");
    return 1;
  }
  spdlog::info("Executing {} scripts, constrained mode {}", InterpreterName(kInterpreter),
      kConstrainedMode ? "on" : "off");

  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  std::thread signal_thread(SignalLoop, set);
  signal_thread.detach();
  return ServerWorkLoop() ? 0 : 1;
}
