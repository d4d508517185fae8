#include <signal.h>
#include <cstdlib>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <scriptbox/paths.h>
#include <scriptbox/logger.h>
#include <scriptbox/execution.h>

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    InitLogger();
    signal(SIGPIPE, SIG_IGN);
    // the tests run scripts with sh, which is present everywhere
    kInterpreter = Interpreter::POSIX_SH;
    kKillGraceMs = 300;
    char tmpl[] = "/tmp/scriptbox-test-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    kWorkspaceRoot = fs::path(tmpl) / "ws";
  }
  void TearDown() override {
    fs::remove_all(kWorkspaceRoot.parent_path());
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
