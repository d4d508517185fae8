#include <sys/stat.h>
#include <fstream>
#include <sstream>
#include <scriptbox/paths.h>
#include <scriptbox/workspace.h>

#include "utils.h"

namespace {

std::string ReadFile(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

mode_t Mode(const fs::path& path) {
  struct stat st;
  if (stat(path.c_str(), &st) < 0) return 0;
  return st.st_mode & 07777;
}

} // namespace

TEST(WorkspaceTest, StageAndRelease) {
  fs::path path;
  {
    Workspace ws(GetUniqueExecutionId());
    ASSERT_TRUE(ws.Stage("echo hi\n", Interpreter::POSIX_SH));
    path = ws.Path();
    EXPECT_TRUE(ws.Staged());
    EXPECT_EQ(path.parent_path().string(), kWorkspaceRoot.string());
    EXPECT_EQ(Mode(path), 0700);
    EXPECT_EQ(ReadFile(ws.ScriptPath()), "echo hi\n");
    EXPECT_EQ(Mode(ws.ScriptPath()), 0600);
    EXPECT_EQ(ws.ScriptPath().filename().string(), "script.sh");
    EXPECT_TRUE(ws.RunnerPath().empty());
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST(WorkspaceTest, ReleaseIsIdempotent) {
  Workspace ws(GetUniqueExecutionId());
  ASSERT_TRUE(ws.Stage("exit 0", Interpreter::POSIX_SH));
  fs::path path = ws.Path();
  ws.Release();
  EXPECT_FALSE(fs::exists(path));
  EXPECT_FALSE(ws.Staged());
  ws.Release();
  EXPECT_FALSE(ws.Staged());
}

TEST(WorkspaceTest, DistinctDirectories) {
  long id = GetUniqueExecutionId();
  // same execution id on purpose: the random suffix alone keeps them apart
  Workspace ws1(id), ws2(id);
  ASSERT_TRUE(ws1.Stage("a", Interpreter::POSIX_SH));
  ASSERT_TRUE(ws2.Stage("a", Interpreter::POSIX_SH));
  EXPECT_NE(ws1.Path().string(), ws2.Path().string());
  EXPECT_NE(ws1.Id(), ws2.Id());
}

TEST(WorkspaceTest, StageOnce) {
  Workspace ws(GetUniqueExecutionId());
  ASSERT_TRUE(ws.Stage("a", Interpreter::POSIX_SH));
  fs::path path = ws.Path();
  EXPECT_FALSE(ws.Stage("b", Interpreter::POSIX_SH));
  EXPECT_EQ(ws.Path().string(), path.string());
  EXPECT_EQ(ReadFile(ws.ScriptPath()), "a");
}

TEST(WorkspaceTest, RunnerFiles) {
  Workspace ps(GetUniqueExecutionId()), py(GetUniqueExecutionId());
  ASSERT_TRUE(ps.Stage("Write-Output 1", Interpreter::POWERSHELL));
  ASSERT_TRUE(py.Stage("print(1)", Interpreter::PYTHON3));
  EXPECT_EQ(ps.ScriptPath().filename().string(), "script.ps1");
  EXPECT_EQ(ps.RunnerPath().filename().string(), "runner.ps1");
  EXPECT_NE(ReadFile(ps.RunnerPath()).find("ConstrainedLanguage"), std::string::npos);
  EXPECT_EQ(py.ScriptPath().filename().string(), "script.py");
  EXPECT_EQ(py.RunnerPath().filename().string(), "runner.py");
  EXPECT_NE(ReadFile(py.RunnerPath()).find("runpy"), std::string::npos);
}

TEST(WorkspaceTest, StageFailureLeavesNothing) {
  fs::path saved = kWorkspaceRoot;
  kWorkspaceRoot = "/dev/null/scriptbox";
  Workspace ws(GetUniqueExecutionId());
  EXPECT_FALSE(ws.Stage("exit 0", Interpreter::POSIX_SH));
  EXPECT_FALSE(ws.Staged());
  kWorkspaceRoot = saved;
}

TEST(WorkspaceTest, ReleaseSurvivesRemovalFailure) {
  RemovalBlocker blocker;
  fs::path path;
  {
    Workspace ws(GetUniqueExecutionId());
    ASSERT_TRUE(ws.Stage("exit 0", Interpreter::POSIX_SH));
    path = ws.Path();
    if (!blocker.Block(path)) GTEST_SKIP() << "cannot make a directory undeletable here";
    ws.Release();
    EXPECT_FALSE(ws.Staged());
    EXPECT_TRUE(ws.Path().empty());
    EXPECT_TRUE(fs::exists(path));
    // a second release has nothing left to do
    ws.Release();
  }
  EXPECT_TRUE(fs::exists(path));
}
