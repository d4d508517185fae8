#ifndef SCRIPTBOX_SANDBOX_H_
#define SCRIPTBOX_SANDBOX_H_

#include <string>
#include <vector>

class SandboxOptions;
// Owns the NUL-terminated argv/envp arrays handed to execve; they are built
//   before fork so that the child does not allocate
class ExecCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
 public:
  char* const* Argv() const { return const_cast<char* const*>(argv_buf_.data()); }
  char* const* Envp() const { return const_cast<char* const*>(env_buf_.data()); }

  friend class SandboxOptions;
};

class SandboxOptions {
 public:
  // command[0] must be an absolute path; no shell is involved
  std::vector<std::string> command;
  std::vector<std::string> envs; // the complete environment of the child
  std::string workdir;
  std::string input; // written to the child's stdin, which is then closed
  int uid, gid; // -1 to keep
  long wall_time; // us; 0 for no limit
  long kill_grace; // us between SIGTERM and SIGKILL
  long vss; // KiB
  long fsize; // KiB
  int file_num;
  long max_output; // KiB per captured stream

  SandboxOptions() :
      uid(-1), gid(-1),
      wall_time(0), kill_grace(500'000),
      vss(0), fsize(0),
      file_num(0),
      max_output(0) {}

  // the result is invalidated after reassignment/reallocation of command or envs
  ExecCtxClass ToExecCtx() const;
};

#endif  // SCRIPTBOX_SANDBOX_H_
