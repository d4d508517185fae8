#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
#else
#include <dirent.h>
#endif

#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

#if __has_include(<linux/close_range.h>)
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG2(ResultStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultStatusName, ResultStatus, ENUM_RESULT_STATUS_)
#undef X

#define X(...) X_RETURN_ARG3(ResultStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(int ResultStatusCode, ResultStatus, ENUM_RESULT_STATUS_)
#undef X

#define X(...) X_RETURN_ARG4(ResultStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(int ResultStatusHttp, ResultStatus, ENUM_RESULT_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(ExecutionState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStateName, ExecutionState, ENUM_EXECUTION_STATE_)
#undef X

#define X(...) X_RETURN_ARG2(RuleCategory, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RuleCategoryName, RuleCategory, ENUM_RULE_CATEGORY_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

static const char* kInterpreterNameTable[] = {
#define X(name, progname) progname,
  ENUM_INTERPRETER_
#undef X
};

const char* InterpreterName(Interpreter lang) {
  return kInterpreterNameTable[(int)lang];
}

bool GetInterpreter(const std::string& str, Interpreter& lang) {
  for (size_t i = 0; i < sizeof(kInterpreterNameTable) / sizeof(kInterpreterNameTable[0]); i++) {
    if (str == kInterpreterNameTable[i]) {
      lang = (Interpreter)i;
      return true;
    }
  }
  return false;
}

static const char* kSeverityNameTable[] = {
#define X(name, str) str,
  ENUM_SEVERITY_
#undef X
};

const char* SeverityName(Severity severity) {
  return kSeverityNameTable[(int)severity];
}

bool GetSeverity(const std::string& str, Severity& severity) {
  for (size_t i = 0; i < sizeof(kSeverityNameTable) / sizeof(kSeverityNameTable[0]); i++) {
    if (str == kSeverityNameTable[i]) {
      severity = (Severity)i;
      return true;
    }
  }
  return false;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  bool created = fs::create_directories(path, ec);
  if (ec) goto err;
  // existing directories keep their mode
  if (!created || perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteNewFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) goto err;
  for (size_t off = 0; off < content.size();) {
    ssize_t n = write(fd, content.data() + off, content.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      close(fd);
      goto err;
    }
    off += n;
  }
  if (close(fd) < 0) goto err;
  if (perms != kPerm600) {
    std::error_code ec;
    fs::permissions(path, perms, ec);
    if (ec) {
      errno = ec.value();
      goto err;
    }
  }
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

bool ChownTree(const fs::path& path, int uid, int gid) {
  spdlog::debug("Chown {} to {}:{}", path.c_str(), uid, gid);
  if (lchown(path.c_str(), uid, gid) < 0) goto err;
  {
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(path, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (lchown(it->path().c_str(), uid, gid) < 0) goto err;
    }
    if (ec) {
      errno = ec.value();
      goto err;
    }
  }
  return true;
err:
  spdlog::warn("Failed changing owner of {}: {}", path.c_str(), strerror(errno));
  return false;
}
