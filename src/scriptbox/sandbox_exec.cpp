#include "sandbox_exec.h"

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

// the longest time the loop sleeps without checking the child
constexpr int kPollSliceMs = 50;
constexpr size_t kReadChunk = 65536;

// Child-side failure report: errno through the status pipe, then exit.
[[noreturn]] void ChildFail(int status_fd) {
  int err = errno;
  IGNORE_RETURN(write(status_fd, &err, sizeof(err)));
  _exit(127);
}

bool SetRlimit(int resource, rlim_t value) {
  struct rlimit lim = {value, value};
  return setrlimit(resource, &lim) == 0;
}

// Runs in the forked child: only async-signal-safe calls from here on
[[noreturn]] void ChildExec(const SandboxOptions& opt, const ExecCtxClass& ctx,
                            int stdin_fd, int stdout_fd, int stderr_fd, int status_fd) {
  setpgid(0, 0);
  // ignored dispositions (SIGPIPE in the server) and the mask survive execve
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  for (int sig = 1; sig < NSIG; sig++) {
    if (sig != SIGKILL && sig != SIGSTOP) signal(sig, SIG_DFL);
  }

  if (dup2(stdin_fd, 0) < 0 || dup2(stdout_fd, 1) < 0 || dup2(stderr_fd, 2) < 0) ChildFail(status_fd);
  if (status_fd != 3) {
    if (dup3(status_fd, 3, O_CLOEXEC) < 0) ChildFail(status_fd);
    status_fd = 3;
  }
  if (CloseFrom(4) < 0) ChildFail(status_fd);

  umask(077);
  if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) ChildFail(status_fd);
  if (!SetRlimit(RLIMIT_CORE, 0)) ChildFail(status_fd);
  if (opt.vss > 0 && !SetRlimit(RLIMIT_AS, (rlim_t)opt.vss * 1024)) ChildFail(status_fd);
  if (opt.fsize > 0 && !SetRlimit(RLIMIT_FSIZE, (rlim_t)opt.fsize * 1024)) ChildFail(status_fd);
  if (opt.file_num > 0 && !SetRlimit(RLIMIT_NOFILE, opt.file_num)) ChildFail(status_fd);
  if (opt.gid >= 0) {
    if (setgroups(0, nullptr) < 0 || setgid(opt.gid) < 0) ChildFail(status_fd);
  }
  if (opt.uid >= 0 && setuid(opt.uid) < 0) ChildFail(status_fd);
  // a credential change clears the parent-death signal, so it goes after setuid
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0) ChildFail(status_fd);
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) ChildFail(status_fd);

  execve(ctx.Argv()[0], ctx.Argv(), ctx.Envp());
  ChildFail(status_fd);
}

// One captured output stream
struct Capture {
  int fd = -1;
  std::string buf;
  size_t limit = 0; // 0 = unlimited
  bool truncated = false;

  // false on EOF or error; the descriptor is closed then
  bool ReadAvailable() {
    char chunk[kReadChunk];
    while (true) {
      ssize_t n = read(fd, chunk, sizeof(chunk));
      if (n > 0) {
        size_t take = n;
        if (limit && buf.size() + take > limit) {
          take = limit - buf.size();
          truncated = true;
        }
        buf.append(chunk, take);
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
      if (n < 0) spdlog::warn("Failed reading child output: {}", strerror(errno));
      Close();
      return false;
    }
  }
  void Close() {
    if (fd >= 0) close(fd);
    fd = -1;
  }
};

// The stdin side is a socket so that a child which never reads its input
//   produces EPIPE here instead of a SIGPIPE
struct Feeder {
  int fd = -1;
  const std::string* data = nullptr;
  size_t off = 0;

  void WriteAvailable() {
    while (fd >= 0 && off < data->size()) {
      ssize_t n = send(fd, data->data() + off, data->size() - off, MSG_NOSIGNAL | MSG_DONTWAIT);
      if (n > 0) {
        off += n;
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
      if (n < 0 && errno != EPIPE && errno != ECONNRESET) {
        spdlog::warn("Failed writing child input: {}", strerror(errno));
      }
      break;
    }
    Close();
  }
  void Close() {
    if (fd >= 0) close(fd);
    fd = -1;
  }
};

int SetNonblock(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0) return -1;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void ClosePair(int fds[2]) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] >= 0) close(fds[i]);
    fds[i] = -1;
  }
}

int RemainingMs(Clock::time_point now, Clock::time_point until) {
  if (until <= now) return 0;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count() + 1;
  return (int)std::min<long long>(ms, kPollSliceMs);
}

} // namespace

ExecutionOutcome SandboxExec(const SandboxOptions& opt, const SandboxCallbacks& cb) {
  ExecutionOutcome ret;
  auto report = [&](ExecutionState state) {
    ret.state = state;
    if (cb.ReportState) cb.ReportState(state);
  };
  auto start = Clock::now();
  auto elapsed = [&]() {
    return std::chrono::duration<double>(Clock::now() - start).count();
  };
  report(ExecutionState::LAUNCHING);
  if (opt.command.empty() || opt.command[0].empty() || opt.command[0][0] != '/') {
    ret.launch_error = "Command must be an absolute path";
    ret.elapsed_seconds = elapsed();
    report(ExecutionState::LAUNCH_FAILED);
    return ret;
  }

  int in_sock[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
  Capture out, err;
  Feeder feeder;
  int wstatus = 0;
  bool timed_out = false, killed = false;
  Clock::time_point deadline, kill_at;
  ExecCtxClass ctx = opt.ToExecCtx();
  pid_t pid;

  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, in_sock) < 0 ||
      pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(status_pipe, O_CLOEXEC) < 0) {
    goto launch_err;
  }
  spdlog::debug("SandboxExec command={} workdir={}", fmt::format("{}", opt.command), opt.workdir);
  pid = fork();
  if (pid < 0) goto launch_err;
  if (pid == 0) ChildExec(opt, ctx, in_sock[1], out_pipe[1], err_pipe[1], status_pipe[1]);

  // also set here so that killpg cannot race the child's own setpgid
  setpgid(pid, pid);
  if (cb.ReportSpawned) cb.ReportSpawned(pid);
  close(in_sock[1]);
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(status_pipe[1]);
  in_sock[1] = out_pipe[1] = err_pipe[1] = status_pipe[1] = -1;
  shutdown(in_sock[0], SHUT_RD);

  {
    // EOF means execve succeeded
    int child_errno = 0;
    ssize_t n;
    while ((n = read(status_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    ClosePair(status_pipe);
    if (n > 0) {
      while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
      ClosePair(in_sock);
      ClosePair(out_pipe);
      ClosePair(err_pipe);
      ret.launch_error = fmt::format("Failed to start {}: {}", opt.command[0], strerror(child_errno));
      spdlog::warn("SandboxExec: {}", *ret.launch_error);
      ret.elapsed_seconds = elapsed();
      report(ExecutionState::LAUNCH_FAILED);
      return ret;
    }
  }
  report(ExecutionState::RUNNING);

  out.fd = out_pipe[0];
  err.fd = err_pipe[0];
  out_pipe[0] = err_pipe[0] = -1;
  out.limit = err.limit = opt.max_output > 0 ? (size_t)opt.max_output * 1024 : 0;
  feeder.fd = in_sock[0];
  in_sock[0] = -1;
  feeder.data = &opt.input;
  if (SetNonblock(out.fd) < 0 || SetNonblock(err.fd) < 0) {
    spdlog::warn("Failed setting nonblocking output: {}", strerror(errno));
  }
  if (opt.input.empty()) feeder.Close();

  deadline = opt.wall_time > 0 ? start + std::chrono::microseconds(opt.wall_time) : Clock::time_point::max();
  while (true) {
    // WNOWAIT keeps the leader as a zombie, so its process group id cannot be
    //   reused before the rest of the group is killed
    siginfo_t info = {};
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0 && errno != EINTR) {
      spdlog::error("waitid failed: {}", strerror(errno));
      break;
    }
    if (info.si_pid == pid) break;

    auto now = Clock::now();
    if (!timed_out && now >= deadline) {
      timed_out = true;
      spdlog::info("SandboxExec pid={} exceeded {} us, terminating", pid, opt.wall_time);
      killpg(pid, SIGTERM);
      kill_at = now + std::chrono::microseconds(opt.kill_grace);
    }
    if (timed_out && !killed && now >= kill_at) {
      killed = true;
      spdlog::info("SandboxExec pid={} still alive after grace period, killing", pid);
      killpg(pid, SIGKILL);
    }

    struct pollfd fds[3];
    nfds_t nfds = 0;
    if (out.fd >= 0) fds[nfds++] = {out.fd, POLLIN, 0};
    if (err.fd >= 0) fds[nfds++] = {err.fd, POLLIN, 0};
    if (feeder.fd >= 0) fds[nfds++] = {feeder.fd, POLLOUT, 0};
    int wait_ms = kPollSliceMs;
    if (!timed_out) wait_ms = RemainingMs(now, deadline);
    else if (!killed) wait_ms = RemainingMs(now, kill_at);
    if (poll(fds, nfds, wait_ms) < 0 && errno != EINTR) {
      spdlog::error("poll failed: {}", strerror(errno));
    }
    for (nfds_t i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      if (fds[i].fd == out.fd) out.ReadAvailable();
      else if (fds[i].fd == err.fd) err.ReadAvailable();
      else if (fds[i].fd == feeder.fd) feeder.WriteAvailable();
    }
  }

  // descendants that outlive the leader would hold the pipes open
  killpg(pid, SIGKILL);
  while (waitpid(pid, &wstatus, 0) < 0 && errno == EINTR);
  ret.elapsed_seconds = elapsed();
  feeder.Close();
  if (out.fd >= 0) out.ReadAvailable();
  if (err.fd >= 0) err.ReadAvailable();
  out.Close();
  err.Close();

  ret.stdout_text = std::move(out.buf);
  ret.stderr_text = std::move(err.buf);
  ret.output_truncated = out.truncated || err.truncated;
  if (WIFSIGNALED(wstatus)) ret.term_signal = WTERMSIG(wstatus);
  if (timed_out) {
    ret.timed_out = true;
    spdlog::debug("SandboxExec pid={} timed out after {:.3f}s", pid, ret.elapsed_seconds);
    report(ExecutionState::TIMED_OUT);
    return ret;
  }
  if (WIFEXITED(wstatus)) {
    ret.exit_code = WEXITSTATUS(wstatus);
  } else {
    ret.exit_code = 128 + ret.term_signal;
  }
  spdlog::debug("SandboxExec pid={} exited code={} signal={} after {:.3f}s",
      pid, *ret.exit_code, ret.term_signal, ret.elapsed_seconds);
  report(ExecutionState::COMPLETED);
  return ret;

launch_err:
  int launch_errno = errno;
  ret.launch_error = fmt::format("Failed to start {}: {}", opt.command[0], strerror(launch_errno));
  spdlog::warn("SandboxExec error: errno={} {}", launch_errno, strerror(launch_errno));
  ClosePair(in_sock);
  ClosePair(out_pipe);
  ClosePair(err_pipe);
  ClosePair(status_pipe);
  ret.elapsed_seconds = elapsed();
  report(ExecutionState::LAUNCH_FAILED);
  return ret;
}
