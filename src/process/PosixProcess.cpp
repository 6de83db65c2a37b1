// Repository: OnAir-relay
// Component: POSIX Process Handle
// Copyright (c) 2026 OnAir

#include "onair/process/PosixProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "onair/util/Logger.hpp"

namespace onair::process {

namespace {

void CloseIfOpen(int fd) {
  if (fd >= 0) (void)close(fd);
}

}  // namespace

const char* SignalStatusToString(SignalStatus s) {
  switch (s) {
    case SignalStatus::kOk:
      return "OK";
    case SignalStatus::kUnsupported:
      return "UNSUPPORTED";
    case SignalStatus::kNotRunning:
      return "NOT_RUNNING";
    case SignalStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

// =============================================================================
// PosixProcessHandle
// =============================================================================

PosixProcessHandle::PosixProcessHandle(pid_t pid) : pid_(pid) {
  reaper_ = std::thread(&PosixProcessHandle::ReaperLoop, this);
}

PosixProcessHandle::~PosixProcessHandle() {
  Terminate(kDestructorTerminateTimeout);
  if (reaper_.joinable()) {
    reaper_.join();
  }
}

void PosixProcessHandle::ReaperLoop() {
  // Observe the exit without reaping, so the pid (and its process group id)
  // cannot be recycled while another thread may still signal it. The reap
  // happens below under mutex_, which SignalGroup() also holds.
  siginfo_t info;
  for (;;) {
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == 0) break;
    if (errno == EINTR) continue;
    util::Logger::Warn("[PosixProcess] waitid(" + std::to_string(pid_) +
                       ") failed: " + std::strerror(errno));
    break;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);

  if (r == pid_) {
    if (WIFSIGNALED(status)) {
      exit_status_.signaled = true;
      exit_status_.term_signal = WTERMSIG(status);
    } else if (WIFEXITED(status)) {
      exit_status_.exit_code = WEXITSTATUS(status);
    }
  }
  exited_ = true;
  exited_cv_.notify_all();
}

std::optional<ExitStatus> PosixProcessHandle::Wait(const util::CancellationToken& token) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!exited_) {
    if (token.IsCancellationRequested()) {
      return std::nullopt;
    }
    exited_cv_.wait_for(lock, kWaitPollInterval);
  }
  return exit_status_;
}

void PosixProcessHandle::Terminate(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (exited_) return;

  // SIGCONT so a suspended group can act on SIGTERM.
  (void)kill(-pid_, SIGTERM);
  (void)kill(-pid_, SIGCONT);
  if (exited_cv_.wait_for(lock, timeout, [this] { return exited_; })) {
    return;
  }

  util::Logger::Warn("[PosixProcess] pid " + std::to_string(pid_) + " ignored SIGTERM for " +
                     std::to_string(timeout.count()) + "ms, sending SIGKILL");
  (void)kill(-pid_, SIGKILL);
  exited_cv_.wait(lock, [this] { return exited_; });
}

SignalStatus PosixProcessHandle::SignalGroup(int sig) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (exited_) return SignalStatus::kNotRunning;
  if (kill(-pid_, sig) != 0) {
    return errno == ESRCH ? SignalStatus::kNotRunning : SignalStatus::kFailed;
  }
  return SignalStatus::kOk;
}

SignalStatus PosixProcessHandle::Suspend() {
#if defined(__linux__) || defined(__APPLE__)
  return SignalGroup(SIGSTOP);
#else
  return SignalStatus::kUnsupported;
#endif
}

SignalStatus PosixProcessHandle::Continue() {
#if defined(__linux__) || defined(__APPLE__)
  return SignalGroup(SIGCONT);
#else
  return SignalStatus::kUnsupported;
#endif
}

bool PosixProcessHandle::HasExited() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exited_;
}

// =============================================================================
// PosixProcessLauncher
// =============================================================================

SpawnResult PosixProcessLauncher::Spawn(const std::vector<std::string>& args,
                                        const std::string& log_path) {
  if (args.empty() || args[0].empty()) {
    return SpawnResult::Failure("empty command line");
  }

  // Everything the child needs is prepared before fork(): only
  // async-signal-safe calls are allowed between fork() and exec.
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& a : args) {
    argv.push_back(const_cast<char*>(a.c_str()));
  }
  argv.push_back(nullptr);

  const int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (null_fd < 0) {
    return SpawnResult::Failure(std::string("open /dev/null: ") + std::strerror(errno));
  }
  int out_fd = null_fd;
  if (!log_path.empty()) {
    out_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (out_fd < 0) {
      util::Logger::Warn("[PosixProcess] Cannot open encoder log " + log_path + ": " +
                         std::strerror(errno) + " (output discarded)");
      out_fd = null_fd;
    }
  }

  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    const std::string msg = std::string("pipe2: ") + std::strerror(errno);
    if (out_fd != null_fd) CloseIfOpen(out_fd);
    CloseIfOpen(null_fd);
    return SpawnResult::Failure(msg);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string msg = std::string("fork: ") + std::strerror(errno);
    CloseIfOpen(err_pipe[0]);
    CloseIfOpen(err_pipe[1]);
    if (out_fd != null_fd) CloseIfOpen(out_fd);
    CloseIfOpen(null_fd);
    return SpawnResult::Failure(msg);
  }

  if (pid == 0) {
    // Child. New session => new process group with pgid == pid.
    (void)setsid();
    (void)dup2(null_fd, STDIN_FILENO);
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(out_fd, STDERR_FILENO);
    signal(SIGPIPE, SIG_DFL);
    execvp(argv[0], argv.data());
    const int exec_errno = errno;
    ssize_t unused = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)unused;
    _exit(127);
  }

  // Parent.
  CloseIfOpen(err_pipe[1]);
  if (out_fd != null_fd) CloseIfOpen(out_fd);
  CloseIfOpen(null_fd);

  // The pipe closes on successful exec (CLOEXEC); otherwise the child sends
  // its errno first.
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseIfOpen(err_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return SpawnResult::Failure("cannot execute '" + args[0] + "': " +
                                std::strerror(child_errno));
  }

  util::Logger::Debug("[PosixProcess] Spawned pid " + std::to_string(pid) + " (" + args[0] + ")");
  return SpawnResult::Success(std::make_unique<PosixProcessHandle>(pid));
}

}  // namespace onair::process
