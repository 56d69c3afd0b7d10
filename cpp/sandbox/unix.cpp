#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <grp.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Reads /proc/<pid>/<name> into buf as a NUL-terminated string. Returns false
// if the process is gone.
bool ReadProcFile(pid_t pid, const char* name, char* buf, size_t buflen) {
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/%s", pid, name);  // NOLINT
  int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  size_t len = 0;
  while (len + 1 < buflen) {
    ssize_t num_read = read(fd, buf + len, buflen - len - 1);  // NOLINT
    if (num_read == -1 && errno == EINTR) continue;
    if (num_read <= 0) break;
    len += num_read;
  }
  close(fd);
  buf[len] = 0;  // NOLINT
  return len > 0;
}

// Reads the resident set size of a running process. Returns false if the
// process is gone.
bool GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  char statm[256] = {};
  if (!ReadProcFile(pid, "statm", statm, sizeof(statm))) return false;
  char* end = nullptr;
  strtoll(statm, &end, 10);  // total program size
  if (end == statm) return false;
  char* resident_end = nullptr;
  int64_t resident = strtoll(end, &resident_end, 10);
  if (resident_end == end) return false;
  *memory_usage_kb = resident * (sysconf(_SC_PAGESIZE) / 1024);
  return true;
}

// Reads the number of threads of a running process.
bool GetThreadCount(pid_t pid, int64_t* threads) {
  char status[4096] = {};
  if (!ReadProcFile(pid, "status", status, sizeof(status))) return false;
  const char* line = strstr(status, "\nThreads:");
  if (line == nullptr) return false;
  *threads = strtoll(line + strlen("\nThreads:"), nullptr, 10);
  return true;
}

// The child may write one byte past the output limit, so that reaching the
// limit and going over it can be told apart. Cuts a regular file that went
// over back to limit bytes and returns true.
bool TruncateOutput(const std::string& path, int64_t limit) {
  struct stat st {};
  if (path.empty() || stat(path.c_str(), &st) == -1) return false;
  if (!S_ISREG(st.st_mode) || st.st_size <= limit) return false;
  KJ_SYSCALL(truncate(path.c_str(), limit), path.c_str());
  return true;
}

// Layout of the records returned by getdents64.
struct LinuxDirent64 {
  uint64_t d_ino;
  int64_t d_off;
  unsigned short d_reclen;  // NOLINT
  unsigned char d_type;
  char d_name[256];
};

// Parses a descriptor number from a /proc/self/fd entry, -1 for "." and "..".
int ParseFd(const char* name) {
  if (*name == 0) return -1;
  int fd = 0;
  for (; *name != 0; name++) {
    if (*name < '0' || *name > '9') return -1;
    fd = fd * 10 + (*name - '0');
  }
  return fd;
}

// Marks every descriptor above stderr as close-on-exec, so that nothing the
// supervisor opened is inherited by the program. Runs in the forked child,
// so it reads the directory with getdents64 and does not allocate. Returns 0
// or errno.
int CloseOnExecAll() {
  int dir = open("/proc/self/fd", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir == -1) return errno;
  alignas(LinuxDirent64) char buf[4096];
  int err = 0;
  while (err == 0) {
    long num_read = syscall(SYS_getdents64, dir, buf, sizeof(buf));  // NOLINT
    if (num_read == -1) err = errno;
    if (num_read <= 0) break;
    for (long pos = 0; pos < num_read && err == 0;) {  // NOLINT
      const auto* entry =
          reinterpret_cast<const LinuxDirent64*>(buf + pos);  // NOLINT
      pos += entry->d_reclen;
      int fd = ParseFd(entry->d_name);
      if (fd <= STDERR_FILENO || fd == dir) continue;
      if (fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) err = errno;
    }
  }
  close(dir);
  return err;
}

int64_t TimevalToMillis(const struct timeval& tv) {
  return tv.tv_sec * 1000LL + tv.tv_usec / 1000;
}

const constexpr int64_t kPollIntervalMillis = 5;
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

std::unique_ptr<Sandbox> Sandbox::Create() {
  return std::unique_ptr<Sandbox>(new Unix());
}

bool Unix::PrepareForExecution(const std::string& executable,
                               std::string* error_msg) {
  if (chmod(executable.c_str(), S_IRUSR | S_IXUSR | S_IRGRP | S_IXGRP |
                                    S_IROTH | S_IXOTH) == -1) {
    *error_msg = "chmod: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  return true;
}

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  argv_storage_.clear();
  argv_storage_.push_back(options_->executable);
  argv_storage_.insert(argv_storage_.end(), options_->args.begin(),
                       options_->args.end());
  argv_.clear();
  for (std::string& arg : argv_storage_) argv_.push_back(&arg[0]);
  argv_.push_back(nullptr);

  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

bool Unix::OnChild(char* error_msg, size_t buflen) {
  if (!options_->restrict_syscalls) return true;
  return SyscallPolicy::Install(options_->phase, options_->executable.c_str(),
                                error_msg, buflen);
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (write(pipe_fds_[1], &len, sizeof(len)) != sizeof(len) ||
        write(pipe_fds_[1], buf, len) != len) {
      _Exit(2);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // New process group, so that the watchdog can kill every descendant and
  // we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  // O_NONBLOCK keeps a FIFO with no peer from blocking the child before the
  // watchdog starts. Reads and writes block as usual afterwards.
  const mode_t output_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  auto open_file = [&die, output_mode](const char* what, const char* path,
                                       int flags) {
    int fd = open(path, flags | O_NONBLOCK | O_CLOEXEC, output_mode);
    if (fd == -1) die(what, errno);
    int fd_flags = fcntl(fd, F_GETFL);
    if (fd_flags == -1 || fcntl(fd, F_SETFL, fd_flags & ~O_NONBLOCK) == -1) {
      die(what, errno);
    }
    return fd;
  };
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdin_file.empty()) {
    stdin_fd =
        open_file("open stdin", options_->stdin_file.c_str(), O_RDONLY);
  }
  if (!options_->stdout_file.empty()) {
    stdout_fd = open_file("open stdout", options_->stdout_file.c_str(),
                          O_WRONLY | O_CREAT | O_TRUNC);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = open_file("open stderr", options_->stderr_file.c_str(),
                          O_WRONLY | O_CREAT | O_TRUNC);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP
  if (int err = CloseOnExecAll()) die("close-on-exec", err);

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM2(res, soft, hard)            \
  {                                           \
    rlim.rlim_cur = soft;                     \
    rlim.rlim_max = hard;                     \
    if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
      die("setrlim " #res, errno);            \
    }                                         \
  }
#define SET_RLIM(res, value)    \
  {                             \
    rlim_t lim = value;         \
    if (lim) {                  \
      SET_RLIM2(res, lim, lim); \
    }                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  if (options_->cpu_limit_millis) {
    // SIGXCPU at the soft limit, SIGKILL one second later.
    rlim_t seconds = (options_->cpu_limit_millis + 999) / 1000;
    SET_RLIM2(CPU, seconds, seconds + 1);
  }
  SET_RLIM(FSIZE, options_->max_file_size_bytes
                      ? options_->max_file_size_bytes + 1
                      : 0);
  SET_RLIM(MEMLOCK, options_->max_mlock_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
  SET_RLIM2(CORE, 0, 0);
  SET_RLIM(STACK, options_->max_stack_kb * 1024);
#undef SET_RLIM
#undef SET_RLIM2

  // Drop privileges, group first while we are still allowed to.
  if (options_->gid >= 0) {
    if (setgroups(0, nullptr) == -1) die("setgroups", errno);
    if (setgid(options_->gid) == -1) die("setgid", errno);
  }
  if (options_->uid >= 0) {
    if (setuid(options_->uid) == -1) die("setuid", errno);
  }

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {  // NOLINT
    die2("seccomp", buf);                 // NOLINT
  }
  execv(options_->executable.c_str(), argv_.data());
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillProcessGroup() {
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    KJ_FAIL_SYSCALL("kill", errno, child_pid_);
  }
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  ssize_t error_len = 0;
  ssize_t num_read = 0;
  KJ_SYSCALL(num_read = read(pipe_fds_[0], &error_len, sizeof(error_len)),
             "Failed to read from fd");
  if (num_read == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::min<ssize_t>(error_len, PIPE_BUF - 1);
    KJ_SYSCALL(read(pipe_fds_[0], error, error_len), "Failed to read from fd");
    close(pipe_fds_[0]);
    *error_msg = error;
    int child_status = 0;
    KJ_SYSCALL(waitpid(child_pid_, &child_status, 0), child_pid_);
    return false;
  }
  close(pipe_fds_[0]);

  // The pipe is closed on exec: from now on the target program is running.
  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  int64_t peak_memory_kb = 0;
  while (true) {
    int ret = 0;
    KJ_SYSCALL(ret = wait4(child_pid_, &child_status, WNOHANG, &rusage),
               child_pid_);
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    if (options_->wall_limit_millis != 0 &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->kill_reason = KillReason::kWallTime;
      break;
    }
    int64_t memory_kb = 0;
    if (GetProcessMemoryUsage(child_pid_, &memory_kb)) {
      peak_memory_kb = std::max(peak_memory_kb, memory_kb);
      if (options_->resident_limit_kb != 0 &&
          memory_kb > options_->resident_limit_kb) {
        info->kill_reason = KillReason::kMemory;
        break;
      }
    }
    int64_t threads = 0;
    if (options_->max_threads != 0 &&
        GetThreadCount(child_pid_, &threads) &&
        threads > options_->max_threads) {
      info->kill_reason = KillReason::kThreads;
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(kPollIntervalMillis));
  }
  if (!has_exited) {
    KillProcessGroup();
    int ret = 0;
    KJ_SYSCALL(ret = wait4(child_pid_, &child_status, 0, &rusage),
               child_pid_);
    KJ_ASSERT(ret == child_pid_, "wait4 returned an unexpected pid", ret);
  }
  info->wall_time_millis = elapsed_millis();
  // Descendants that outlived the child are not allowed to keep running.
  KillProcessGroup();

  info->memory_usage_kb = std::max<int64_t>(rusage.ru_maxrss, peak_memory_kb);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis = TimevalToMillis(rusage.ru_utime);
  info->sys_time_millis = TimevalToMillis(rusage.ru_stime);
  if (options_->max_file_size_bytes != 0) {
    for (const std::string* path :
         {&options_->stdout_file, &options_->stderr_file}) {
      if (TruncateOutput(*path, options_->max_file_size_bytes)) {
        info->output_limit_reached = true;
      }
    }
  }
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

}  // namespace sandbox
