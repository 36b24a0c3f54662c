#include "taskwarden/executor/process.hpp"

#include "taskwarden/util/log.hpp"

#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace taskwarden {

namespace {

constexpr std::array<std::string_view, 3> kEnvPolicyNames = {
    "inherit_none", "inherit_all", "allow_list"};

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

auto sys_error(int err) -> std::error_code {
  return {err, std::system_category()};
}

auto close_fd(int& fd) noexcept -> void {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Closes whatever it still owns when a spawn attempt bails out early.
struct FdSet {
  std::array<int, 7> fds{-1, -1, -1, -1, -1, -1, -1};

  ~FdSet() {
    for (auto& fd : fds) {
      close_fd(fd);
    }
  }

  auto release(std::size_t i) -> int {
    return std::exchange(fds[i], -1);
  }
};

enum FdSlot : std::size_t {
  DevNull = 0,
  OutRead,
  OutWrite,
  ErrRead,
  ErrWrite,
  ErrnoRead,
  ErrnoWrite,
};

auto set_nonblocking(int fd) -> bool {
  int flags = fcntl(fd, F_GETFL);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

auto env_name(std::string_view entry) -> std::string_view {
  return entry.substr(0, entry.find('='));
}

}  // namespace

auto env_policy_name(EnvPolicy policy) noexcept -> std::string_view {
  return kEnvPolicyNames[static_cast<std::size_t>(policy)];
}

auto parse_env_policy(std::string_view name) noexcept
    -> std::optional<EnvPolicy> {
  // Accept the dashed spelling as well: inherit-none, allow-list.
  std::string normalized{name};
  std::ranges::replace(normalized, '-', '_');
  auto it = std::ranges::find(kEnvPolicyNames, normalized);
  if (it == kEnvPolicyNames.end()) {
    return std::nullopt;
  }
  return static_cast<EnvPolicy>(std::distance(kEnvPolicyNames.begin(), it));
}

auto build_environment(const SpawnOptions& options)
    -> std::vector<std::string> {
  std::vector<std::string> env;

  switch (options.env_policy) {
    case EnvPolicy::InheritAll:
      for (char** e = environ; e && *e; ++e) {
        env.emplace_back(*e);
      }
      break;
    case EnvPolicy::AllowList:
      for (const auto& name : options.env_allow_list) {
        if (const char* value = std::getenv(name.c_str())) {
          env.push_back(std::format("{}={}", name, value));
        }
      }
      break;
    case EnvPolicy::InheritNone:
      break;
  }

  for (const auto& [name, value] : options.extra_env) {
    std::erase_if(env, [&](const std::string& entry) {
      return env_name(entry) == name;
    });
    env.push_back(std::format("{}={}", name, value));
  }
  return env;
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {
}

ChildProcess::~ChildProcess() {
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
  {
    std::lock_guard lock(mu_);
    if (!reaped_ && pid_ > 0) {
      log::warn("Reaping unwaited child pid {}", pid_);
      ::kill(-pid_, SIGKILL);
      int status = 0;
      while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
      reaped_ = true;
    }
  }
  close_fd(pid_fd_);
}

auto ChildProcess::spawn(const SpawnOptions& options)
    -> Result<std::unique_ptr<ChildProcess>> {
  if (options.program.empty()) {
    return fail(Error::InvalidArgument);
  }

  // Everything the child touches is prepared before vfork.
  auto env_storage = build_environment(options);
  std::vector<char*> argv;
  argv.reserve(options.args.size() + 2);
  argv.push_back(const_cast<char*>(options.program.c_str()));
  for (const auto& arg : options.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<char*> envp;
  envp.reserve(env_storage.size() + 1);
  for (auto& entry : env_storage) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  const char* working_dir =
      options.working_dir.empty() ? nullptr : options.working_dir.c_str();

  FdSet fds;
  fds.fds[DevNull] = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (fds.fds[DevNull] < 0) {
    return fail(sys_error(errno));
  }
  for (auto [r, w] : {std::pair{OutRead, OutWrite}, std::pair{ErrRead, ErrWrite},
                      std::pair{ErrnoRead, ErrnoWrite}}) {
    int p[2];
    if (pipe2(p, O_CLOEXEC) < 0) {
      return fail(sys_error(errno));
    }
    fds.fds[r] = p[0];
    fds.fds[w] = p[1];
  }

  int devnull = fds.fds[DevNull];
  int out_w = fds.fds[OutWrite];
  int err_w = fds.fds[ErrWrite];
  int errno_w = fds.fds[ErrnoWrite];

  pid_t pid = vfork();
  if (pid < 0) {
    return fail(sys_error(errno));
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only until exec.
    setpgid(0, 0);
    dup2(devnull, STDIN_FILENO);
    dup2(out_w, STDOUT_FILENO);
    dup2(err_w, STDERR_FILENO);

    if (working_dir && chdir(working_dir) < 0) {
      int e = errno;
      [[maybe_unused]] auto n = ::write(errno_w, &e, sizeof(e));
      _exit(127);
    }
    execvpe(argv[0], argv.data(), envp.data());
    int e = errno;
    [[maybe_unused]] auto n = ::write(errno_w, &e, sizeof(e));
    _exit(127);
  }

  setpgid(pid, pid);
  close_fd(fds.fds[DevNull]);
  close_fd(fds.fds[OutWrite]);
  close_fd(fds.fds[ErrWrite]);
  close_fd(fds.fds[ErrnoWrite]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(fds.fds[ErrnoRead], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    log::debug("exec of '{}' failed: {}", options.program,
               std::strerror(child_errno));
    return fail(sys_error(child_errno));
  }

  int out_r = fds.release(OutRead);
  int err_r = fds.release(ErrRead);
  if (!set_nonblocking(out_r) || !set_nonblocking(err_r)) {
    log::warn("Failed to make output pipes non-blocking for pid {}", pid);
  }

  auto child = std::unique_ptr<ChildProcess>(new ChildProcess(pid, out_r, err_r));
  child->pid_fd_ = pidfd_open(pid, 0);
  if (child->pid_fd_ < 0) {
    log::debug("pidfd_open failed for pid {}: {}", pid, std::strerror(errno));
  }
  log::debug("Spawned '{}' as pid {}", options.program, pid);
  return child;
}

auto ChildProcess::send_signal(int sig) noexcept -> bool {
  std::lock_guard lock(mu_);
  if (reaped_ || pid_ <= 0) {
    return false;
  }
  if (::kill(-pid_, sig) == 0) {
    return true;
  }
  return ::kill(pid_, sig) == 0;
}

auto ChildProcess::has_exited() const noexcept -> bool {
  std::lock_guard lock(mu_);
  if (reaped_) {
    return true;
  }
  siginfo_t info{};
  if (waitid(P_PID, static_cast<id_t>(pid_), &info,
             WEXITED | WNOHANG | WNOWAIT) < 0) {
    return errno == ECHILD;
  }
  return info.si_pid != 0;
}

auto ChildProcess::close_stdout() noexcept -> void {
  close_fd(stdout_fd_);
}

auto ChildProcess::close_stderr() noexcept -> void {
  close_fd(stderr_fd_);
}

auto ChildProcess::wait() -> ExitStatus {
  {
    std::lock_guard lock(mu_);
    if (reaped_) {
      return status_;
    }
  }

  // Wait without reaping so send_signal() can never target a recycled pid.
  siginfo_t info{};
  while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0 &&
         errno == EINTR) {
  }

  std::lock_guard lock(mu_);
  if (reaped_) {
    return status_;
  }
  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  reaped_ = true;

  if (r != pid_) {
    log::warn("waitpid failed for pid {}: {}", pid_, std::strerror(errno));
    return status_;
  }
  if (WIFEXITED(status)) {
    status_.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    status_.signal = WTERMSIG(status);
  }
  return status_;
}

}  // namespace taskwarden
