#include "clawboot/process/process.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace clawboot::process {

namespace {

constexpr std::array<int, 6> FORWARDED_SIGNALS = {SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2};

std::atomic<pid_t> g_supervised_child{0};

void forward_signal(const int signo) {
  const pid_t child = g_supervised_child.load();
  if (child > 0) {
    (void)kill(child, signo);
  }
}

struct ExecArgs {
  std::vector<char *> argv;
  std::vector<char *> envp;
};

// Built before fork so the child only touches memory that already exists.
ExecArgs build_exec_args(const ProcessSpec &spec) {
  ExecArgs out;
  out.argv.reserve(spec.args.size() + 2);
  out.argv.push_back(const_cast<char *>(spec.program.c_str()));
  for (const auto &arg : spec.args) {
    out.argv.push_back(const_cast<char *>(arg.c_str()));
  }
  out.argv.push_back(nullptr);

  if (spec.env.has_value()) {
    out.envp.reserve(spec.env->size() + 1);
    for (const auto &entry : *spec.env) {
      out.envp.push_back(const_cast<char *>(entry.c_str()));
    }
    out.envp.push_back(nullptr);
  }
  return out;
}

// Child side of fork, and the whole of exec_replace: never returns on success.
void exec_child(const ProcessSpec &spec, ExecArgs &args) {
  if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
    return;
  }
  if (spec.env.has_value()) {
    execvpe(spec.program.c_str(), args.argv.data(), args.envp.data());
  } else {
    execvp(spec.program.c_str(), args.argv.data());
  }
}

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &out) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes <= 0) {
      return;
    }
    out.append(buffer.data(), static_cast<std::size_t>(bytes));
  }
}

common::Result<int> wait_for(const pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return common::Result<int>::failure(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }
  return common::Result<int>::success(decode_wait_status(status));
}

} // namespace

int decode_wait_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

common::Result<ProcessOutput> PosixProcessLauncher::run_capture(const ProcessSpec &spec) {
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    for (const int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) {
      if (fd >= 0) {
        close(fd);
      }
    }
    return common::Result<ProcessOutput>::failure("failed to create pipes for " + spec.program);
  }

  auto args = build_exec_args(spec);
  const pid_t pid = fork();
  if (pid < 0) {
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    return common::Result<ProcessOutput>::failure("failed to fork " + spec.program);
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    exec_child(spec, args);
    _exit(127);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  ProcessOutput output;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_into_buffer(stdout_pipe[0], output.stdout_text);
    read_into_buffer(stderr_pipe[0], output.stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (spec.timeout.has_value() && std::chrono::steady_clock::now() - started > *spec.timeout) {
      output.timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(stdout_pipe[0], output.stdout_text);
  read_into_buffer(stderr_pipe[0], output.stderr_text);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  output.exit_code = decode_wait_status(status);
  return common::Result<ProcessOutput>::success(std::move(output));
}

common::Result<int> PosixProcessLauncher::run(const ProcessSpec &spec) {
  auto args = build_exec_args(spec);
  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<int>::failure("failed to fork " + spec.program);
  }
  if (pid == 0) {
    exec_child(spec, args);
    _exit(127);
  }
  return wait_for(pid);
}

common::Result<pid_t> PosixProcessLauncher::spawn_background(const ProcessSpec &spec) {
  auto args = build_exec_args(spec);
  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<pid_t>::failure("failed to fork " + spec.program);
  }
  if (pid == 0) {
    exec_child(spec, args);
    _exit(127);
  }
  return common::Result<pid_t>::success(pid);
}

bool PosixProcessLauncher::is_running(const pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  // Reap first: an exited child stays visible to kill(pid, 0) as a zombie.
  int status = 0;
  if (waitpid(pid, &status, WNOHANG) == pid) {
    return false;
  }
  if (kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

void PosixProcessLauncher::terminate(const pid_t pid) {
  if (pid <= 0) {
    return;
  }
  (void)kill(pid, SIGTERM);
  for (int i = 0; i < 20; ++i) {
    int status = 0;
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid || (done < 0 && errno == ECHILD)) {
      return;
    }
    usleep(50 * 1000);
  }
  (void)kill(pid, SIGKILL);
  int status = 0;
  (void)waitpid(pid, &status, 0);
}

common::Status PosixProcessLauncher::exec_replace(const ProcessSpec &spec) {
  auto args = build_exec_args(spec);
  exec_child(spec, args);
  return common::Status::error("failed to exec " + spec.program + ": " + std::strerror(errno));
}

common::Result<int> PosixProcessLauncher::supervise(const ProcessSpec &spec) {
  auto args = build_exec_args(spec);

  std::array<struct sigaction, FORWARDED_SIGNALS.size()> previous{};
  struct sigaction action {};
  action.sa_handler = forward_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;

  // Handlers go in before fork so a signal arriving in between is not lost
  // to the default disposition; until the pid is published it is dropped.
  for (std::size_t i = 0; i < FORWARDED_SIGNALS.size(); ++i) {
    (void)sigaction(FORWARDED_SIGNALS[i], &action, &previous[i]);
  }
  const auto restore = [&previous]() {
    g_supervised_child.store(0);
    for (std::size_t i = 0; i < FORWARDED_SIGNALS.size(); ++i) {
      (void)sigaction(FORWARDED_SIGNALS[i], &previous[i], nullptr);
    }
  };

  const pid_t pid = fork();
  if (pid < 0) {
    restore();
    return common::Result<int>::failure("failed to fork " + spec.program);
  }
  if (pid == 0) {
    for (std::size_t i = 0; i < FORWARDED_SIGNALS.size(); ++i) {
      (void)sigaction(FORWARDED_SIGNALS[i], &previous[i], nullptr);
    }
    exec_child(spec, args);
    _exit(127);
  }

  g_supervised_child.store(pid);
  auto exit_code = wait_for(pid);
  restore();
  return exit_code;
}

} // namespace clawboot::process
