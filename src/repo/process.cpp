#include "warden/repo/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace warden::repo {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Returns false once the write end is closed.
bool read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return true;
    }
    return false;
  }
}

void close_pipe(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

} // namespace

std::string join_argv(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &argv,
                                                      const ProcessOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<ProcessResult>::failure("process argv is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
      _exit(126);
    }
    for (const auto &[name, value] : options.env) {
      (void)setenv(name.c_str(), value.c_str(), 1);
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(args.front(), args.data());
    _exit(127);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    (void)read_into_buffer(stdout_pipe[0], stdout_text);
    (void)read_into_buffer(stderr_pipe[0], stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 20);
  }

  (void)read_into_buffer(stdout_pipe[0], stdout_text);
  (void)read_into_buffer(stderr_pipe[0], stderr_text);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  ProcessResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  if (timed_out) {
    return common::Result<ProcessResult>::failure(
        "timed out after " + std::to_string(options.timeout.count()) + "ms: " + join_argv(argv));
  }

  if (result.exit_code == 127) {
    return common::Result<ProcessResult>::failure("executable not found: " + argv.front());
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "command failed (exit " +
                                          std::to_string(result.exit_code) +
                                          "): " + join_argv(argv)
                                    : result.stderr_text;
    return common::Result<ProcessResult>::failure(message);
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace warden::repo
