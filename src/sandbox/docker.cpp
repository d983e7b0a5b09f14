#include "boxrun/sandbox/docker.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace boxrun::sandbox {

namespace {

class Pipe {
public:
  Pipe() {
    if (pipe(fds_) != 0) {
      fds_[0] = -1;
      fds_[1] = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  [[nodiscard]] bool valid() const { return fds_[0] >= 0 && fds_[1] >= 0; }
  [[nodiscard]] int read_fd() const { return fds_[0]; }
  [[nodiscard]] int write_fd() const { return fds_[1]; }

  void close_read() {
    if (fds_[0] >= 0) {
      close(fds_[0]);
      fds_[0] = -1;
    }
  }
  void close_write() {
    if (fds_[1] >= 0) {
      close(fds_[1]);
      fds_[1] = -1;
    }
  }

private:
  int fds_[2] = {-1, -1};
};

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Reads what is available. Returns false once the write side is closed.
bool drain(const int fd, std::string &buffer, const OutputSink &sink) {
  if (fd < 0) {
    return false;
  }
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      if (sink) {
        sink(std::string_view(chunk.data(), static_cast<std::size_t>(bytes)));
      }
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    return false;
  }
}

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

} // namespace

DockerCliRunner::DockerCliRunner(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure("docker command is empty");
  }

  Pipe stdout_pipe;
  Pipe stderr_pipe;
  if (!stdout_pipe.valid() || !stderr_pipe.valid()) {
    return common::Result<DockerProcessResult>::failure("failed to create pipes for docker");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<DockerProcessResult>::failure("failed to fork docker process");
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe.write_fd(), STDOUT_FILENO);
    (void)dup2(options.merge_output ? stdout_pipe.write_fd() : stderr_pipe.write_fd(),
               STDERR_FILENO);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    stdout_pipe.close_read();
    stdout_pipe.close_write();
    stderr_pipe.close_read();
    stderr_pipe.close_write();

    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(docker_binary_.c_str()));
    for (const auto &arg : args) {
      argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(docker_binary_.c_str(), argv.data());
    const std::string message =
        "exec " + docker_binary_ + " failed: " + std::strerror(errno) + "\n";
    (void)write(STDERR_FILENO, message.data(), message.size());
    _exit(127);
  }

  stdout_pipe.close_write();
  stderr_pipe.close_write();
  set_non_blocking(stdout_pipe.read_fd());
  set_non_blocking(stderr_pipe.read_fd());

  DockerProcessResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    (void)drain(stdout_pipe.read_fd(), result.stdout_text, options.on_output);
    (void)drain(stderr_pipe.read_fd(), result.stderr_text, nullptr);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      return common::Result<DockerProcessResult>::failure("waitpid failed for docker: " +
                                                           std::string(std::strerror(errno)));
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (options.timeout.count() > 0 && elapsed > options.timeout) {
      result.timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe.read_fd(), .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe.read_fd(), .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  // The child is gone; pull whatever is still buffered in the pipes.
  (void)drain(stdout_pipe.read_fd(), result.stdout_text, options.on_output);
  (void)drain(stderr_pipe.read_fd(), result.stderr_text, nullptr);

  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<DockerProcessResult>::failure("docker command timed out: " +
                                                           join_args(args));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string &diagnostic =
        result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
    const std::string message = diagnostic.empty() ? "docker command failed: " + join_args(args)
                                                   : diagnostic;
    return common::Result<DockerProcessResult>::failure(message);
  }

  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace boxrun::sandbox
