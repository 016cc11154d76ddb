#include "captlog/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace captlog::common {

namespace {

constexpr int kExecFailedCode = 127;

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

void close_pair(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
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

int decode_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                  const ProcessOptions &options) {
  if (argv.empty()) {
    return Result<ProcessResult>::failure("command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (options.capture_output && (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0)) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    if (options.capture_output) {
      (void)dup2(stdout_pipe[1], STDOUT_FILENO);
      (void)dup2(stderr_pipe[1], STDERR_FILENO);
      close_pair(stdout_pipe);
      close_pair(stderr_pipe);
    }
    if (options.working_dir.has_value() && chdir(options.working_dir->c_str()) != 0) {
      _exit(kExecFailedCode);
    }

    std::vector<char *> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      cargs.push_back(const_cast<char *>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    execvp(cargs[0], cargs.data());
    _exit(kExecFailedCode);
  }

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;

  if (options.capture_output) {
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    set_non_blocking(stdout_pipe[0]);
    set_non_blocking(stderr_pipe[0]);

    const auto started = std::chrono::steady_clock::now();
    while (true) {
      read_into_buffer(stdout_pipe[0], stdout_text);
      read_into_buffer(stderr_pipe[0], stderr_text);

      const pid_t waited = waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        break;
      }
      if (waited < 0 && errno != EINTR) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        return Result<ProcessResult>::failure("failed to wait for " + argv.front());
      }

      if (options.timeout.has_value() &&
          std::chrono::steady_clock::now() - started > *options.timeout) {
        timed_out = true;
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

    read_into_buffer(stdout_pipe[0], stdout_text);
    read_into_buffer(stderr_pipe[0], stderr_text);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
  } else {
    while (waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) {
        return Result<ProcessResult>::failure("failed to wait for " + argv.front());
      }
    }
  }

  if (timed_out) {
    return Result<ProcessResult>::failure("command timed out: " + join_args(argv));
  }

  ProcessResult result;
  result.exit_code = decode_status(status);
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  return Result<ProcessResult>::success(std::move(result));
}

bool is_executable(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> find_executable(const std::string &name) {
  if (name.find('/') != std::string::npos) {
    if (is_executable(name)) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr || *path_env == '\0') {
    return std::nullopt;
  }

  std::stringstream stream(path_env);
  std::string dir;
  while (std::getline(stream, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    const auto candidate = std::filesystem::path(dir) / name;
    if (is_executable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace captlog::common
