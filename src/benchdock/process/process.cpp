#include "benchdock/process/process.hpp"

#include "benchdock/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace benchdock {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr std::size_t INITIAL_OUTPUT_RESERVE = 8192;

auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

auto fork_and_exec(const std::string& cmd, const std::string& working_dir,
                   int read_fd, int write_fd) -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only
    close(read_fd);
    dup2(write_fd, STDOUT_FILENO);
    dup2(write_fd, STDERR_FILENO);
    close(write_fd);

    if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
      _exit(127);
    }

    execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
    _exit(127);
  }

  return pid;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Drains `fd` until EOF. Bytes beyond `max_output` are read and dropped so
// the child never blocks on a full pipe.
auto read_output(int fd, std::size_t max_output) -> std::string {
  std::string output;
  output.reserve(INITIAL_OUTPUT_RESERVE);
  std::array<char, READ_BUFFER_SIZE> buffer;
  bool truncated = false;

  pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
  while (true) {
    int rc = poll(&pfd, 1, -1);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (bytes_read == 0) {
      break;
    }

    auto n = static_cast<std::size_t>(bytes_read);
    if (output.size() < max_output) {
      output.append(buffer.data(), std::min(n, max_output - output.size()));
    } else {
      truncated = true;
    }
  }

  if (truncated) {
    log::warn("Command output truncated to {} bytes", max_output);
  }
  return output;
}

auto wait_process(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return -1;
    }
  }
  return get_exit_code(status);
}

}  // namespace

auto run_command(std::string_view cmd, const CommandOptions& options)
    -> Result<CommandOutput> {
  auto [read_fd, write_fd] = create_pipe();
  if (read_fd < 0) {
    log::error("Failed to create pipe: {}", std::strerror(errno));
    return fail(Error::ProcessSpawnFailed);
  }

  std::string command{cmd};
  pid_t pid = fork_and_exec(command, options.working_dir, read_fd, write_fd);
  close(write_fd);
  if (pid < 0) {
    log::error("Failed to fork process: {}", std::strerror(errno));
    close(read_fd);
    return fail(Error::ProcessSpawnFailed);
  }

  log::trace("Spawned pid {}: {}", pid, command);

  CommandOutput result;
  result.output = read_output(read_fd, options.max_output);
  close(read_fd);
  result.exit_code = wait_process(pid);

  log::trace("pid {} exited with code {}", pid, result.exit_code);
  return ok(std::move(result));
}

}  // namespace benchdock
