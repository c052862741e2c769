/**
 * @file ProcessRunner.cpp
 * @brief fork/exec implementation of ProcessRunner.
 */

#include "src/collect/inc/ProcessRunner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

#include <fmt/core.h>

namespace ibcheck {

namespace collect {

namespace {

using SteadyClock = std::chrono::steady_clock;

/// Wait for @p pid, retrying on EINTR. Returns the raw status or -1.
int reap(pid_t pid) noexcept {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

} // namespace

CommandResult SystemProcessRunner::run(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) {
  CommandResult result;
  if (argv.empty()) {
    result.error = "empty command";
    return result;
  }

  int pipeFds[2] = {-1, -1};
  if (::pipe2(pipeFds, O_CLOEXEC) != 0) {
    result.error = fmt::format("pipe: {}", std::strerror(errno));
    return result;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t PID = ::fork();
  if (PID < 0) {
    result.error = fmt::format("fork: {}", std::strerror(errno));
    ::close(pipeFds[0]);
    ::close(pipeFds[1]);
    return result;
  }

  if (PID == 0) {
    // Child: stdout -> pipe, stderr -> /dev/null.
    ::dup2(pipeFds[1], STDOUT_FILENO);
    const int DEVNULL = ::open("/dev/null", O_WRONLY);
    if (DEVNULL >= 0) {
      ::dup2(DEVNULL, STDERR_FILENO);
    }
    ::execvp(cargv[0], cargv.data());
    ::_exit(127);
  }

  ::close(pipeFds[1]);
  const int READ_FD = pipeFds[0];

  const SteadyClock::time_point DEADLINE = SteadyClock::now() + timeout;
  std::array<char, 4096> buf{};
  bool eof = false;

  while (!eof) {
    const auto REMAINING =
        std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - SteadyClock::now());
    if (REMAINING.count() <= 0) {
      result.timedOut = true;
      break;
    }

    struct pollfd pfd{READ_FD, POLLIN, 0};
    const int RC = ::poll(&pfd, 1, static_cast<int>(REMAINING.count()));
    if (RC < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.error = fmt::format("poll: {}", std::strerror(errno));
      break;
    }
    if (RC == 0) {
      result.timedOut = true;
      break;
    }

    const ssize_t N = ::read(READ_FD, buf.data(), buf.size());
    if (N < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      result.error = fmt::format("read: {}", std::strerror(errno));
      break;
    }
    if (N == 0) {
      eof = true;
      break;
    }
    if (result.output.size() < MAX_COMMAND_OUTPUT) {
      result.output.append(buf.data(), static_cast<std::size_t>(N));
    }
  }

  ::close(READ_FD);

  if (!eof) {
    ::kill(PID, SIGKILL);
  }

  const int STATUS = reap(PID);
  if (STATUS < 0) {
    if (result.error.empty()) {
      result.error = fmt::format("waitpid: {}", std::strerror(errno));
    }
    return result;
  }
  if (WIFEXITED(STATUS)) {
    result.exitCode = WEXITSTATUS(STATUS);
    if (result.exitCode == 127 && result.output.empty() && result.error.empty()) {
      result.error = fmt::format("'{}' not found or not executable", argv[0]);
    }
  }

  if (result.timedOut && result.error.empty()) {
    result.error = fmt::format("'{}' timed out after {} ms", argv[0], timeout.count());
  }
  return result;
}

} // namespace collect

} // namespace ibcheck
