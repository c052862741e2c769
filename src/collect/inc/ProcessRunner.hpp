#ifndef IBCHECK_COLLECT_PROCESS_RUNNER_HPP
#define IBCHECK_COLLECT_PROCESS_RUNNER_HPP
/**
 * @file ProcessRunner.hpp
 * @brief Execution of external diagnostic tools (lspci, setpci, ip, ofed_info).
 *
 * Collectors never spawn processes directly; they take a ProcessRunner so
 * tests can substitute canned output.
 *
 * @note NOT RT-safe: fork/exec and heap allocation.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace ibcheck {
namespace collect {

/* ----------------------------- Constants ----------------------------- */

/// Default timeout for a diagnostic tool invocation.
inline constexpr std::chrono::seconds DEFAULT_COMMAND_TIMEOUT{30};

/// Output beyond this many bytes is discarded.
inline constexpr std::size_t MAX_COMMAND_OUTPUT = 1U << 20;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Outcome of a command.
 */
struct CommandResult {
  int exitCode{-1};       ///< Exit status, or -1 if the process did not exit normally
  std::string output{};   ///< Captured stdout
  std::string error{};    ///< Spawn/wait failure description (empty if spawned)
  bool timedOut{false};   ///< True if killed at the deadline

  /// True if the command ran to completion with status 0.
  [[nodiscard]] bool ok() const noexcept { return error.empty() && !timedOut && exitCode == 0; }
};

/* ----------------------------- ProcessRunner ----------------------------- */

/**
 * @brief Capability to run an external command and capture stdout.
 */
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  /**
   * @brief Run @p argv (argv[0] looked up in PATH).
   * @param argv Program and arguments.
   * @param timeout Kill the process after this long.
   */
  [[nodiscard]] virtual CommandResult run(const std::vector<std::string>& argv,
                                          std::chrono::milliseconds timeout) = 0;

  /// run() with DEFAULT_COMMAND_TIMEOUT.
  [[nodiscard]] CommandResult run(const std::vector<std::string>& argv) {
    return run(argv, DEFAULT_COMMAND_TIMEOUT);
  }
};

/**
 * @brief ProcessRunner backed by fork/execvp with a stdout pipe.
 *
 * stderr is redirected to /dev/null. The child is killed with SIGKILL when
 * the timeout expires and reaped before returning.
 */
class SystemProcessRunner final : public ProcessRunner {
public:
  using ProcessRunner::run;

  [[nodiscard]] CommandResult run(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout) override;
};

} // namespace collect
} // namespace ibcheck

#endif // IBCHECK_COLLECT_PROCESS_RUNNER_HPP
