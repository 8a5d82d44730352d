#pragma once

/// @file
/// @brief Progress reporting for statements that take a long time.

#include "database/database.hpp"
#include "utils/diagnostic_log.hpp"

#include <chrono>
#include <string>

/**
 * @brief Runs one statement and reports how long it has been running.
 *
 * With diagnostics disabled watch() simply calls the executor. With
 * diagnostics enabled the executor runs on its own thread while the caller
 * waits for its result and logs the elapsed time once per progress interval.
 *
 * The watchdog never cancels, interrupts or retries the statement. Whatever
 * the executor returns or throws is what watch() returns or throws.
 */
class ExecutionWatchdog {
public:
  static constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL =
      std::chrono::minutes(1);

  explicit ExecutionWatchdog(
      DiagnosticLog log,
      std::chrono::milliseconds progress_interval = DEFAULT_PROGRESS_INTERVAL);

  /**
   * @brief Executes the statement through the executor and waits for it.
   *
   * Blocks until the executor has finished, however long that takes.
   *
   * @param executor The connection or transaction to run the statement on.
   * @param statement The statement text.
   * @param params Positional parameters of the statement.
   * @throws Anything the executor throws, unchanged.
   */
  void watch(SqlExecutor &executor, const std::string &statement,
             const SqlParameters &params = {}) const;

  [[nodiscard]] std::chrono::milliseconds progress_interval() const noexcept {
    return _progress_interval;
  }

private:
  DiagnosticLog _log;
  std::chrono::milliseconds _progress_interval;
};

/// Formats a duration the way the progress messages show it, e.g. "1h2m5s".
[[nodiscard]] std::string format_elapsed(std::chrono::seconds elapsed);
