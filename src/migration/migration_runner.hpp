#pragma once

/// @file
/// @brief Applies or reverts the statements of one migration version.

#include "database/database.hpp"
#include "database/dialect.hpp"
#include "migration/execution_watchdog.hpp"
#include "utils/diagnostic_log.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief How a single run executes. Fixed for the whole run.
 */
struct [[nodiscard]] ExecutionMode {
  /// Run all statements and the version change in one transaction.
  bool use_tx{true};
  /// true applies the version (up), false reverts it (down).
  bool direction{true};
  /// Leave the version table untouched.
  bool no_versioning{false};
};

struct [[nodiscard]] RunnerOptions {
  bool verbose{false};
  std::chrono::milliseconds progress_interval{
      ExecutionWatchdog::DEFAULT_PROGRESS_INTERVAL};
};

/**
 * @brief Runs the statement group of one migration version.
 *
 * Statements are executed strictly in order, each through the execution
 * watchdog. Afterwards the version marker is inserted (up) or deleted (down)
 * unless versioning is disabled. When the run is transactional, everything
 * happens inside one transaction which is rolled back on the first failure and
 * committed at the end.
 *
 * The connection is borrowed for the duration of each run and must not be used
 * by anyone else meanwhile. The runner does not coordinate concurrent runs.
 */
class MigrationRunner {
public:
  MigrationRunner(Connection &connection, const Dialect &dialect,
                  RunnerOptions options = {});

  /**
   * @brief Executes the statements and updates the version marker.
   *
   * @param statements The statement group, in execution order.
   * @param use_tx Wrap the run in a transaction.
   * @param version The migration version.
   * @param direction true to apply, false to revert.
   * @param no_versioning Skip the version marker.
   * @throws TransactionStartFailed if the transaction could not be started.
   * @throws StatementExecutionFailed if a statement failed.
   * @throws VersionRecordFailed if the version marker could not be changed.
   * @throws CommitFailed if the final commit failed.
   */
  void run(const std::vector<std::string> &statements, bool use_tx,
           std::int64_t version, bool direction, bool no_versioning) const;

  void run(const std::vector<std::string> &statements, std::int64_t version,
           ExecutionMode mode) const;

private:
  void run_in_transaction(const std::vector<std::string> &statements,
                          std::int64_t version, ExecutionMode mode) const;

  void run_without_transaction(const std::vector<std::string> &statements,
                               std::int64_t version, ExecutionMode mode) const;

  void execute_statements(SqlExecutor &executor,
                          const std::vector<std::string> &statements) const;

  void record_version(SqlExecutor &executor, std::int64_t version,
                      bool direction) const;

  void rollback(Transaction &transaction) const;

  Connection &_connection;
  const Dialect &_dialect;
  DiagnosticLog _log;
  ExecutionWatchdog _watchdog;
};
