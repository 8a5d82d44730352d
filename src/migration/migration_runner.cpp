#include "migration/migration_runner.hpp"
#include "migration/statement_sanitizer.hpp"
#include "utils/errors.hpp"
#include <format>
#include <memory>
#include <trantor/utils/Logger.h>

MigrationRunner::MigrationRunner(Connection &connection,
                                 const Dialect &dialect, RunnerOptions options)
    : _connection(connection), _dialect(dialect), _log(options.verbose),
      _watchdog(_log, options.progress_interval) {}

void MigrationRunner::run(const std::vector<std::string> &statements,
                          bool use_tx, std::int64_t version, bool direction,
                          bool no_versioning) const {
  run(statements, version,
      ExecutionMode{.use_tx = use_tx,
                    .direction = direction,
                    .no_versioning = no_versioning});
}

void MigrationRunner::run(const std::vector<std::string> &statements,
                          std::int64_t version, ExecutionMode mode) const {
  LOG_DEBUG << "Running " << statements.size() << " statement(s) of version "
            << version << (mode.direction ? " (up" : " (down")
            << (mode.use_tx ? ", transactional" : ", no transaction")
            << (mode.no_versioning ? ", no versioning)" : ")");

  if (statements.empty() && mode.no_versioning) {
    LOG_DEBUG << "Nothing to run for version " << version;
    return;
  }

  try {
    if (mode.use_tx) {
      run_in_transaction(statements, version, mode);
    } else {
      run_without_transaction(statements, version, mode);
    }
  } catch (const RunError &e) {
    LOG_ERROR << e.what();
    throw;
  }
}

void MigrationRunner::run_in_transaction(
    const std::vector<std::string> &statements, std::int64_t version,
    ExecutionMode mode) const {
  _log.info("Begin transaction");

  std::unique_ptr<Transaction> transaction;
  try {
    transaction = _connection.begin_transaction();
  } catch (const DatabaseError &e) {
    throw TransactionStartFailed(e.what());
  }

  try {
    execute_statements(*transaction, statements);
    if (!mode.no_versioning) {
      record_version(*transaction, version, mode.direction);
    }
  } catch (const RunError &) {
    rollback(*transaction);
    throw;
  }

  _log.info("Commit transaction");
  try {
    transaction->commit();
  } catch (const DatabaseError &e) {
    throw CommitFailed(e.what());
  }
}

void MigrationRunner::run_without_transaction(
    const std::vector<std::string> &statements, std::int64_t version,
    ExecutionMode mode) const {
  execute_statements(_connection, statements);
  if (!mode.no_versioning) {
    record_version(_connection, version, mode.direction);
  }
}

void MigrationRunner::execute_statements(
    SqlExecutor &executor, const std::vector<std::string> &statements) const {
  for (const auto &statement : statements) {
    const auto cleared = clear_statement(statement);
    _log.info(std::format("Executing statement: {}", cleared));
    try {
      _watchdog.watch(executor, statement);
    } catch (const DatabaseError &e) {
      throw StatementExecutionFailed(cleared, e.what());
    }
  }
}

void MigrationRunner::record_version(SqlExecutor &executor,
                                     std::int64_t version,
                                     bool direction) const {
  try {
    if (direction) {
      _watchdog.watch(executor, _dialect.insert_version_sql(),
                      {version, direction});
    } else {
      _watchdog.watch(executor, _dialect.delete_version_sql(), {version});
    }
  } catch (const DatabaseError &e) {
    throw VersionRecordFailed(version, direction, e.what());
  }
}

// Rollback failures are only logged. The error that caused the rollback is
// the one reported to the caller.
void MigrationRunner::rollback(Transaction &transaction) const {
  _log.info("Rollback transaction");
  try {
    transaction.rollback();
  } catch (const DatabaseError &e) {
    LOG_WARN << "Rollback failed, reporting the original error instead: "
             << e.what();
  }
}
