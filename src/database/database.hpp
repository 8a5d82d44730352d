#pragma once

/// @file
/// @brief The handles the migration runner talks to the database through.
///
/// A plain connection and a transaction expose the same execute() call, so the
/// runner does not care which one a statement goes to.

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

/// A positional statement parameter. Versions are bound as int64_t, the
/// applied flag as bool.
using SqlParameter = std::variant<std::int64_t, bool>;
using SqlParameters = std::vector<SqlParameter>;

/**
 * @brief Anything that can execute one parameterized statement.
 */
class SqlExecutor {
public:
  virtual ~SqlExecutor() = default;

  /**
   * @brief Executes a single statement and waits for it to finish.
   *
   * @param sql The statement text, sent as is.
   * @param params Positional parameters, bound in order.
   * @throws DatabaseError if the database rejects the statement.
   */
  virtual void execute(const std::string &sql, const SqlParameters &params) = 0;
};

/**
 * @brief A transaction scoped handle.
 *
 * Destroying a transaction that was never committed rolls it back.
 */
class Transaction : public SqlExecutor {
public:
  /// @throws DatabaseError if the commit did not go through.
  virtual void commit() = 0;

  /// @throws DatabaseError if the rollback could not be issued.
  virtual void rollback() = 0;
};

/**
 * @brief A plain connection that runs each statement in its own implicit
 * transaction.
 */
class Connection : public SqlExecutor {
public:
  /// @throws DatabaseError if no transaction could be started.
  [[nodiscard]] virtual std::unique_ptr<Transaction> begin_transaction() = 0;
};
