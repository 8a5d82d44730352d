#pragma once

/// @file
/// @brief Exceptions raised by stratum.

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Exception class for configuration errors.
 *
 * This class represents an error that occurs when there is a problem with the
 * configuration or with a migration plan file. It inherits from the standard
 * exception class.
 */
class ConfigError final : public std::exception {
private:
  std::string _message; ///< The error message.

public:
  /**
   * @brief Constructs a new ConfigError object.
   *
   * @param message The error message.
   */
  explicit ConfigError(std::string message) : _message(std::move(message)) {}

  [[nodiscard]] const char *what() const noexcept override {
    return _message.c_str();
  }
};

/**
 * @brief A failure reported by the database for a single call.
 *
 * Connections and transactions translate whatever their driver throws into
 * this type so the runner only has to know about one database error.
 */
class DatabaseError final : public std::runtime_error {
public:
  explicit DatabaseError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Base class of every failure a migration run can end with.
 *
 * A run either returns normally or throws exactly one RunError. The kind tells
 * the caller which phase failed, cause() holds the database message that
 * triggered it.
 */
class RunError : public std::exception {
public:
  enum class Kind : std::uint8_t {
    TransactionStartFailed,
    StatementExecutionFailed,
    VersionRecordFailed,
    CommitFailed,
  };

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  /// The message of the underlying database error.
  [[nodiscard]] const std::string &cause() const noexcept { return _cause; }

  [[nodiscard]] const char *what() const noexcept override {
    return _message.c_str();
  }

protected:
  RunError(Kind kind, const std::string &context, std::string cause)
      : _kind(kind), _cause(std::move(cause)),
        _message(context + ": " + _cause) {}

private:
  Kind _kind;
  std::string _cause;
  std::string _message;
};

/// The transaction could not be started. No statement was executed.
class TransactionStartFailed final : public RunError {
public:
  explicit TransactionStartFailed(std::string cause)
      : RunError(Kind::TransactionStartFailed, "failed to begin transaction",
                 std::move(cause)) {}
};

/**
 * @brief A statement of the group failed.
 *
 * statement() is the sanitized text of the failing statement, which is what
 * was logged before it ran.
 */
class StatementExecutionFailed final : public RunError {
private:
  std::string _statement;

public:
  StatementExecutionFailed(std::string statement, std::string cause)
      : RunError(Kind::StatementExecutionFailed,
                 "failed to execute SQL query \"" + statement + "\"",
                 std::move(cause)),
        _statement(std::move(statement)) {}

  [[nodiscard]] const std::string &statement() const noexcept {
    return _statement;
  }
};

/// Inserting or deleting the version marker failed.
class VersionRecordFailed final : public RunError {
private:
  std::int64_t _version;

public:
  VersionRecordFailed(std::int64_t version, bool direction, std::string cause)
      : RunError(Kind::VersionRecordFailed,
                 direction ? "failed to insert new version " +
                                 std::to_string(version)
                           : "failed to delete version " +
                                 std::to_string(version),
                 std::move(cause)),
        _version(version) {}

  [[nodiscard]] std::int64_t version() const noexcept { return _version; }
};

/// The final commit failed. Nothing of the run may be assumed applied.
class CommitFailed final : public RunError {
public:
  explicit CommitFailed(std::string cause)
      : RunError(Kind::CommitFailed, "failed to commit transaction",
                 std::move(cause)) {}
};
