#pragma once

/// @file
/// @brief SQL for the version table, per database backend.

#include "utils/config.hpp"

#include <memory>
#include <string>
#include <utility>

/**
 * @brief Produces the backend specific statements for the version table.
 *
 * The runner treats the returned text as opaque and only supplies the
 * positional parameters.
 */
class Dialect {
public:
  virtual ~Dialect() = default;

  /// Creates the version table if it does not exist yet. No parameters.
  [[nodiscard]] virtual std::string create_version_table_sql() const = 0;

  /// Records a version. Parameters: version (int64), applied (bool).
  [[nodiscard]] virtual std::string insert_version_sql() const = 0;

  /// Removes a version. Parameter: version (int64).
  [[nodiscard]] virtual std::string delete_version_sql() const = 0;
};

class PostgresDialect final : public Dialect {
public:
  explicit PostgresDialect(std::string table_name)
      : _table_name(std::move(table_name)) {}

  [[nodiscard]] std::string create_version_table_sql() const override;
  [[nodiscard]] std::string insert_version_sql() const override;
  [[nodiscard]] std::string delete_version_sql() const override;

private:
  std::string _table_name;
};

class MysqlDialect final : public Dialect {
public:
  explicit MysqlDialect(std::string table_name)
      : _table_name(std::move(table_name)) {}

  [[nodiscard]] std::string create_version_table_sql() const override;
  [[nodiscard]] std::string insert_version_sql() const override;
  [[nodiscard]] std::string delete_version_sql() const override;

private:
  std::string _table_name;
};

class Sqlite3Dialect final : public Dialect {
public:
  explicit Sqlite3Dialect(std::string table_name)
      : _table_name(std::move(table_name)) {}

  [[nodiscard]] std::string create_version_table_sql() const override;
  [[nodiscard]] std::string insert_version_sql() const override;
  [[nodiscard]] std::string delete_version_sql() const override;

private:
  std::string _table_name;
};

/// The dialect matching the configured backend.
[[nodiscard]] std::unique_ptr<Dialect>
make_dialect(DatabaseBackend backend, const std::string &table_name);
