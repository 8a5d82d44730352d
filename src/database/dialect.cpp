#include "database/dialect.hpp"
#include <format>

[[nodiscard]] std::string PostgresDialect::create_version_table_sql() const {
  return std::format("CREATE TABLE IF NOT EXISTS {} ("
                     "id serial NOT NULL, "
                     "version_id bigint NOT NULL, "
                     "is_applied boolean NOT NULL, "
                     "tstamp timestamp NULL default now(), "
                     "PRIMARY KEY(id))",
                     _table_name);
}

[[nodiscard]] std::string PostgresDialect::insert_version_sql() const {
  return std::format("INSERT INTO {} (version_id, is_applied) VALUES ($1, $2)",
                     _table_name);
}

[[nodiscard]] std::string PostgresDialect::delete_version_sql() const {
  return std::format("DELETE FROM {} WHERE version_id=$1", _table_name);
}

[[nodiscard]] std::string MysqlDialect::create_version_table_sql() const {
  return std::format("CREATE TABLE IF NOT EXISTS {} ("
                     "id serial NOT NULL, "
                     "version_id bigint NOT NULL, "
                     "is_applied boolean NOT NULL, "
                     "tstamp timestamp NULL default now(), "
                     "PRIMARY KEY(id))",
                     _table_name);
}

[[nodiscard]] std::string MysqlDialect::insert_version_sql() const {
  return std::format("INSERT INTO {} (version_id, is_applied) VALUES (?, ?)",
                     _table_name);
}

[[nodiscard]] std::string MysqlDialect::delete_version_sql() const {
  return std::format("DELETE FROM {} WHERE version_id=?", _table_name);
}

[[nodiscard]] std::string Sqlite3Dialect::create_version_table_sql() const {
  return std::format("CREATE TABLE IF NOT EXISTS {} ("
                     "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                     "version_id INTEGER NOT NULL, "
                     "is_applied INTEGER NOT NULL, "
                     "tstamp TIMESTAMP DEFAULT (datetime('now')))",
                     _table_name);
}

[[nodiscard]] std::string Sqlite3Dialect::insert_version_sql() const {
  return std::format("INSERT INTO {} (version_id, is_applied) VALUES (?, ?)",
                     _table_name);
}

[[nodiscard]] std::string Sqlite3Dialect::delete_version_sql() const {
  return std::format("DELETE FROM {} WHERE version_id=?", _table_name);
}

[[nodiscard]] std::unique_ptr<Dialect>
make_dialect(DatabaseBackend backend, const std::string &table_name) {
  switch (backend) {
  case DatabaseBackend::Postgresql:
    return std::make_unique<PostgresDialect>(table_name);
  case DatabaseBackend::Mysql:
    return std::make_unique<MysqlDialect>(table_name);
  case DatabaseBackend::Sqlite3:
    return std::make_unique<Sqlite3Dialect>(table_name);
  }
  throw ConfigError("Unknown database backend");
}
