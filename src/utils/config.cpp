#include "utils/config.hpp"
#include "yaml-cpp/yaml.h"
#include <format>
#include <string>
#include <yaml-cpp/node/node.h>

static constexpr unsigned short DEFAULT_POSTGRES_PORT = 5432;
static constexpr unsigned short DEFAULT_MYSQL_PORT = 3306;
static constexpr auto DEFAULT_VERSION_TABLE = "stratum_db_version";

namespace {
/// Quotes a value for a libpq style "key=value" connection string.
std::string quote_conninfo_value(const std::string &value) {
  std::string quoted = "'";
  for (const char c : value) {
    if (c == '\'' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '\'';
  return quoted;
}
} // namespace

[[nodiscard]] DatabaseBackend parse_backend(const std::string &name) {
  if (name == "postgresql" || name == "postgres") {
    return DatabaseBackend::Postgresql;
  }
  if (name == "mysql") {
    return DatabaseBackend::Mysql;
  }
  if (name == "sqlite3" || name == "sqlite") {
    return DatabaseBackend::Sqlite3;
  }
  throw ConfigError(std::format("Unsupported database backend '{}'. Use one of "
                                "postgresql, mysql or sqlite3.",
                                name));
}

[[nodiscard]] std::string DBConfig::get_connection_string() const {
  switch (backend) {
  case DatabaseBackend::Postgresql:
    return std::format("host={} port={} dbname={} user={} password={}",
                       quote_conninfo_value(host), port,
                       quote_conninfo_value(database_name),
                       quote_conninfo_value(user),
                       quote_conninfo_value(password));
  case DatabaseBackend::Mysql:
    return std::format("host={} port={} dbname={} user={} password={}", host,
                       port, database_name, user, password);
  case DatabaseBackend::Sqlite3:
    return std::format("filename={}", filename.string());
  }
  throw ConfigError("Unknown database backend");
}

/**
 * @brief Loads the database configuration from a YAML node.
 *
 * This function takes a YAML node as input and extracts the database
 * configuration from it. For the server backends this includes the host, port,
 * database name, user, and password. The port defaults to the backend's
 * default port if not provided. For sqlite3 only the filename is required.
 *
 * @param config The YAML node from which to load the database configuration.
 * @throws ConfigError If a field required by the backend is not defined in the
 * YAML node.
 */
void Config::load_db(const YAML::Node &config) {
  if (!config["database"].IsDefined()) {
    throw ConfigError("Missing 'database' field. Unable to start. Make "
                      "sure you set the database configuration.");
  }
  const auto database = config["database"];

  db_config.backend =
      parse_backend(database["backend"].as<std::string>("postgresql"));
  db_config.connections =
      database["connections"].as<std::size_t>(db_config.connections);
  db_config.version_table =
      database["version_table"].as<std::string>(DEFAULT_VERSION_TABLE);
  if (db_config.connections == 0) {
    throw ConfigError("'database.connections' must be at least 1.");
  }
  if (db_config.version_table.empty()) {
    throw ConfigError("'database.version_table' must not be empty.");
  }

  if (db_config.backend == DatabaseBackend::Sqlite3) {
    db_config.filename = database["filename"].as<std::string>("");
    if (db_config.filename.empty()) {
      throw ConfigError(
          "Missing 'database.filename' field. Unable to start. Make sure you "
          "set the path of the sqlite3 database file.");
    }
    return;
  }

  db_config.host = database["host"].as<std::string>("");
  // Default to the backend's port if not provided
  db_config.port = database["port"].as<unsigned short>(
      db_config.backend == DatabaseBackend::Mysql ? DEFAULT_MYSQL_PORT
                                                  : DEFAULT_POSTGRES_PORT);
  db_config.database_name = database["database_name"].as<std::string>("");
  db_config.user = database["user"].as<std::string>("");
  if (!database["password"].IsDefined()) {
    throw ConfigError(
        "Missing 'database.password' field. Unable "
        "to start. Make sure you set the database password.");
  }
  db_config.password = database["password"].as<std::string>();

  if (db_config.host.empty()) {
    throw ConfigError(
        "Missing 'database.host' field. Unable to start. Make sure you set "
        "the database host.");
  }

  if (db_config.database_name.empty()) {
    throw ConfigError("Missing 'database.database_name' field. Unable "
                      "to start. Make sure you set the database name.");
  }

  if (db_config.user.empty()) {
    throw ConfigError("Missing 'database.user' field. Unable "
                      "to start. Make sure you set the database user.");
  }
}

/**
 * @brief Loads the runner configuration from a YAML node.
 *
 * The whole section is optional. verbose defaults to false and the progress
 * interval to one minute.
 *
 * @param config The YAML node from which to load the runner configuration.
 * @throws ConfigError If the progress interval is not positive.
 */
void Config::load_runner(const YAML::Node &config) {
  if (!config["runner"].IsDefined()) {
    return;
  }
  const auto runner = config["runner"];
  runner_config.verbose = runner["verbose"].as<bool>(false);
  if (runner["progress_interval_seconds"].IsDefined()) {
    const auto seconds = runner["progress_interval_seconds"].as<long>();
    if (seconds <= 0) {
      throw ConfigError(
          "'runner.progress_interval_seconds' must be a positive number of "
          "seconds.");
    }
    runner_config.progress_interval = std::chrono::seconds(seconds);
  }
}

[[nodiscard]] trantor::Logger::LogLevel Config::get_log_level() const {
  if (log_level == "trace") {
    return trantor::Logger::kTrace;
  }
  if (log_level == "debug") {
    return trantor::Logger::kDebug;
  }
  if (log_level == "info") {
    return trantor::Logger::kInfo;
  }
  if (log_level == "warn") {
    return trantor::Logger::kWarn;
  }
  if (log_level == "error") {
    return trantor::Logger::kError;
  }
  if (log_level == "fatal") {
    return trantor::Logger::kFatal;
  }
  throw ConfigError(std::format("Unknown log_level '{}'. Use one of trace, "
                                "debug, info, warn, error or fatal.",
                                log_level));
}
