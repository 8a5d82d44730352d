#pragma once

/// @file
/// @brief The Configuration of the application.
/// This allows to have a nice structure as a struct instead of using brackets.

#include "errors.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <trantor/utils/Logger.h>
#include <yaml-cpp/node/node.h>
#include <yaml-cpp/node/parse.h>

/// The database servers stratum knows how to talk to.
enum class DatabaseBackend { Postgresql, Mysql, Sqlite3 };

/**
 * @brief A struct representing the database configuration.
 *
 * This struct holds the configuration for the database connection. For
 * PostgreSQL and MySQL it includes the host, database name, user, password,
 * and port. For SQLite3 only the filename is used. version_table names the
 * table the version markers are written to.
 *
 * @note The [[nodiscard]] attribute indicates that the compiler will warn if
 * the return value is discarded.
 */
struct [[nodiscard]] DBConfig {
  DatabaseBackend backend{DatabaseBackend::Postgresql};
  std::string host;
  std::string database_name;
  std::string user;
  std::string password;
  unsigned short port{};
  std::filesystem::path filename;
  std::size_t connections{1};
  std::string version_table;

  /// The connection string in the format the Drogon client of the backend
  /// expects.
  [[nodiscard]] std::string get_connection_string() const;
};

/**
 * @brief A struct representing the runner configuration.
 *
 * verbose enables the diagnostic log lines and the watchdog. The progress
 * interval is how often the watchdog reports a statement that is still
 * running.
 */
struct [[nodiscard]] RunnerConfig {
  bool verbose{false};
  std::chrono::seconds progress_interval{std::chrono::minutes(1)};
};

/**
 * @brief A struct representing the overall configuration.
 *
 * This struct holds the configurations for the database and the runner. The
 * constructor for this struct loads the configurations from a YAML file.
 *
 * @throws ConfigError if the config file is missing or invalid.
 */
struct [[nodiscard]] Config {
  DBConfig db_config{};         // NOLINT(*-non-private-member-variables-in-classes)
  RunnerConfig runner_config{}; // NOLINT(*-non-private-member-variables-in-classes)

  std::string log_level;

  /**
   * @brief Constructs a new Config object.
   *
   * This constructor loads the configurations from a YAML file, by default
   * "config.yaml" in the working directory. It calls the load_db and
   * load_runner methods to load the respective configurations.
   */
  [[nodiscard]] explicit Config(
      const std::filesystem::path &path = "./config.yaml") {
    LOG_INFO << "Loading config file";
    if (!std::filesystem::exists(path)) {
      throw ConfigError("Missing or invalid " + path.string() +
                        " file. Make sure to create it prior to running "
                        "stratum");
    }

    const YAML::Node config = YAML::LoadFile(path.string());
    LOG_DEBUG << "Config file loaded";
    LOG_DEBUG << "Loading log_level configuration";
    if (config["log_level"].IsDefined()) {
      log_level = config["log_level"].as<std::string>();
    } else {
      log_level = "info";
    }
    LOG_DEBUG << "Loading database configuration";
    this->load_db(config);
    LOG_DEBUG << "Database configuration loaded";
    LOG_DEBUG << "Loading runner configuration";
    this->load_runner(config);
    LOG_DEBUG << "Runner configuration loaded";
  }

  /// Maps log_level to trantor's log level.
  /// @throws ConfigError for unknown names.
  [[nodiscard]] trantor::Logger::LogLevel get_log_level() const;

private:
  void load_db(const YAML::Node &config);

  void load_runner(const YAML::Node &config);
};

/// Parses "postgresql", "mysql" or "sqlite3".
/// @throws ConfigError for anything else.
[[nodiscard]] DatabaseBackend parse_backend(const std::string &name);
