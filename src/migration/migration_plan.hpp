#pragma once

/// @file
/// @brief The description of a single run, read from a YAML file.

#include "migration/migration_runner.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/node/node.h>

/**
 * @brief Everything needed to run one migration version once.
 *
 * A plan file looks like this:
 *
 * @code{.yaml}
 * version: 20240101120000
 * direction: up
 * use_transaction: true
 * no_versioning: false
 * statements:
 *   - CREATE TABLE t(id int);
 *   - INSERT INTO t VALUES(1);
 * @endcode
 *
 * direction is "up" or "down". use_transaction defaults to true and
 * no_versioning to false. statements may be empty.
 */
struct [[nodiscard]] MigrationPlan {
  std::int64_t version{};
  ExecutionMode mode{};
  std::vector<std::string> statements;

  /// @throws ConfigError if the file is missing or invalid.
  [[nodiscard]] static MigrationPlan load(const std::filesystem::path &path);

  /// @throws ConfigError if a field is missing or invalid.
  [[nodiscard]] static MigrationPlan from_yaml(const YAML::Node &node);
};
