#include "migration/migration_plan.hpp"
#include "utils/errors.hpp"
#include <format>
#include <trantor/utils/Logger.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/yaml.h>

namespace {
[[nodiscard]] bool parse_direction(const std::string &direction) {
  if (direction == "up") {
    return true;
  }
  if (direction == "down") {
    return false;
  }
  throw ConfigError(std::format(
      "Invalid 'direction' value '{}'. Use either up or down.", direction));
}
} // namespace

[[nodiscard]] MigrationPlan
MigrationPlan::load(const std::filesystem::path &path) {
  LOG_DEBUG << "Loading migration plan " << path.string();
  if (!std::filesystem::exists(path)) {
    throw ConfigError(
        std::format("Migration plan {} does not exist", path.string()));
  }

  try {
    return from_yaml(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::format("Invalid migration plan {}: {}",
                                  path.string(), e.what()));
  }
}

[[nodiscard]] MigrationPlan MigrationPlan::from_yaml(const YAML::Node &node) {
  if (!node["version"].IsDefined()) {
    throw ConfigError("Missing 'version' field in the migration plan.");
  }
  if (!node["direction"].IsDefined()) {
    throw ConfigError("Missing 'direction' field in the migration plan. Use "
                      "either up or down.");
  }

  MigrationPlan plan;
  try {
    plan.version = node["version"].as<std::int64_t>();
    plan.mode.direction = parse_direction(node["direction"].as<std::string>());
    plan.mode.use_tx = node["use_transaction"].as<bool>(true);
    plan.mode.no_versioning = node["no_versioning"].as<bool>(false);

    const auto statements = node["statements"];
    if (statements.IsDefined() && !statements.IsNull()) {
      if (!statements.IsSequence()) {
        throw ConfigError("'statements' must be a list of SQL statements.");
      }
      plan.statements.reserve(statements.size());
      for (const auto &statement : statements) {
        plan.statements.push_back(statement.as<std::string>());
      }
    }
  } catch (const YAML::Exception &e) {
    throw ConfigError(
        std::format("Invalid value in the migration plan: {}", e.what()));
  }

  return plan;
}
