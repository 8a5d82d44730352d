#include "database/dialect.hpp"
#include "database/drogon_database.hpp"
#include "migration/migration_plan.hpp"
#include "migration/migration_runner.hpp"
#include "utils/config.hpp"
#include "utils/errors.hpp"
#include "yaml-cpp/exceptions.h"
#include <stdexcept>
#include <trantor/utils/Logger.h>

static constexpr auto DEFAULT_PLAN_PATH = "./migration.yaml";

int main(int argc, char *argv[]) {
  const auto *const plan_path = argc > 1 ? argv[1] : DEFAULT_PLAN_PATH;

  try {
    const Config config{};
    trantor::Logger::setLogLevel(config.get_log_level());

    const auto plan = MigrationPlan::load(plan_path);
    const auto dialect = make_dialect(config.db_config.backend,
                                      config.db_config.version_table);
    DrogonConnection connection(make_db_client(config.db_config));

    if (!plan.mode.no_versioning) {
      LOG_DEBUG << "Ensuring version table " << config.db_config.version_table
                << " exists";
      connection.execute(dialect->create_version_table_sql(), {});
    }

    const MigrationRunner runner(
        connection, *dialect,
        RunnerOptions{
            .verbose = config.runner_config.verbose,
            .progress_interval = config.runner_config.progress_interval,
        });

    LOG_INFO << "Running migration " << plan.version
             << (plan.mode.direction ? " up" : " down");
    runner.run(plan.statements, plan.version, plan.mode);
    LOG_INFO << "Finished migration " << plan.version;
  } catch (const YAML::BadFile &error) {
    LOG_ERROR << "Missing or invalid config.yaml file. Make sure to create it "
                 "prior to running stratum";
    LOG_ERROR << error.what();
    return 1;
  } catch (const ConfigError &error) {
    LOG_ERROR << error.what();
    return 1;
  } catch (const RunError &) {
    // Already logged by the runner.
    return 1;
  } catch (const DatabaseError &error) {
    LOG_ERROR << "Failed to prepare the version table: " << error.what();
    return 1;
  } catch (std::runtime_error &error) {
    LOG_ERROR << error.what();
    return 1;
  }

  return 0;
}
