#include "migration/execution_watchdog.hpp"
#include <format>
#include <future>
#include <stdexcept>
#include <utility>

ExecutionWatchdog::ExecutionWatchdog(
    DiagnosticLog log, std::chrono::milliseconds progress_interval)
    : _log(log), _progress_interval(progress_interval) {
  if (_progress_interval <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("progress interval must be positive");
  }
}

void ExecutionWatchdog::watch(SqlExecutor &executor,
                              const std::string &statement,
                              const SqlParameters &params) const {
  if (!_log.enabled()) {
    executor.execute(statement, params);
    return;
  }

  const auto started = std::chrono::steady_clock::now();
  auto outcome = std::async(std::launch::async, [&executor, &statement,
                                                 &params]() {
    executor.execute(statement, params);
  });

  while (outcome.wait_for(_progress_interval) != std::future_status::ready) {
    const auto elapsed = std::chrono::round<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    _log.info(std::format("Executing statement still in progress for {}",
                          format_elapsed(elapsed)));
  }

  // Rethrows the executor's exception as is.
  outcome.get();
}

[[nodiscard]] std::string format_elapsed(std::chrono::seconds elapsed) {
  const auto hours = std::chrono::duration_cast<std::chrono::hours>(elapsed);
  elapsed -= hours;
  const auto minutes =
      std::chrono::duration_cast<std::chrono::minutes>(elapsed);
  elapsed -= minutes;

  if (hours.count() > 0) {
    return std::format("{}h{}m{}s", hours.count(), minutes.count(),
                       elapsed.count());
  }
  if (minutes.count() > 0) {
    return std::format("{}m{}s", minutes.count(), elapsed.count());
  }
  return std::format("{}s", elapsed.count());
}
