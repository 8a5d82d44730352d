#include "migration/execution_watchdog.hpp"
#include "test_helpers.hpp"
#include "utils/diagnostic_log.hpp"
#include "utils/errors.hpp"
#include <chrono>
#include <snitch/snitch.hpp>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {
/// Sleeps for a while, remembers the thread it ran on, then succeeds or throws.
class SlowExecutor final : public SqlExecutor {
public:
  SlowExecutor(std::chrono::milliseconds delay, bool fail)
      : _delay(delay), _fail(fail) {}

  void execute(const std::string &sql, const SqlParameters &params) override {
    thread_id = std::this_thread::get_id();
    last_sql = sql;
    last_params = params;
    ++calls;
    std::this_thread::sleep_for(_delay);
    if (_fail) {
      throw DatabaseError("canceling statement due to lock timeout");
    }
  }

  std::thread::id thread_id;
  std::string last_sql;
  SqlParameters last_params;
  int calls = 0;

private:
  std::chrono::milliseconds _delay;
  bool _fail;
};

/// Throws something that is not a DatabaseError.
class ThrowingExecutor final : public SqlExecutor {
public:
  void execute(const std::string &, const SqlParameters &) override {
    throw std::logic_error("driver bug");
  }
};
} // namespace

TEST_CASE("ExecutionWatchdog without diagnostics", "[watchdog]") {
  const ExecutionWatchdog watchdog(DiagnosticLog(false), 10ms);

  SECTION("Runs the executor on the calling thread") {
    SlowExecutor executor(0ms, false);
    watchdog.watch(executor, "SELECT 1;");
    REQUIRE(executor.calls == 1);
    REQUIRE(executor.thread_id == std::this_thread::get_id());
    REQUIRE(executor.last_sql == "SELECT 1;");
  }

  SECTION("Does not log progress however long the statement takes") {
    test_helpers::LogCapture capture;
    SlowExecutor executor(60ms, false);
    watchdog.watch(executor, "SELECT pg_sleep(1);");
    REQUIRE(capture.count_containing("still in progress") == 0);
  }

  SECTION("Passes failures through") {
    SlowExecutor executor(0ms, true);
    REQUIRE_THROWS_MATCHES(
        watchdog.watch(executor, "SELECT 1;"), DatabaseError,
        snitch::matchers::with_what_contains{"lock timeout"});
  }
}

TEST_CASE("ExecutionWatchdog with diagnostics", "[watchdog]") {
  const ExecutionWatchdog watchdog(DiagnosticLog(true), 20ms);

  SECTION("Runs the executor on another thread and waits for it") {
    SlowExecutor executor(0ms, false);
    watchdog.watch(executor, "SELECT 1;");
    REQUIRE(executor.calls == 1);
    REQUIRE(executor.thread_id != std::this_thread::get_id());
  }

  SECTION("Forwards the parameters unchanged") {
    SlowExecutor executor(0ms, false);
    const SqlParameters params{std::int64_t{42}, true};
    watchdog.watch(executor, "INSERT VERSION", params);
    REQUIRE(executor.last_params == params);
  }

  SECTION("Logs progress while a slow statement succeeds") {
    test_helpers::LogCapture capture;
    SlowExecutor executor(150ms, false);
    const auto started = std::chrono::steady_clock::now();
    watchdog.watch(executor, "SELECT pg_sleep(1);");
    const auto waited = std::chrono::steady_clock::now() - started;

    REQUIRE(executor.calls == 1);
    REQUIRE(waited >= 150ms);
    REQUIRE(capture.count_containing(
                "Executing statement still in progress for") >= 1);
  }

  SECTION("Returns the failure of a slow statement unchanged") {
    test_helpers::LogCapture capture;
    SlowExecutor executor(100ms, true);
    REQUIRE_THROWS_MATCHES(
        watchdog.watch(executor, "LOCK TABLE t;"), DatabaseError,
        snitch::matchers::with_what_contains{
            "canceling statement due to lock timeout"});
    REQUIRE(executor.calls == 1);
    REQUIRE(capture.count_containing("still in progress") >= 1);
  }

  SECTION("Does not turn other exceptions into database errors") {
    ThrowingExecutor executor;
    REQUIRE_THROWS_AS(watchdog.watch(executor, "SELECT 1;"),
                      std::logic_error);
  }

  SECTION("Fast statements do not log progress") {
    test_helpers::LogCapture capture;
    const ExecutionWatchdog patient(DiagnosticLog(true), 2s);
    SlowExecutor executor(0ms, false);
    patient.watch(executor, "SELECT 1;");
    REQUIRE(capture.count_containing("still in progress") == 0);
  }
}

TEST_CASE("ExecutionWatchdog rejects a non-positive interval", "[watchdog]") {
  REQUIRE_THROWS_AS(
      static_cast<void>(ExecutionWatchdog(DiagnosticLog(true), 0ms)),
      std::invalid_argument);
}

TEST_CASE("format_elapsed", "[watchdog]") {
  REQUIRE(format_elapsed(0s) == "0s");
  REQUIRE(format_elapsed(45s) == "45s");
  REQUIRE(format_elapsed(60s) == "1m0s");
  REQUIRE(format_elapsed(125s) == "2m5s");
  REQUIRE(format_elapsed(3725s) == "1h2m5s");
}
