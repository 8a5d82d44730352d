#pragma once

/// @file
/// @brief Verbose-only run diagnostics.

#include <string>

static constexpr auto GRAY_COLOR = "\033[90m";
static constexpr auto RESET_COLOR = "\033[00m";

/**
 * @brief Writes the lifecycle and progress messages of a migration run.
 *
 * Messages are only emitted when the log was created verbose. They go to
 * trantor's logger at info level, colored gray so they stand apart from the
 * regular output.
 */
class DiagnosticLog {
public:
  explicit DiagnosticLog(bool verbose) : _verbose(verbose) {}

  [[nodiscard]] bool enabled() const noexcept { return _verbose; }

  void info(const std::string &message) const;

private:
  bool _verbose;
};
