#include "utils/diagnostic_log.hpp"
#include <trantor/utils/Logger.h>

void DiagnosticLog::info(const std::string &message) const {
  if (!_verbose) {
    return;
  }
  LOG_INFO << GRAY_COLOR << message << RESET_COLOR;
}
