#include "migration/statement_sanitizer.hpp"
#include <cstddef>

namespace {
constexpr std::string_view LINE_COMMENT = "--";

[[nodiscard]] bool is_blank_line(std::string_view line) {
  return line.empty() || line == "\r";
}
} // namespace

[[nodiscard]] std::string clear_statement(std::string_view statement) {
  std::string cleared;
  cleared.reserve(statement.size());

  std::size_t line_start = 0;
  while (line_start < statement.size()) {
    const auto line_end = statement.find('\n', line_start);
    const bool terminated = line_end != std::string_view::npos;
    const auto content =
        statement.substr(line_start, terminated ? line_end - line_start
                                                : std::string_view::npos);

    if (!content.starts_with(LINE_COMMENT) && !is_blank_line(content)) {
      cleared.append(content);
      if (terminated) {
        cleared.push_back('\n');
      }
    }

    if (!terminated) {
      break;
    }
    line_start = line_end + 1;
  }

  return cleared;
}
