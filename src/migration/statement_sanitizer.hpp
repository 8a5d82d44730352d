#pragma once

/// @file
/// @brief Makes SQL statements readable in log output.

#include <string>
#include <string_view>

/**
 * @brief Strips line comments and blank lines from a statement.
 *
 * Every line starting with "--" is removed together with its line break,
 * then every empty line is removed. The result is only meant for log messages
 * and error reports. The statement that is executed is always the original
 * text.
 *
 * Applying it twice gives the same result as applying it once.
 *
 * @param statement The raw statement text.
 * @return The statement without comment lines and blank lines.
 */
[[nodiscard]] std::string clear_statement(std::string_view statement);
