#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quizconv::text {

std::string Trim(const std::string& value);
std::string TrimRight(const std::string& value);
std::string ToLower(std::string value);
bool StartsWith(const std::string& value, const std::string& prefix);
bool EndsWith(const std::string& value, const std::string& suffix);

// Number of leading spaces.
std::size_t IndentOf(const std::string& value);

// Splits on '\n', dropping a trailing '\r' from each line. A final newline
// does not produce an extra empty line.
std::vector<std::string> SplitLines(const std::string& content);
std::string JoinLines(const std::vector<std::string>& lines);

// Strict decimal parse: the whole trimmed string must be a finite number.
std::optional<double> ParseNumber(const std::string& value);

// Shortest decimal form that parses back to the same value ("1", "1.5", "0.01").
std::string FormatNumber(double value);

}  // namespace quizconv::text
